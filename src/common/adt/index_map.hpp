#ifndef LUSITANO_COMMON_ADT_INDEX_MAP_HPP
#define LUSITANO_COMMON_ADT_INDEX_MAP_HPP

#include "common/assert.hpp"
#include "common/defs.hpp"

#include <utility>
#include <vector>

namespace lusitano {

/// Append-only storage for values that are addressed by typed keys (usually entity ids).
/// The n-th inserted value receives the key `mapper.to_value(n)`. Values are never removed.
template<typename Value, typename Mapper>
class IndexMap final {
public:
    using KeyType = typename Mapper::ValueType;

    explicit IndexMap(Mapper mapper = Mapper())
        : mapper_(std::move(mapper)) {}

    size_t size() const { return values_.size(); }

    /// True if `key` refers to an inserted value.
    bool in_bounds(const KeyType& key) const { return mapper_.to_index(key) < values_.size(); }

    Value& operator[](const KeyType& key) {
        LUSITANO_DEBUG_ASSERT(in_bounds(key), "Key is out of bounds.");
        return values_[mapper_.to_index(key)];
    }

    const Value& operator[](const KeyType& key) const {
        LUSITANO_DEBUG_ASSERT(in_bounds(key), "Key is out of bounds.");
        return values_[mapper_.to_index(key)];
    }

    /// Inserts the value and returns its key.
    template<typename V>
    KeyType push_back(V&& value) {
        auto key = mapper_.to_value(values_.size());
        values_.push_back(std::forward<V>(value));
        return key;
    }

private:
    Mapper mapper_;
    std::vector<Value> values_;
};

} // namespace lusitano

#endif // LUSITANO_COMMON_ADT_INDEX_MAP_HPP
