#ifndef LUSITANO_COMMON_HASH_HPP
#define LUSITANO_COMMON_HASH_HPP

#include "common/defs.hpp"

#include "absl/hash/hash.h"

#include <type_traits>
#include <utility>

namespace lusitano {

/// Specialize to `std::true_type` for types that implement `void hash(Hasher&) const`.
template<typename T, typename Enable = void>
struct EnableMemberHash : std::false_type {};

/// Combines hash values through abseil's hash state. Pairs are hashed member-wise so that
/// ids and names can be combined into a single key (e.g. `(function, name)` in code generation).
class Hasher final {
public:
    explicit Hasher(absl::HashState state)
        : state_(std::move(state)) {}

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    template<typename... Args>
    Hasher& append(const Args&... args) {
        (append_one(args), ...);
        return *this;
    }

private:
    template<typename T>
    void append_one(const T& value) {
        if constexpr (EnableMemberHash<T>::value) {
            value.hash(*this);
        } else {
            state_ = absl::HashState::combine(std::move(state_), value);
        }
    }

    template<typename T1, typename T2>
    void append_one(const std::pair<T1, T2>& pair) {
        append(pair.first, pair.second);
    }

private:
    absl::HashState state_;
};

namespace detail {

template<typename T>
struct HashedRef {
    const T& value;

    template<typename H>
    friend H AbslHashValue(H state, const HashedRef& ref) {
        Hasher hasher(absl::HashState::Create(&state));
        hasher.append(ref.value);
        return state;
    }
};

} // namespace detail

/// Hash function object for abseil containers keyed by lusitano types.
struct UseHasher {
    template<typename T>
    size_t operator()(const T& value) const {
        return absl::Hash<detail::HashedRef<T>>()(detail::HashedRef<T>{value});
    }
};

} // namespace lusitano

#endif // LUSITANO_COMMON_HASH_HPP
