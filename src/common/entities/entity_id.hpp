#ifndef LUSITANO_COMMON_ENTITIES_ENTITY_ID_HPP
#define LUSITANO_COMMON_ENTITIES_ENTITY_ID_HPP

#include "common/assert.hpp"
#include "common/defs.hpp"
#include "common/format.hpp"
#include "common/hash.hpp"

#include <limits>
#include <type_traits>

namespace lusitano {

struct EntityIdBase {};

/// This class is a type safe wrapper that represents a unique entity id.
/// It is based around a simple underlying integral type.
/// Even though it is just a wrapper, it helps with compile time safety because
/// it makes it impossible to confuse to what type an id belongs to.
///
/// The value `-1`, casted to the underlying type, is used as an invalid value.
template<typename Underlying, typename Derived>
class EntityId : public EntityIdBase {
public:
    using UnderlyingType = Underlying;

    /// The invalid underlying value.
    static constexpr Underlying invalid_value = Underlying(-1);

    /// Constructs an invalid id.
    constexpr EntityId() = default;

    /// Constructs an id that wraps the provided underlying value.
    constexpr explicit EntityId(const Underlying& value)
        : value_(value) {}

    constexpr bool valid() const noexcept { return value_ != invalid_value; }
    constexpr explicit operator bool() const noexcept { return valid(); }

    constexpr const Underlying& value() const noexcept { return value_; }

#define LUSITANO_COMPARE_IMPL(op)                                               \
    friend constexpr bool operator op(const Derived& lhs, const Derived& rhs) { \
        return lhs.value() op rhs.value();                                      \
    }

    LUSITANO_COMPARE_IMPL(==)
    LUSITANO_COMPARE_IMPL(!=)

#undef LUSITANO_COMPARE_IMPL

    void hash(Hasher& h) const { h.append(value_); }

protected:
    void format_name(std::string_view type_name, FormatStream& stream) const {
        if (!valid()) {
            stream.format("{}(invalid)", type_name);
            return;
        }
        stream.format("{}({})", type_name, value());
    }

private:
    Underlying value_ = invalid_value;
};

#define LUSITANO_DEFINE_ENTITY_ID(Name, Underlying)                                  \
    class Name final : public ::lusitano::EntityId<Underlying, Name> {               \
    public:                                                                          \
        using EntityId::EntityId;                                                    \
                                                                                     \
        void format(::lusitano::FormatStream& stream) const {                        \
            return EntityId::format_name(#Name, stream);                             \
        }                                                                            \
    };

/// Maps entity ids to vector indices and back. Used as the mapper
/// for index maps that are keyed by entity ids.
template<typename Id>
struct IdMapper {
    using ValueType = Id;
    using IndexType = typename Id::UnderlyingType;

    size_t to_index(const Id& id) const {
        LUSITANO_DEBUG_ASSERT(id.valid(), "Invalid id.");
        return id.value();
    }

    Id to_value(size_t index) const {
        LUSITANO_DEBUG_ASSERT(index < Id::invalid_value, "Index is too large for the id type.");
        return Id(static_cast<IndexType>(index));
    }
};

} // namespace lusitano

template<typename T>
struct lusitano::EnableMemberHash<T, std::enable_if_t<std::is_base_of_v<lusitano::EntityIdBase, T>>>
    : std::true_type {};

template<typename T>
struct lusitano::EnableFormatMode<T,
    std::enable_if_t<std::is_base_of_v<lusitano::EntityIdBase, T>>> {
    static constexpr lusitano::FormatMode value = lusitano::FormatMode::MemberFormat;
};

#endif // LUSITANO_COMMON_ENTITIES_ENTITY_ID_HPP
