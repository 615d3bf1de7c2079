#ifndef LUSITANO_COMPILER_RESET_VALUE_HPP
#define LUSITANO_COMPILER_RESET_VALUE_HPP

#include <memory>
#include <type_traits>
#include <utility>

namespace lusitano {

/// Restores the previous value of a variable when it goes out of scope.
/// Used by the tree walkers to track the innermost enclosing function.
template<typename T>
class [[nodiscard]] ResetValue final {
public:
    ResetValue(T& location, T old)
        : location_(std::addressof(location))
        , old_(std::move(old)) {}

    ~ResetValue() {
        if (location_)
            *location_ = std::move(old_);
    }

    ResetValue(ResetValue&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : location_(std::exchange(other.location_, nullptr))
        , old_(std::move(other.old_)) {}

    ResetValue(const ResetValue&) = delete;
    ResetValue& operator=(const ResetValue&) = delete;

private:
    T* location_ = nullptr; // nullptr -> moved from
    T old_;
};

/// Assigns `new_value` to `location` and returns an object that restores the old value.
template<typename T, typename U>
ResetValue<T> replace_value(T& location, U&& new_value) {
    return ResetValue<T>(location, std::exchange(location, std::forward<U>(new_value)));
}

} // namespace lusitano

#endif // LUSITANO_COMPILER_RESET_VALUE_HPP
