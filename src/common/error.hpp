#ifndef LUSITANO_COMMON_ERROR_HPP
#define LUSITANO_COMMON_ERROR_HPP

#include "common/defs.hpp"
#include "lusitano/error.hpp"

#include <fmt/format.h>

#include <string>
#include <string_view>

namespace lusitano {

namespace detail {

[[noreturn]] LUSITANO_COLD void throw_error_impl(
    const SourceLocation& loc, Errc code, std::string_view format, fmt::format_args args);

} // namespace detail

/// Throws an internal error. The arguments to the macro are interpreted like in fmt::format().
#define LUSITANO_ERROR(...) \
    (::lusitano::throw_error(LUSITANO_SOURCE_LOCATION(), ::lusitano::Errc::Internal, __VA_ARGS__))

/// Throws an error with the given code. The arguments to the macro are interpreted like in fmt::format().
#define LUSITANO_ERROR_WITH_CODE(code, ...) \
    (::lusitano::throw_error(LUSITANO_SOURCE_LOCATION(), (code), __VA_ARGS__))

/// Evaluates a condition and, if the condition evaluates to false, throws an internal error.
/// All other arguments are passed to LUSITANO_ERROR().
#define LUSITANO_CHECK(cond, ...)         \
    do {                                  \
        if (LUSITANO_UNLIKELY(!(cond))) { \
            LUSITANO_ERROR(__VA_ARGS__);  \
        }                                 \
    } while (0)

/// Throws an error with the provided source location.
template<typename... Args>
[[noreturn]] inline void
throw_error(const SourceLocation& loc, Errc code, std::string_view format, const Args&... args) {
    detail::throw_error_impl(loc, code, format, fmt::make_format_args(args...));
}

} // namespace lusitano

#endif // LUSITANO_COMMON_ERROR_HPP
