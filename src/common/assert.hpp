#ifndef LUSITANO_COMMON_ASSERT_HPP
#define LUSITANO_COMMON_ASSERT_HPP

#include "common/defs.hpp"

namespace lusitano {

namespace detail {

[[noreturn]] LUSITANO_COLD void
assert_fail(const SourceLocation& loc, const char* cond, const char* message);

[[noreturn]] LUSITANO_COLD void
unreachable(const SourceLocation& loc, const char* message);

} // namespace detail

#ifdef LUSITANO_DEBUG

/// When in debug mode, check against the given condition
/// and throw an AssertionFailure with a message if the check fails.
/// Does nothing in release mode.
#    define LUSITANO_DEBUG_ASSERT(cond, message)                            \
        do {                                                                \
            if (LUSITANO_UNLIKELY(!(cond))) {                               \
                [loc = LUSITANO_SOURCE_LOCATION()] {                        \
                    ::lusitano::detail::assert_fail(loc, #cond, (message)); \
                }();                                                        \
            }                                                               \
        } while (0)

/// Unconditionally fail when unreachable code is executed.
#    define LUSITANO_UNREACHABLE(message) \
        (::lusitano::detail::unreachable(LUSITANO_SOURCE_LOCATION(), (message)))

#else
#    define LUSITANO_DEBUG_ASSERT(cond, message)
#    define LUSITANO_UNREACHABLE(message) \
        (::lusitano::detail::unreachable(LUSITANO_SOURCE_LOCATION(), nullptr))
#endif

} // namespace lusitano

#endif // LUSITANO_COMMON_ASSERT_HPP
