#include "common/assert.hpp"

#include "common/error.hpp"

#include <fmt/format.h>

#include <cstring>
#include <iterator>

namespace lusitano {

/// Thrown on assertion failure. Most assertions are disabled in release builds.
class AssertionFailure final : public virtual Error {
public:
    explicit AssertionFailure(std::string message);
};

AssertionFailure::AssertionFailure(std::string message)
    : Error(Errc::Internal, std::move(message)) {}

namespace detail {

void assert_fail(
    [[maybe_unused]] const SourceLocation& loc, const char* condition, const char* message) {

    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "Assertion `{}` failed", condition);
    if (message && std::strlen(message) > 0) {
        fmt::format_to(std::back_inserter(buf), ": {}", message);
    }

#ifdef LUSITANO_DEBUG
    fmt::format_to(std::back_inserter(buf), "\n    (in {}:{})", loc.file, loc.line);
#endif

    throw AssertionFailure(fmt::to_string(buf));
}

void unreachable([[maybe_unused]] const SourceLocation& loc, const char* message) {
    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "Unreachable code executed");
    if (message && std::strlen(message) > 0) {
        fmt::format_to(std::back_inserter(buf), ": {}", message);
    }

#ifdef LUSITANO_DEBUG
    fmt::format_to(std::back_inserter(buf), "\n    (in {}:{})", loc.file, loc.line);
#endif

    throw AssertionFailure(fmt::to_string(buf));
}

} // namespace detail
} // namespace lusitano
