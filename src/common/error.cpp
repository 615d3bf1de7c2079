#include "common/error.hpp"

#include <iterator>

namespace lusitano {

namespace detail {

void throw_error_impl([[maybe_unused]] const SourceLocation& loc, Errc code,
    std::string_view format, fmt::format_args args) {

    fmt::memory_buffer buf;

#ifdef LUSITANO_DEBUG
    fmt::format_to(
        std::back_inserter(buf), "Error in {} ({}:{}): ", loc.function, loc.file, loc.line);
#endif

    fmt::vformat_to(std::back_inserter(buf), format, args);
    throw Error(code, fmt::to_string(buf));
}

} // namespace detail

const char* errc_name(Errc e) {
    switch (e) {
#define LUSITANO_ERRC_NAME(X) \
    case Errc::X:             \
        return #X;

        LUSITANO_ERRC_NAME(Ok)
        LUSITANO_ERRC_NAME(BadState)
        LUSITANO_ERRC_NAME(BadArg)
        LUSITANO_ERRC_NAME(Internal)

#undef LUSITANO_ERRC_NAME
    }
    return "<invalid error code>";
}

const char* errc_message(Errc e) {
    switch (e) {
    case Errc::Ok:
        return "No error.";
    case Errc::BadState:
        return "The instance is not in a valid state for this operation.";
    case Errc::BadArg:
        return "Invalid argument.";
    case Errc::Internal:
        return "Internal error.";
    }
    return "<invalid error code>";
}

Error::Error(Errc code, std::string message)
    : code_(code)
    , message_(std::move(message)) {}

Error::~Error() {}

Errc Error::code() const noexcept {
    return code_;
}

const char* Error::what() const noexcept {
    return message_.c_str();
}

} // namespace lusitano
