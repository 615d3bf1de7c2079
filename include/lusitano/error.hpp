#ifndef LUSITANO_ERROR_HPP_INCLUDED
#define LUSITANO_ERROR_HPP_INCLUDED

#include <exception>
#include <string>

namespace lusitano {

/// Defines all possible error codes.
enum class Errc : int {
    /// Success
    Ok = 0,

    /// Instance is not in the correct state
    BadState = 1,

    /// Invalid argument
    BadArg = 2,

    /// Internal error
    Internal = 1000,
};

/// Returns the name of the given error code.
/// The returned string is allocated in static storage.
const char* errc_name(Errc e);

/// Returns a human readable description of the given error code.
/// The returned string is allocated in static storage.
const char* errc_message(Errc e);

/// Error class thrown by the library when a fatal internal error occurs.
///
/// Normal (expected) errors in the compiled program, like syntax errors or type errors,
/// are never thrown. They are reported as diagnostic messages instead.
class Error : public virtual std::exception {
public:
    explicit Error(Errc code, std::string message);
    virtual ~Error();

    Errc code() const noexcept;
    virtual const char* what() const noexcept;

private:
    Errc code_;
    std::string message_;
};

} // namespace lusitano

#endif // LUSITANO_ERROR_HPP_INCLUDED
