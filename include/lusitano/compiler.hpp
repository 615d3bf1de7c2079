#ifndef LUSITANO_COMPILER_HPP_INCLUDED
#define LUSITANO_COMPILER_HPP_INCLUDED

/**
 * \file
 * \brief Contains the public interface for compiling lusitano source code to python.
 */

#include "lusitano/error.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lusitano::api {

/// The compilation phase that produced a message.
enum class Phase {
    Lexical = 1,
    Syntax = 2,
    Semantic = 3,
};

/// Returns the (lower case) name of the phase.
/// The returned string is allocated in static storage.
const char* phase_str(Phase phase);

/// Defines the possible values for the severity of diagnostic compiler messages.
enum class Severity {
    /// A compiler warning
    Warning = 1,

    /// A compiler error (compilation fails)
    Error = 2,
};

/// Returns the string representation of the given severity value.
/// The returned string is allocated in static storage.
const char* severity_str(Severity severity);

/// Defines the possible attachments that can be emitted by the compiler.
enum class Attachment {
    /// The token list
    Tokens = 1,

    /// Abstract syntax tree (json)
    Ast = 2,

    /// Scopes and symbols
    Symbols = 3,
};

/// Represents a diagnostic message emitted by the compiler.
struct CompilerMessage {
    Phase phase = Phase::Semantic;
    Severity severity = Severity::Error;

    /// The kind of the message, e.g. "UndeclaredIdentifier".
    std::string kind;

    /// The source file name.
    std::string file;

    /// Source line (1 based). Zero if unavailable.
    uint32_t line = 0;

    /// Source column (1 based). Zero if unavailable.
    uint32_t column = 0;

    /// The message text.
    std::string text;

    /// Description of the expected and the actual token (syntax errors only, may be empty).
    std::string expected;
    std::string found;
};

/// Will be invoked for every diagnostic message emitted by the compiler, in order.
using MessageCallback = std::function<void(const CompilerMessage& message)>;

/// The compiler instance translates a single source file into a python program.
/// An instance can only be run once.
class Compiler final {
public:
    /// Constructs a compiler for the given file. Throws `Errc::BadArg` if the file name is empty.
    explicit Compiler(std::string file_name, std::string source);
    ~Compiler();

    Compiler(Compiler&& other) noexcept;
    Compiler& operator=(Compiler&& other) noexcept;

    /// Sets the callback function that will be invoked for every diagnostic message.
    /// The callback will only be invoked from `run()`.
    void set_message_callback(MessageCallback callback);

    /// Requests generation of the given attachment when the compiler runs.
    void request_attachment(Attachment attachment);

    /// Enables or disables the header comment at the top of the generated code (default: enabled).
    void emit_header(bool enabled);

    /// Enables or disables the `principal()` call at the end of the generated code (default: enabled).
    void call_main(bool enabled);

    /// Runs the compiler. Diagnostic messages are collected and passed to the message callback.
    /// Throws `Errc::BadState` if the compiler already ran.
    void run();

    /// Returns true if the compiler ran without errors.
    bool success() const;

    /// Returns all messages emitted by the compiler.
    const std::vector<CompilerMessage>& messages() const;

    /// Returns true if python code was generated. Code is generated even if there are
    /// semantic errors, but not if the program contains lexical or syntax errors.
    bool has_code() const;

    /// Returns the generated python code. Throws `Errc::BadState` if there is none.
    const std::string& code() const;

    /// Returns the requested attachment, or an empty optional if it is not available.
    std::optional<std::string> attachment(Attachment attachment) const;

private:
    struct Impl;

    Impl& impl() const;

private:
    std::unique_ptr<Impl> impl_;
};

/// Settings for the `compile()` function.
struct CompileSettings {
    bool emit_header = true;
    bool call_main = true;
    std::vector<Attachment> attachments;
    MessageCallback message_callback;
};

/// The results of a call to `compile()`.
struct CompileResult {
    bool success = false;
    std::vector<CompilerMessage> messages;
    std::optional<std::string> code;
    std::optional<std::string> tokens;
    std::optional<std::string> ast;
    std::optional<std::string> symbols;
};

/// Compiles the given source code in one step.
CompileResult
compile(std::string file_name, std::string source, const CompileSettings& settings = {});

} // namespace lusitano::api

#endif // LUSITANO_COMPILER_HPP_INCLUDED
