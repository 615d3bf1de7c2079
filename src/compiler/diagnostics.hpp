#ifndef LUSITANO_COMPILER_DIAGNOSTICS_HPP
#define LUSITANO_COMPILER_DIAGNOSTICS_HPP

#include "common/format.hpp"
#include "common/iter_tools.hpp"
#include "compiler/source_range.hpp"

#include <string>
#include <vector>

namespace lusitano {

/// The compilation phase that produced a diagnostic message.
enum class Phase { Lexical, Syntax, Semantic };

std::string_view to_string(Phase phase);

/// Classifies diagnostic messages. Every kind belongs to exactly one phase.
enum class DiagnosticKind {
    LexicalError,
    SyntaxError,
    InvalidAssignmentTarget,
    DuplicateDeclaration,
    UndeclaredIdentifier,
    TypeMismatch,
    ConstantReassignment,
    ReturnTypeMismatch,
    ArgumentCountMismatch,
    NotCallable,
    ReturnOutsideFunction,
    InvalidType,
    MissingReturn,
};

std::string_view to_string(DiagnosticKind kind);

/// Returns the phase that reports messages of the given kind.
Phase phase_of(DiagnosticKind kind);

/// Gathers compile time warnings and errors.
class Diagnostics final {
public:
    enum class Level { Error, Warning };

    static constexpr Level Error = Level::Error;
    static constexpr Level Warning = Level::Warning;

    struct Message {
        Phase phase = Phase::Semantic;
        Level level = Error;
        DiagnosticKind kind = DiagnosticKind::SyntaxError;
        SourceRange range;
        std::string text;

        // Only set for unexpected token messages.
        std::string expected;
        std::string found;

        Message() = default;

        Message(Level level_, DiagnosticKind kind_, const SourceRange& range_, std::string text_)
            : phase(phase_of(kind_))
            , level(level_)
            , kind(kind_)
            , range(range_)
            , text(std::move(text_)) {}
    };

public:
    /// True iff one or more errors have been reported through this instance.
    bool has_errors() const { return errors_ > 0; }

    /// True iff one or more errors of the given phase have been reported.
    bool has_errors(Phase phase) const;

    /// Number of error messages.
    size_t error_count() const { return errors_; }

    /// Number of warning messages.
    size_t warning_count() const { return warnings_; }

    /// Total number of messages.
    size_t message_count() const { return messages_.size(); }

    /// Number of messages of the given kind.
    size_t count(DiagnosticKind kind) const;

    /// Iterable ranges over all messages (in insertion order).
    auto messages() const { return IterRange(messages_.cbegin(), messages_.cend()); }

    /// Report a message at the given source text location. The severity
    /// is derived from the kind of the message.
    void report(DiagnosticKind kind, const SourceRange& range, std::string text);

    /// Report an unexpected token. `expected` and `found` are human readable descriptions.
    void report_unexpected(DiagnosticKind kind, const SourceRange& range, std::string text,
        std::string expected, std::string found);

    void vreport(DiagnosticKind kind, const SourceRange& range, std::string_view format_string,
        fmt::format_args format_args);

    /// Report a message at the given source text location, with fmt::format syntax.
    template<typename... Args>
    void reportf(DiagnosticKind kind, const SourceRange& range, std::string_view format_string,
        const Args&... format_args) {
        vreport(kind, range, format_string, fmt::make_format_args(format_args...));
    }

private:
    void add(Message&& message);

private:
    size_t errors_ = 0;
    size_t warnings_ = 0;
    std::vector<Message> messages_;
};

std::string_view to_string(Diagnostics::Level level);

} // namespace lusitano

LUSITANO_ENABLE_FREE_TO_STRING(lusitano::Phase)
LUSITANO_ENABLE_FREE_TO_STRING(lusitano::DiagnosticKind)
LUSITANO_ENABLE_FREE_TO_STRING(lusitano::Diagnostics::Level)

#endif // LUSITANO_COMPILER_DIAGNOSTICS_HPP
