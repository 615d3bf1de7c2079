#include "compiler/diagnostics.hpp"

#include "common/assert.hpp"

#include <algorithm>

namespace lusitano {

static Diagnostics::Level level_of(DiagnosticKind kind) {
    return kind == DiagnosticKind::MissingReturn ? Diagnostics::Warning : Diagnostics::Error;
}

std::string_view to_string(Phase phase) {
    switch (phase) {
    case Phase::Lexical:
        return "lexical";
    case Phase::Syntax:
        return "syntax";
    case Phase::Semantic:
        return "semantic";
    }
    LUSITANO_UNREACHABLE("Invalid phase.");
}

std::string_view to_string(DiagnosticKind kind) {
    switch (kind) {
#define LUSITANO_CASE(X)     \
    case DiagnosticKind::X: \
        return #X;

        LUSITANO_CASE(LexicalError)
        LUSITANO_CASE(SyntaxError)
        LUSITANO_CASE(InvalidAssignmentTarget)
        LUSITANO_CASE(DuplicateDeclaration)
        LUSITANO_CASE(UndeclaredIdentifier)
        LUSITANO_CASE(TypeMismatch)
        LUSITANO_CASE(ConstantReassignment)
        LUSITANO_CASE(ReturnTypeMismatch)
        LUSITANO_CASE(ArgumentCountMismatch)
        LUSITANO_CASE(NotCallable)
        LUSITANO_CASE(ReturnOutsideFunction)
        LUSITANO_CASE(InvalidType)
        LUSITANO_CASE(MissingReturn)

#undef LUSITANO_CASE
    }
    LUSITANO_UNREACHABLE("Invalid diagnostic kind.");
}

Phase phase_of(DiagnosticKind kind) {
    switch (kind) {
    case DiagnosticKind::LexicalError:
        return Phase::Lexical;
    case DiagnosticKind::SyntaxError:
    case DiagnosticKind::InvalidAssignmentTarget:
        return Phase::Syntax;
    default:
        return Phase::Semantic;
    }
}

bool Diagnostics::has_errors(Phase phase) const {
    return std::any_of(messages_.begin(), messages_.end(), [&](const Message& msg) {
        return msg.level == Error && msg.phase == phase;
    });
}

size_t Diagnostics::count(DiagnosticKind kind) const {
    return static_cast<size_t>(std::count_if(messages_.begin(), messages_.end(),
        [&](const Message& msg) { return msg.kind == kind; }));
}

void Diagnostics::report(DiagnosticKind kind, const SourceRange& range, std::string text) {
    add(Message(level_of(kind), kind, range, std::move(text)));
}

void Diagnostics::report_unexpected(DiagnosticKind kind, const SourceRange& range,
    std::string text, std::string expected, std::string found) {
    Message msg(level_of(kind), kind, range, std::move(text));
    msg.expected = std::move(expected);
    msg.found = std::move(found);
    add(std::move(msg));
}

void Diagnostics::vreport(DiagnosticKind kind, const SourceRange& range,
    std::string_view format_string, fmt::format_args format_args) {
    report(kind, range, fmt::vformat(format_string, format_args));
}

void Diagnostics::add(Message&& message) {
    if (message.level == Error) {
        errors_++;
    } else {
        warnings_++;
    }
    messages_.push_back(std::move(message));
}

std::string_view to_string(Diagnostics::Level level) {
    switch (level) {
    case Diagnostics::Level::Warning:
        return "warning";
    case Diagnostics::Level::Error:
        return "error";
    }

    LUSITANO_UNREACHABLE("Invalid message level.");
}

} // namespace lusitano
