#include "compiler/diagnostics.hpp"

#include <catch2/catch.hpp>

#include <fmt/format.h>

#include <vector>

// SourceRange has begin()/end() accessors, which makes Catch treat it as a range.
template<>
struct Catch::StringMaker<lusitano::SourceRange> {
    static std::string convert(const lusitano::SourceRange& range) {
        return fmt::format("{}", range);
    }
};

using namespace lusitano;

TEST_CASE("Diagnostics should start empty", "[diagnostics]") {
    Diagnostics diag;
    REQUIRE(!diag.has_errors());
    REQUIRE(diag.error_count() == 0);
    REQUIRE(diag.warning_count() == 0);
    REQUIRE(diag.message_count() == 0);
    REQUIRE(diag.messages().begin() == diag.messages().end());
}

TEST_CASE("Diagnostics should derive level and phase from the message kind", "[diagnostics]") {
    Diagnostics diag;
    diag.report(DiagnosticKind::LexicalError, SourceRange(0, 1), "lexical");
    diag.report(DiagnosticKind::InvalidAssignmentTarget, SourceRange(1, 2), "syntax");
    diag.report(DiagnosticKind::TypeMismatch, SourceRange(2, 3), "semantic");
    diag.report(DiagnosticKind::MissingReturn, SourceRange(3, 4), "warning");

    REQUIRE(diag.has_errors());
    REQUIRE(diag.error_count() == 3);
    REQUIRE(diag.warning_count() == 1);
    REQUIRE(diag.message_count() == 4);

    std::vector<Diagnostics::Message> messages(diag.messages().begin(), diag.messages().end());
    REQUIRE(messages.size() == 4);

    REQUIRE(messages[0].phase == Phase::Lexical);
    REQUIRE(messages[0].level == Diagnostics::Error);
    REQUIRE(messages[0].text == "lexical");

    REQUIRE(messages[1].phase == Phase::Syntax);
    REQUIRE(messages[1].level == Diagnostics::Error);

    REQUIRE(messages[2].phase == Phase::Semantic);
    REQUIRE(messages[2].range == SourceRange(2, 3));

    REQUIRE(messages[3].phase == Phase::Semantic);
    REQUIRE(messages[3].level == Diagnostics::Warning);
}

TEST_CASE("Warnings should not count as errors", "[diagnostics]") {
    Diagnostics diag;
    diag.report(DiagnosticKind::MissingReturn, SourceRange(0, 5), "no return");

    REQUIRE(!diag.has_errors());
    REQUIRE(!diag.has_errors(Phase::Semantic));
    REQUIRE(diag.warning_count() == 1);
}

TEST_CASE("Diagnostics should report errors per phase", "[diagnostics]") {
    Diagnostics diag;
    diag.report(DiagnosticKind::SyntaxError, SourceRange(0, 1), "bad");

    REQUIRE(!diag.has_errors(Phase::Lexical));
    REQUIRE(diag.has_errors(Phase::Syntax));
    REQUIRE(!diag.has_errors(Phase::Semantic));
}

TEST_CASE("Diagnostics should count messages by kind", "[diagnostics]") {
    Diagnostics diag;
    diag.report(DiagnosticKind::UndeclaredIdentifier, SourceRange(0, 1), "a");
    diag.report(DiagnosticKind::UndeclaredIdentifier, SourceRange(2, 3), "b");
    diag.report(DiagnosticKind::NotCallable, SourceRange(4, 5), "c");

    REQUIRE(diag.count(DiagnosticKind::UndeclaredIdentifier) == 2);
    REQUIRE(diag.count(DiagnosticKind::NotCallable) == 1);
    REQUIRE(diag.count(DiagnosticKind::TypeMismatch) == 0);
}

TEST_CASE("Diagnostics should format messages", "[diagnostics]") {
    Diagnostics diag;
    diag.reportf(DiagnosticKind::UndeclaredIdentifier, SourceRange(0, 1),
        "Undeclared identifier '{}'.", "y");

    const auto& message = *diag.messages().begin();
    REQUIRE(message.text == "Undeclared identifier 'y'.");
    REQUIRE(message.expected.empty());
    REQUIRE(message.found.empty());
}

TEST_CASE("Diagnostics should store expected and found tokens", "[diagnostics]") {
    Diagnostics diag;
    diag.report_unexpected(DiagnosticKind::SyntaxError, SourceRange(4, 5),
        "Unexpected '{', expected ')'.", "')'", "'{'");

    const auto& message = *diag.messages().begin();
    REQUIRE(message.kind == DiagnosticKind::SyntaxError);
    REQUIRE(message.phase == Phase::Syntax);
    REQUIRE(message.expected == "')'");
    REQUIRE(message.found == "'{'");
}

TEST_CASE("Diagnostic enums should be convertible to strings", "[diagnostics]") {
    REQUIRE(to_string(Phase::Lexical) == "lexical");
    REQUIRE(to_string(Phase::Syntax) == "syntax");
    REQUIRE(to_string(Phase::Semantic) == "semantic");

    REQUIRE(to_string(Diagnostics::Error) == "error");
    REQUIRE(to_string(Diagnostics::Warning) == "warning");

    REQUIRE(to_string(DiagnosticKind::ConstantReassignment) == "ConstantReassignment");
    REQUIRE(fmt::format("{}", DiagnosticKind::MissingReturn) == "MissingReturn");
}

TEST_CASE("Every diagnostic kind should belong to a phase", "[diagnostics]") {
    REQUIRE(phase_of(DiagnosticKind::LexicalError) == Phase::Lexical);
    REQUIRE(phase_of(DiagnosticKind::SyntaxError) == Phase::Syntax);
    REQUIRE(phase_of(DiagnosticKind::InvalidAssignmentTarget) == Phase::Syntax);

    for (auto kind : {DiagnosticKind::DuplicateDeclaration, DiagnosticKind::UndeclaredIdentifier,
             DiagnosticKind::TypeMismatch, DiagnosticKind::ConstantReassignment,
             DiagnosticKind::ReturnTypeMismatch, DiagnosticKind::ArgumentCountMismatch,
             DiagnosticKind::NotCallable, DiagnosticKind::ReturnOutsideFunction,
             DiagnosticKind::InvalidType, DiagnosticKind::MissingReturn}) {
        CAPTURE(to_string(kind));
        REQUIRE(phase_of(kind) == Phase::Semantic);
    }
}
