#include "compiler/compiler.hpp"

#include "support/matchers.hpp"

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

using namespace lusitano;
using test_support::exception_matches_code;

static CompilerOptions quiet_options() {
    CompilerOptions options;
    options.header = false;
    options.call_main = false;
    return options;
}

TEST_CASE("The compiler should translate valid programs", "[compiler]") {
    Compiler compiler("teste.lus", "var x: inteiro = 25\nescreva(x)", quiet_options());
    auto result = compiler.run();

    REQUIRE(result.success);
    REQUIRE(!compiler.has_errors());
    REQUIRE(result.python);
    REQUIRE(*result.python == "x = 25\nprint(x, sep='')\n");
    REQUIRE(!result.tokens);
    REQUIRE(!result.ast);
    REQUIRE(!result.symbols);
}

TEST_CASE("The compiler should name the source file in the header", "[compiler]") {
    Compiler compiler("exemplo.lus", "escreva(1)");
    auto result = compiler.run();

    REQUIRE(result.python);
    REQUIRE(result.python->rfind("# Gerado pelo compilador lusitano a partir de exemplo.lus\n\n", 0) == 0);
}

TEST_CASE("The compiler should only run once", "[compiler]") {
    Compiler compiler("teste.lus", "escreva(1)");
    compiler.run();
    REQUIRE_THROWS_MATCHES(compiler.run(), Error, exception_matches_code(Errc::BadState));
}

TEST_CASE("The compiler should reject empty file names", "[compiler]") {
    REQUIRE_THROWS_AS(Compiler("", "escreva(1)"), Error);
}

TEST_CASE("The compiler should report invalid utf8", "[compiler]") {
    Compiler compiler("teste.lus", "var x: texto = \"a\xff\"");
    auto result = compiler.run();

    REQUIRE(!result.success);
    REQUIRE(!result.python);
    REQUIRE(compiler.diag().error_count() == 1);
    REQUIRE(compiler.diag().count(DiagnosticKind::LexicalError) == 1);

    const auto& message = *compiler.diag().messages().begin();
    REQUIRE(compiler.cursor_pos(message.range) == CursorPosition(1, 18));
}

TEST_CASE("The compiler should not generate code for syntax errors", "[compiler]") {
    Compiler compiler("teste.lus", "se (x > 10 {\n}");
    auto result = compiler.run();

    REQUIRE(!result.success);
    REQUIRE(!result.python);
    REQUIRE(compiler.diag().has_errors(Phase::Syntax));
}

TEST_CASE("The compiler should not generate code for lexical errors", "[compiler]") {
    Compiler compiler("teste.lus", "var x: inteiro = 1 @ 2");
    auto result = compiler.run();

    REQUIRE(!result.success);
    REQUIRE(!result.python);
    REQUIRE(compiler.diag().has_errors(Phase::Lexical));
}

TEST_CASE("The compiler should generate code despite semantic errors", "[compiler]") {
    Compiler compiler("teste.lus", "const PI: real = 3.14\nPI = 3", quiet_options());
    auto result = compiler.run();

    REQUIRE(!result.success);
    REQUIRE(compiler.diag().count(DiagnosticKind::ConstantReassignment) == 1);
    REQUIRE(result.python);
    REQUIRE(*result.python == "PI = 3.14\nPI = 3\n");
}

TEST_CASE("Warnings should fail the compilation but still produce code", "[compiler]") {
    Compiler compiler(
        "teste.lus", "funcao f(): inteiro {\n    se (verdadeiro) {\n        retorna 1\n    }\n}",
        quiet_options());
    auto result = compiler.run();

    REQUIRE(!result.success);
    REQUIRE(!compiler.has_errors());
    REQUIRE(compiler.diag().warning_count() == 1);
    REQUIRE(compiler.diag().count(DiagnosticKind::MissingReturn) == 1);
    REQUIRE(result.python);
}

TEST_CASE("The compiler should produce the requested attachments", "[compiler]") {
    auto options = quiet_options();
    options.keep_tokens = true;
    options.keep_ast = true;
    options.keep_symbols = true;

    Compiler compiler("teste.lus", "var x: inteiro = 1", options);
    auto result = compiler.run();
    REQUIRE(result.success);

    REQUIRE(result.tokens);
    REQUIRE_THAT(*result.tokens, Catch::Contains("KwVar"));
    REQUIRE_THAT(*result.tokens, Catch::Contains("Identifier"));
    REQUIRE_THAT(*result.tokens, Catch::Contains("Eof"));

    REQUIRE(result.ast);
    auto ast = nlohmann::json::parse(*result.ast);
    REQUIRE(ast["type"] == "Program");
    REQUIRE(ast["items"][0]["name"] == "x");

    REQUIRE(result.symbols);
    REQUIRE(*result.symbols == "Global ScopeId(0)\n  - Variable x: inteiro\n");
}

TEST_CASE("The compiler should skip analysis and generation if requested", "[compiler]") {
    auto options = quiet_options();
    options.analyze = false;
    options.keep_symbols = true;

    Compiler compiler("teste.lus", "escreva(y)", options);
    auto result = compiler.run();

    REQUIRE(result.success);
    REQUIRE(!result.python);
    REQUIRE(!result.symbols);
}
