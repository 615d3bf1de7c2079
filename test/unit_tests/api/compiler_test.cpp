#include <catch2/catch.hpp>

#include "lusitano/compiler.hpp"

#include "support/matchers.hpp"

#include <string>
#include <vector>

using namespace lusitano;
using test_support::exception_matches_code;

TEST_CASE("Phase and severity names should be available", "[api]") {
    REQUIRE(std::string(api::phase_str(api::Phase::Lexical)) == "lexical");
    REQUIRE(std::string(api::phase_str(api::Phase::Syntax)) == "syntax");
    REQUIRE(std::string(api::phase_str(api::Phase::Semantic)) == "semantic");

    REQUIRE(std::string(api::severity_str(api::Severity::Warning)) == "WARNING");
    REQUIRE(std::string(api::severity_str(api::Severity::Error)) == "ERROR");
}

TEST_CASE("Error codes should have names", "[api]") {
    REQUIRE(std::string(errc_name(Errc::BadState)) == "BadState");
    REQUIRE(std::string(errc_name(Errc::BadArg)) == "BadArg");
    REQUIRE(std::string(errc_message(Errc::Ok)).size() > 0);
}

TEST_CASE("The compiler should reject empty file names", "[api]") {
    REQUIRE_THROWS_MATCHES(
        api::Compiler("", "escreva(1)"), Error, exception_matches_code(Errc::BadArg));
}

TEST_CASE("The compiler should generate python code", "[api]") {
    api::Compiler compiler("teste.lus", "var x: inteiro = 25\nescreva(x)");
    compiler.emit_header(false);
    compiler.run();

    REQUIRE(compiler.success());
    REQUIRE(compiler.messages().empty());
    REQUIRE(compiler.has_code());
    REQUIRE(compiler.code() == "x = 25\nprint(x, sep='')\n");
}

TEST_CASE("The compiler should only run once", "[api]") {
    api::Compiler compiler("teste.lus", "escreva(1)");
    compiler.run();

    REQUIRE_THROWS_MATCHES(compiler.run(), Error, exception_matches_code(Errc::BadState));
    REQUIRE_THROWS_MATCHES(compiler.request_attachment(api::Attachment::Ast), Error,
        exception_matches_code(Errc::BadState));
    REQUIRE_THROWS_MATCHES(compiler.set_message_callback({}), Error,
        exception_matches_code(Errc::BadState));
}

TEST_CASE("The compiler should throw if no code is available", "[api]") {
    api::Compiler compiler("teste.lus", "escreva(");

    SECTION("Before running") {
        REQUIRE(!compiler.has_code());
        REQUIRE_THROWS_MATCHES(compiler.code(), Error, exception_matches_code(Errc::BadState));
    }

    SECTION("After syntax errors") {
        compiler.run();
        REQUIRE(!compiler.success());
        REQUIRE(!compiler.has_code());
        REQUIRE_THROWS_MATCHES(compiler.code(), Error, exception_matches_code(Errc::BadState));
    }
}

TEST_CASE("The compiler should report messages in order", "[api]") {
    api::Compiler compiler("erros.lus", "var x: inteiro = \"a\"\nescreva(y)\n");

    std::vector<api::CompilerMessage> received;
    compiler.set_message_callback(
        [&](const api::CompilerMessage& message) { received.push_back(message); });
    compiler.run();

    REQUIRE(!compiler.success());
    REQUIRE(received.size() == 2);
    REQUIRE(compiler.messages().size() == 2);

    const auto& first = received[0];
    REQUIRE(first.phase == api::Phase::Semantic);
    REQUIRE(first.severity == api::Severity::Error);
    REQUIRE(first.kind == "TypeMismatch");
    REQUIRE(first.file == "erros.lus");
    REQUIRE(first.line == 1);

    const auto& second = received[1];
    REQUIRE(second.kind == "UndeclaredIdentifier");
    REQUIRE(second.line == 2);
    REQUIRE(second.column == 9);
    REQUIRE(second.text == "Undeclared identifier 'y'.");

    // Semantic errors do not prevent code generation.
    REQUIRE(compiler.has_code());
}

TEST_CASE("The compiler should report expected and found tokens", "[api]") {
    api::Compiler compiler("teste.lus", "se (x > 10 {\n}");
    compiler.run();

    REQUIRE(compiler.messages().size() >= 1);
    const auto& message = compiler.messages()[0];
    REQUIRE(message.phase == api::Phase::Syntax);
    REQUIRE(message.kind == "SyntaxError");
    REQUIRE(message.expected == "')'");
    REQUIRE(message.found == "'{'");
    REQUIRE(message.line == 1);
    REQUIRE(message.column == 12);
}

TEST_CASE("The compiler should fail on warnings", "[api]") {
    api::Compiler compiler("teste.lus", "funcao f(): inteiro {\n}");
    compiler.run();

    REQUIRE(!compiler.success());
    REQUIRE(compiler.has_code());
    REQUIRE(compiler.messages().size() == 1);
    REQUIRE(compiler.messages()[0].severity == api::Severity::Warning);
    REQUIRE(compiler.messages()[0].kind == "MissingReturn");
}

TEST_CASE("The compiler should return requested attachments", "[api]") {
    api::Compiler compiler("teste.lus", "var x: inteiro = 1");
    compiler.request_attachment(api::Attachment::Symbols);
    compiler.request_attachment(api::Attachment::Tokens);

    REQUIRE(!compiler.attachment(api::Attachment::Symbols));
    compiler.run();

    REQUIRE(compiler.attachment(api::Attachment::Symbols));
    REQUIRE(compiler.attachment(api::Attachment::Tokens));
    REQUIRE(!compiler.attachment(api::Attachment::Ast));
}

TEST_CASE("The compile function should run the compiler in one step", "[api]") {
    api::CompileSettings settings;
    settings.emit_header = false;
    settings.attachments.push_back(api::Attachment::Ast);

    size_t callbacks = 0;
    settings.message_callback = [&](const api::CompilerMessage&) { ++callbacks; };

    auto result = api::compile("teste.lus", "funcao principal() {\n    escreva(\"ola\")\n}", settings);
    REQUIRE(result.success);
    REQUIRE(result.messages.empty());
    REQUIRE(callbacks == 0);
    REQUIRE(result.code);
    REQUIRE(*result.code
            == "def principal():\n"
               "    print('ola', sep='')\n"
               "\n"
               "\n"
               "if __name__ == '__main__':\n"
               "    principal()\n");
    REQUIRE(result.ast);
    REQUIRE(!result.tokens);
    REQUIRE(!result.symbols);
}

TEST_CASE("Moved from compilers should throw", "[api]") {
    api::Compiler compiler("teste.lus", "escreva(1)");
    api::Compiler other(std::move(compiler));
    other.run();

    REQUIRE(other.success());
    REQUIRE_THROWS_MATCHES(compiler.run(), Error, exception_matches_code(Errc::BadState));
}
