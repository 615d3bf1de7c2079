#include "support/test_compiler.hpp"

#include <catch2/catch.hpp>

using namespace lusitano;
using test_support::TestProgram;

static void require_clean(TestProgram& prog) {
    CAPTURE(prog.report());
    REQUIRE(prog.diag().message_count() == 0);
}

static void require_single(TestProgram& prog, DiagnosticKind kind) {
    CAPTURE(prog.report());
    REQUIRE(prog.diag().error_count() == 1);
    REQUIRE(prog.count(kind) == 1);
}

TEST_CASE("Analyzer should accept a simple well typed program", "[analyzer]") {
    TestProgram prog("var x: inteiro = 25\nescreva(x)");
    require_clean(prog);

    const auto& print = prog.item(1).as<PrintNode>();
    REQUIRE(print.args[0]->value_type() == ValueType::Integer);
}

TEST_CASE("Analyzer should accept a recursive function", "[analyzer]") {
    TestProgram prog(R"(
        funcao fatorial(n: inteiro): inteiro {
            se (n <= 1) {
                retorna 1
            }
            retorna n * fatorial(n - 1)
        }

        funcao principal() {
            var resultado: inteiro = fatorial(5)
            escreva("5! = ", resultado)
        }
    )");
    require_clean(prog);

    const auto& symbols = prog.symbols();
    auto fatorial = symbols[symbols.global_scope()].find_local("fatorial");
    REQUIRE(fatorial);
    REQUIRE(symbols[fatorial].kind() == SymbolKind::Function);
    REQUIRE(symbols[fatorial].signature()->params == std::vector<ValueType>{ValueType::Integer});
    REQUIRE(symbols[fatorial].signature()->return_type == ValueType::Integer);
}

TEST_CASE("Analyzer should report assignments to constants", "[analyzer]") {
    TestProgram prog("const PI: real = 3.14159\nPI = 3.14");
    require_single(prog, DiagnosticKind::ConstantReassignment);

    const auto& msg = prog.message(DiagnosticKind::ConstantReassignment);
    REQUIRE(msg.text == "Cannot assign to constant 'PI'.");
    REQUIRE(prog.pos(msg) == CursorPosition(2, 1));
}

TEST_CASE("Analyzer should report reading into constants", "[analyzer]") {
    TestProgram prog("const N: inteiro = 1\nleia(N)");
    require_single(prog, DiagnosticKind::ConstantReassignment);
}

TEST_CASE("Analyzer should report every use of an undeclared identifier", "[analyzer]") {
    TestProgram prog(R"(
        escreva(y)
        y = 2
        var z: inteiro = y + 1
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.diag().error_count() == 3);
    REQUIRE(prog.count(DiagnosticKind::UndeclaredIdentifier) == 3);
    REQUIRE(prog.message(DiagnosticKind::UndeclaredIdentifier).text == "Undeclared identifier 'y'.");
}

TEST_CASE("Analyzer should not hoist declarations", "[analyzer]") {
    TestProgram prog("escreva(x)\nvar x: inteiro = 1");
    require_single(prog, DiagnosticKind::UndeclaredIdentifier);
}

TEST_CASE("Analyzer should not allow a variable in its own initializer", "[analyzer]") {
    TestProgram prog("var x: inteiro = x + 1");
    require_single(prog, DiagnosticKind::UndeclaredIdentifier);
}

TEST_CASE("Analyzer should report duplicate declarations in the same scope", "[analyzer]") {
    TestProgram prog(R"(
        var a: inteiro = 1
        var a: texto = "x"
        funcao f(p: inteiro, p: inteiro) { }
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::DuplicateDeclaration) == 2);
    REQUIRE(prog.message(DiagnosticKind::DuplicateDeclaration).text
            == "'a' has already been declared in this scope.");
}

TEST_CASE("Analyzer should allow shadowing in nested scopes", "[analyzer]") {
    TestProgram prog(R"(
        var x: inteiro = 1
        funcao f(x: texto) {
            escreva(x)
            se (verdadeiro) {
                var x: logico = falso
                escreva(x)
            }
        }
    )");
    require_clean(prog);

    const auto& func = prog.item(1).as<FuncDeclNode>();
    const auto& body = func.body->as<BlockNode>();
    REQUIRE(body.stmts[0]->as<PrintNode>().args[0]->value_type() == ValueType::Text);

    const auto& inner = body.stmts[1]->as<IfNode>().then_block->as<BlockNode>();
    REQUIRE(inner.stmts[1]->as<PrintNode>().args[0]->value_type() == ValueType::Logical);
}

TEST_CASE("Analyzer should not allow redeclaring a parameter in the function body", "[analyzer]") {
    TestProgram prog("funcao f(n: inteiro) { var n: inteiro = 2 }");
    require_single(prog, DiagnosticKind::DuplicateDeclaration);
}

TEST_CASE("Analyzer should scope block declarations", "[analyzer]") {
    TestProgram prog(R"(
        se (verdadeiro) {
            var interno: inteiro = 1
        }
        escreva(interno)
    )");
    require_single(prog, DiagnosticKind::UndeclaredIdentifier);
}

TEST_CASE("Analyzer should scope the loop variable to the loop", "[analyzer]") {
    TestProgram prog(R"(
        para i de 1 ate 3 {
            escreva(i)
        }
        escreva(i)
    )");
    require_single(prog, DiagnosticKind::UndeclaredIdentifier);
}

TEST_CASE("Analyzer should report type mismatches in declarations", "[analyzer]") {
    TestProgram prog(R"(var x: inteiro = "texto")");
    require_single(prog, DiagnosticKind::TypeMismatch);
    REQUIRE(prog.message(DiagnosticKind::TypeMismatch).text
            == "Cannot initialize variable 'x' of type inteiro with a value of type texto.");
}

TEST_CASE("Analyzer should use strict typing for numbers", "[analyzer]") {
    TestProgram prog(R"(
        var r: real = 1
        var i: inteiro = 1.5
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::TypeMismatch) == 2);
}

TEST_CASE("Analyzer should compute arithmetic result types", "[analyzer]") {
    TestProgram prog(R"(
        var a: inteiro = 7 / 2
        var b: real = 7 / 2.0
        var c: real = 2 ** 0.5
        var d: texto = "a" + "b"
        var e: logico = 1 < 2 e "a" == "b"
    )");
    require_clean(prog);

    REQUIRE(prog.item(0).as<VarDeclNode>().init->value_type() == ValueType::Integer);
    REQUIRE(prog.item(1).as<VarDeclNode>().init->value_type() == ValueType::Real);
    REQUIRE(prog.item(3).as<VarDeclNode>().init->value_type() == ValueType::Text);
    REQUIRE(prog.item(4).as<VarDeclNode>().init->value_type() == ValueType::Logical);
}

TEST_CASE("Analyzer should report invalid operand types", "[analyzer]") {
    std::string_view sources[] = {
        R"(escreva("a" - "b"))",
        R"(escreva(1 + "b"))",
        R"(escreva(verdadeiro + 1))",
        R"(escreva(1 e verdadeiro))",
        R"(escreva(nao 1))",
        R"(escreva(-"x"))",
        R"(escreva(1 == "1"))",
        R"(escreva(verdadeiro < falso))",
    };

    for (auto source : sources) {
        CAPTURE(source);
        TestProgram prog(source);
        require_single(prog, DiagnosticKind::TypeMismatch);
    }
}

TEST_CASE("Analyzer should not cascade errors", "[analyzer]") {
    TestProgram prog(R"(
        var x: inteiro = desconhecido + 1 * 2 - 3
        escreva(x + desconhecido)
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.diag().error_count() == 2);
    REQUIRE(prog.count(DiagnosticKind::UndeclaredIdentifier) == 2);
}

TEST_CASE("Analyzer should require logical conditions", "[analyzer]") {
    TestProgram prog(R"(
        se (1) { }
        enquanto ("x") { }
        se (verdadeiro) { } senaose (2.0) { }
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::TypeMismatch) == 3);
    REQUIRE(prog.message(DiagnosticKind::TypeMismatch).text
            == "The condition of 'se' must be of type logico, found inteiro.");
}

TEST_CASE("Analyzer should require integer loop bounds", "[analyzer]") {
    TestProgram prog("para i de 0.5 ate 10 passo \"x\" { }");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::TypeMismatch) == 2);
}

TEST_CASE("Analyzer should check assignments", "[analyzer]") {
    TestProgram prog(R"(
        var x: inteiro = 0
        x = 1
        x = "um"
        x += 2
    )");
    require_single(prog, DiagnosticKind::TypeMismatch);
}

TEST_CASE("Analyzer should type nested assignments", "[analyzer]") {
    TestProgram prog(R"(
        var a: inteiro
        var b: inteiro
        a = b = 3
        escreva((a = 4) + 1)
    )");
    require_clean(prog);

    const auto& chained = prog.item(2).as<ExprStmtNode>().expr;
    REQUIRE(chained->value_type() == ValueType::Integer);
}

TEST_CASE("Analyzer should check calls", "[analyzer]") {
    TestProgram prog(R"(
        funcao soma(a: inteiro, b: inteiro): inteiro {
            retorna a + b
        }
        var x: inteiro = 1

        soma(1)
        soma(1, "2")
        x(1)
        var r: texto = soma(1, 2)
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::ArgumentCountMismatch) == 1);
    REQUIRE(prog.message(DiagnosticKind::ArgumentCountMismatch).text
            == "Function 'soma' expects 2 argument(s), but 1 were provided.");
    REQUIRE(prog.count(DiagnosticKind::NotCallable) == 1);
    REQUIRE(prog.message(DiagnosticKind::NotCallable).text
            == "'x' is not a function and cannot be called.");
    REQUIRE(prog.count(DiagnosticKind::TypeMismatch) == 2);
    REQUIRE(prog.diag().error_count() == 4);
}

TEST_CASE("Analyzer should not allow functions as values", "[analyzer]") {
    TestProgram prog(R"(
        funcao f() { }
        var x: inteiro = f
        f = 1
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::TypeMismatch) == 2);
}

TEST_CASE("Analyzer should check return statements", "[analyzer]") {
    TestProgram prog(R"(
        funcao a(): inteiro {
            retorna "x"
        }
        funcao b(): inteiro {
            retorna
        }
        funcao c() {
            retorna 1
        }
        funcao d() {
            retorna
        }
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::ReturnTypeMismatch) == 3);
    REQUIRE(prog.diag().error_count() == 3);
}

TEST_CASE("Analyzer should report returns outside of functions", "[analyzer]") {
    TestProgram prog("retorna 1");
    require_single(prog, DiagnosticKind::ReturnOutsideFunction);
    REQUIRE(prog.message(DiagnosticKind::ReturnOutsideFunction).text
            == "'retorna' is only allowed inside a function.");
}

TEST_CASE("Analyzer should warn about missing returns", "[analyzer]") {
    TestProgram prog(R"(
        funcao sinal(n: inteiro): inteiro {
            se (n > 0) {
                retorna 1
            }
        }

        funcao completo(n: inteiro): inteiro {
            se (n > 0) {
                retorna 1
            } senao {
                retorna -1
            }
        }

        funcao laco(n: inteiro): inteiro {
            enquanto (verdadeiro) {
                retorna n
            }
        }
    )");

    CAPTURE(prog.report());
    REQUIRE(!prog.diag().has_errors());
    REQUIRE(prog.diag().warning_count() == 2);
    REQUIRE(prog.count(DiagnosticKind::MissingReturn) == 2);

    const auto& msg = prog.message(DiagnosticKind::MissingReturn);
    REQUIRE(msg.level == Diagnostics::Warning);
    REQUIRE(prog.pos(msg) == CursorPosition(2, 9));
}

TEST_CASE("Analyzer should reject vazio variables and parameters", "[analyzer]") {
    TestProgram prog(R"(
        var x: vazio
        funcao f(p: vazio) { }
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::InvalidType) == 2);
    REQUIRE(prog.message(DiagnosticKind::InvalidType).text
            == "Variable 'x' cannot have type vazio.");
}

TEST_CASE("Analyzer should reject printing vazio values", "[analyzer]") {
    TestProgram prog(R"(
        funcao f() { }
        escreva(f())
    )");
    require_single(prog, DiagnosticKind::TypeMismatch);
}

TEST_CASE("Analyzer should require a texto prompt for leia", "[analyzer]") {
    TestProgram prog(R"(
        var x: inteiro
        leia(42, x)
        leia("Valor: ", x)
    )");
    require_single(prog, DiagnosticKind::TypeMismatch);
}

TEST_CASE("Analyzer should analyze programs with syntax errors", "[analyzer]") {
    TestProgram prog(R"(
        var x: inteiro = )
        escreva(y)
    )");

    CAPTURE(prog.report());
    REQUIRE(prog.count(DiagnosticKind::SyntaxError) == 1);
    REQUIRE(prog.count(DiagnosticKind::UndeclaredIdentifier) == 1);
}

TEST_CASE("Analyzer should record references to declarations", "[analyzer]") {
    TestProgram prog(R"(
        var total: inteiro = 0
        total = total + 1
    )");
    require_clean(prog);

    auto& symbols = prog.symbols();
    auto decl = symbols.find_decl(prog.item(0).id());
    REQUIRE(decl);
    REQUIRE(symbols[decl].name() == "total");
    REQUIRE(symbols[decl].kind() == SymbolKind::Variable);

    const auto& assign = prog.item(1).as<ExprStmtNode>().expr->as<AssignmentNode>();
    REQUIRE(symbols.find_ref(assign.target->id()) == decl);
    REQUIRE(symbols.find_ref(assign.value->as<BinaryExprNode>().lhs->id()) == decl);
}
