#include "support/test_compiler.hpp"

#include <catch2/catch.hpp>

using namespace lusitano;
using test_support::TestProgram;

static TestProgram& require_clean(TestProgram& prog) {
    CAPTURE(prog.report());
    REQUIRE(!prog.diag().has_errors());
    return prog;
}

static const AstNode& expr_of(const AstNode& stmt) {
    REQUIRE(stmt.is<ExprStmtNode>());
    const auto& expr = stmt.as<ExprStmtNode>().expr;
    REQUIRE(expr);
    return *expr;
}

TEST_CASE("Parser should parse variable declarations", "[parser]") {
    TestProgram prog("var x: inteiro = 25\nvar nome: texto", false);
    require_clean(prog);
    REQUIRE(prog.item_count() == 2);

    const auto& x = prog.item(0).as<VarDeclNode>();
    REQUIRE(x.name == "x");
    REQUIRE(x.declared_type == ValueType::Integer);
    REQUIRE(x.init);
    REQUIRE(std::get<i64>(x.init->as<LiteralNode>().value) == 25);

    const auto& nome = prog.item(1).as<VarDeclNode>();
    REQUIRE(nome.name == "nome");
    REQUIRE(nome.declared_type == ValueType::Text);
    REQUIRE(!nome.init);
}

TEST_CASE("Parser should parse constant declarations", "[parser]") {
    TestProgram prog("const PI: real = 3.14159;", false);
    require_clean(prog);

    const auto& pi = prog.item(0).as<ConstDeclNode>();
    REQUIRE(pi.name == "PI");
    REQUIRE(pi.declared_type == ValueType::Real);
    REQUIRE(std::get<f64>(pi.init->as<LiteralNode>().value) == Approx(3.14159));
}

TEST_CASE("Parser should require an initializer for constants", "[parser]") {
    TestProgram prog("const PI: real\nvar y: inteiro = 1", false);
    REQUIRE(prog.count(DiagnosticKind::SyntaxError) == 1);
    REQUIRE(prog.item_count() == 2);
    REQUIRE(prog.item(0).is<ErrorNode>());
    REQUIRE(prog.item(1).is<VarDeclNode>());
}

TEST_CASE("Parser should parse function declarations", "[parser]") {
    TestProgram prog(R"(
        funcao soma(a: inteiro, b: real): real {
            retorna a + b
        }

        funcao ola() {
            escreva("ola")
        }
    )",
        false);
    require_clean(prog);
    REQUIRE(prog.item_count() == 2);

    const auto& soma = prog.item(0).as<FuncDeclNode>();
    REQUIRE(soma.name == "soma");
    REQUIRE(soma.params.size() == 2);
    REQUIRE(soma.params[0].name == "a");
    REQUIRE(soma.params[0].type == ValueType::Integer);
    REQUIRE(soma.params[1].name == "b");
    REQUIRE(soma.params[1].type == ValueType::Real);
    REQUIRE(soma.return_type == ValueType::Real);

    const auto& body = soma.body->as<BlockNode>();
    REQUIRE(body.stmts.size() == 1);
    const auto& ret = body.stmts[0]->as<ReturnNode>();
    REQUIRE(ret.value->as<BinaryExprNode>().op == BinaryOperator::Plus);

    const auto& ola = prog.item(1).as<FuncDeclNode>();
    REQUIRE(ola.params.empty());
    REQUIRE(ola.return_type == ValueType::Void);
}

TEST_CASE("Parser should respect operator precedence", "[parser]") {
    TestProgram prog("1 + 2 * 3 ** 2 ** 2", false);
    require_clean(prog);

    const auto& plus = expr_of(prog.item(0)).as<BinaryExprNode>();
    REQUIRE(plus.op == BinaryOperator::Plus);

    const auto& mul = plus.rhs->as<BinaryExprNode>();
    REQUIRE(mul.op == BinaryOperator::Multiply);

    // Power is right associative: 3 ** (2 ** 2)
    const auto& pow = mul.rhs->as<BinaryExprNode>();
    REQUIRE(pow.op == BinaryOperator::Power);
    REQUIRE(pow.lhs->is<LiteralNode>());
    REQUIRE(pow.rhs->as<BinaryExprNode>().op == BinaryOperator::Power);
}

TEST_CASE("Parser should parse logical operators with the correct precedence", "[parser]") {
    TestProgram prog("a ou b e nao c == d", false);
    require_clean(prog);

    const auto& or_expr = expr_of(prog.item(0)).as<BinaryExprNode>();
    REQUIRE(or_expr.op == BinaryOperator::LogicalOr);
    REQUIRE(or_expr.lhs->as<IdentifierNode>().name == "a");

    const auto& and_expr = or_expr.rhs->as<BinaryExprNode>();
    REQUIRE(and_expr.op == BinaryOperator::LogicalAnd);

    // Unary operators bind tighter than equality: (nao c) == d
    const auto& eq_expr = and_expr.rhs->as<BinaryExprNode>();
    REQUIRE(eq_expr.op == BinaryOperator::Equals);
    REQUIRE(eq_expr.lhs->as<UnaryExprNode>().op == UnaryOperator::LogicalNot);
    REQUIRE(eq_expr.rhs->as<IdentifierNode>().name == "d");
}

TEST_CASE("Parser should parse left associative subtraction", "[parser]") {
    TestProgram prog("10 - 3 - 2", false);
    require_clean(prog);

    const auto& outer = expr_of(prog.item(0)).as<BinaryExprNode>();
    REQUIRE(outer.op == BinaryOperator::Minus);
    REQUIRE(std::get<i64>(outer.rhs->as<LiteralNode>().value) == 2);
    REQUIRE(outer.lhs->as<BinaryExprNode>().op == BinaryOperator::Minus);
}

TEST_CASE("Parser should parse parenthesized expressions", "[parser]") {
    TestProgram prog("(1 + 2) * 3", false);
    require_clean(prog);

    const auto& mul = expr_of(prog.item(0)).as<BinaryExprNode>();
    REQUIRE(mul.op == BinaryOperator::Multiply);
    REQUIRE(mul.lhs->as<BinaryExprNode>().op == BinaryOperator::Plus);
}

TEST_CASE("Parser should parse right associative assignments", "[parser]") {
    TestProgram prog("a = b = 3", false);
    require_clean(prog);

    const auto& outer = expr_of(prog.item(0)).as<AssignmentNode>();
    REQUIRE(identifier_name(*outer.target) == "a");

    const auto& inner = outer.value->as<AssignmentNode>();
    REQUIRE(identifier_name(*inner.target) == "b");
    REQUIRE(inner.value->is<LiteralNode>());
}

TEST_CASE("Parser should desugar compound assignments", "[parser]") {
    TestProgram prog("total += 2 * x", false);
    require_clean(prog);

    const auto& assign = expr_of(prog.item(0)).as<AssignmentNode>();
    REQUIRE(identifier_name(*assign.target) == "total");

    const auto& value = assign.value->as<BinaryExprNode>();
    REQUIRE(value.op == BinaryOperator::Plus);
    REQUIRE(identifier_name(*value.lhs) == "total");
    REQUIRE(value.rhs->as<BinaryExprNode>().op == BinaryOperator::Multiply);

    // The generated identifier is a separate node.
    REQUIRE(value.lhs->id() != assign.target->id());
}

TEST_CASE("Parser should reject invalid assignment targets", "[parser]") {
    TestProgram prog("1 + 2 = 3\nf() = 4", false);
    REQUIRE(prog.count(DiagnosticKind::InvalidAssignmentTarget) == 2);
    REQUIRE(prog.count(DiagnosticKind::SyntaxError) == 0);
}

TEST_CASE("Parser should parse calls", "[parser]") {
    TestProgram prog("fatorial(n - 1, \"x\", verdadeiro)\nf()", false);
    require_clean(prog);

    const auto& call = expr_of(prog.item(0)).as<CallNode>();
    REQUIRE(identifier_name(*call.callee) == "fatorial");
    REQUIRE(call.args.size() == 3);
    REQUIRE(call.args[0]->is<BinaryExprNode>());
    REQUIRE(std::get<std::string>(call.args[1]->as<LiteralNode>().value) == "x");
    REQUIRE(std::get<bool>(call.args[2]->as<LiteralNode>().value) == true);

    REQUIRE(expr_of(prog.item(1)).as<CallNode>().args.empty());
}

TEST_CASE("Parser should parse if statements with else-if chains", "[parser]") {
    TestProgram prog(R"(
        se (x > 10) {
            escreva("grande")
        } senaose (x > 5) {
            escreva("medio")
        } senao se (x > 0) {
            escreva("pequeno")
        } senao {
            escreva("zero")
        }
    )",
        false);
    require_clean(prog);
    REQUIRE(prog.item_count() == 1);

    const auto& first = prog.item(0).as<IfNode>();
    REQUIRE(first.cond->as<BinaryExprNode>().op == BinaryOperator::Greater);
    REQUIRE(first.then_block->is<BlockNode>());

    const auto& second = first.else_branch->as<IfNode>();
    const auto& third = second.else_branch->as<IfNode>();
    REQUIRE(third.else_branch->is<BlockNode>());
}

TEST_CASE("Parser should parse while loops", "[parser]") {
    TestProgram prog("enquanto (i < 10) { i = i + 1 }", false);
    require_clean(prog);

    const auto& loop = prog.item(0).as<WhileNode>();
    REQUIRE(loop.cond->is<BinaryExprNode>());
    REQUIRE(loop.body->as<BlockNode>().stmts.size() == 1);
}

TEST_CASE("Parser should parse for loops", "[parser]") {
    TestProgram prog("para i de 1 ate 10 { escreva(i) }\npara j de 10 ate 0 passo -2 { }", false);
    require_clean(prog);

    const auto& first = prog.item(0).as<ForRangeNode>();
    REQUIRE(first.var == "i");
    REQUIRE(std::get<i64>(first.start->as<LiteralNode>().value) == 1);
    REQUIRE(std::get<i64>(first.end->as<LiteralNode>().value) == 10);
    REQUIRE(!first.step);

    const auto& second = prog.item(1).as<ForRangeNode>();
    REQUIRE(second.var == "j");
    REQUIRE(second.step->as<UnaryExprNode>().op == UnaryOperator::Minus);
    REQUIRE(second.body->as<BlockNode>().stmts.empty());
}

TEST_CASE("Parser should parse print and read statements", "[parser]") {
    TestProgram prog(R"(
        escreva("Resultado: ", x, 1.5)
        escreva()
        leia(x)
        leia("Digite um numero: ", y)
    )",
        false);
    require_clean(prog);
    REQUIRE(prog.item_count() == 4);

    REQUIRE(prog.item(0).as<PrintNode>().args.size() == 3);
    REQUIRE(prog.item(1).as<PrintNode>().args.empty());

    const auto& read_x = prog.item(2).as<ReadNode>();
    REQUIRE(!read_x.prompt);
    REQUIRE(identifier_name(*read_x.target) == "x");

    const auto& read_y = prog.item(3).as<ReadNode>();
    REQUIRE(std::get<std::string>(read_y.prompt->as<LiteralNode>().value) == "Digite um numero: ");
    REQUIRE(identifier_name(*read_y.target) == "y");
}

TEST_CASE("Parser should parse return statements with and without values", "[parser]") {
    TestProgram prog(R"(
        funcao f() {
            retorna
        }
        funcao g(): inteiro {
            retorna 1
        }
    )",
        false);
    require_clean(prog);

    const auto& f_body = prog.item(0).as<FuncDeclNode>().body->as<BlockNode>();
    REQUIRE(!f_body.stmts[0]->as<ReturnNode>().value);

    const auto& g_body = prog.item(1).as<FuncDeclNode>().body->as<BlockNode>();
    REQUIRE(g_body.stmts[0]->as<ReturnNode>().value);
}

TEST_CASE("Parser should accept optional semicolons", "[parser]") {
    TestProgram prog("var a: inteiro = 1; var b: inteiro = 2;; escreva(a + b);", false);
    require_clean(prog);
    REQUIRE(prog.item_count() == 3);
}

TEST_CASE("Parser should assign unique node ids and source ranges", "[parser]") {
    TestProgram prog("var x: inteiro = 1 + 2", false);
    require_clean(prog);

    const auto& decl = prog.item(0);
    const auto& init = *decl.as<VarDeclNode>().init;
    REQUIRE(decl.id() != init.id());
    REQUIRE(decl.id() != prog.program().id());
    REQUIRE(substring(prog.source(), decl.range()) == "var x: inteiro = 1 + 2");
    REQUIRE(substring(prog.source(), init.range()) == "1 + 2");
}
