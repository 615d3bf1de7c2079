#include "compiler/ast/dump.hpp"

#include "support/test_compiler.hpp"

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <vector>

using namespace lusitano;
using test_support::TestProgram;

using json = nlohmann::json;

static json dump_json(TestProgram& prog) {
    return json::parse(dump(&prog.program(), prog.source_map()));
}

TEST_CASE("The ast dump should contain the common node fields", "[ast-dump]") {
    TestProgram prog("var x: inteiro = 25\nescreva(x)");
    auto root = dump_json(prog);

    REQUIRE(root["type"] == "Program");
    REQUIRE(root["id"].is_number());
    REQUIRE(root["has_error"] == false);

    const auto& items = root["items"];
    REQUIRE(items.is_array());
    REQUIRE(items.size() == 2);

    const auto& var = items[0];
    REQUIRE(var["type"] == "VarDecl");
    REQUIRE(var["name"] == "x");
    REQUIRE(var["declared_type"] == "inteiro");
    REQUIRE(var["start"]["line"] == 1);
    REQUIRE(var["start"]["column"] == 1);

    const auto& init = var["init"];
    REQUIRE(init["type"] == "Literal");
    REQUIRE(init["value"] == 25);
    REQUIRE(init["value_type"] == "inteiro");
    REQUIRE(init["start"]["column"] == 18);

    const auto& print = items[1];
    REQUIRE(print["type"] == "Print");
    REQUIRE(print["start"]["line"] == 2);
    REQUIRE(print["args"].size() == 1);
    REQUIRE(print["args"][0]["type"] == "Identifier");
    REQUIRE(print["args"][0]["name"] == "x");
}

TEST_CASE("The ast dump should assign unique ids", "[ast-dump]") {
    TestProgram prog("var a: inteiro = 1 + 2 * 3");
    auto root = dump_json(prog);

    std::vector<int> ids;
    auto collect = [&](const json& node, auto& self) -> void {
        if (node.is_object()) {
            if (node.contains("id") && node.contains("type"))
                ids.push_back(node["id"].get<int>());
            for (const auto& item : node.items())
                self(item.value(), self);
        } else if (node.is_array()) {
            for (const auto& child : node)
                self(child, self);
        }
    };
    collect(root, collect);

    REQUIRE(ids.size() == 7); // program, var, binary, literal, binary, literal, literal
    std::sort(ids.begin(), ids.end());
    REQUIRE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
}

TEST_CASE("The ast dump should render operators and nested expressions", "[ast-dump]") {
    TestProgram prog("var b: logico = nao (1 < 2)");
    auto root = dump_json(prog);

    const auto& init = root["items"][0]["init"];
    REQUIRE(init["type"] == "UnaryExpr");
    REQUIRE(init["operator"] == "LogicalNot");
    REQUIRE(init["value_type"] == "logico");

    const auto& operand = init["operand"];
    REQUIRE(operand["type"] == "BinaryExpr");
    REQUIRE(operand["operator"] == "Less");
    REQUIRE(operand["lhs"]["value"] == 1);
    REQUIRE(operand["rhs"]["value"] == 2);
}

TEST_CASE("The ast dump should render function parameters", "[ast-dump]") {
    TestProgram prog("funcao soma(a: inteiro, b: real): real {\n    retorna a + b\n}");
    auto root = dump_json(prog);

    const auto& func = root["items"][0];
    REQUIRE(func["type"] == "FuncDecl");
    REQUIRE(func["name"] == "soma");
    REQUIRE(func["return_type"] == "real");

    const auto& params = func["params"];
    REQUIRE(params.size() == 2);
    REQUIRE(params[0]["name"] == "a");
    REQUIRE(params[0]["type"] == "inteiro");
    REQUIRE(params[1]["name"] == "b");
    REQUIRE(params[1]["type"] == "real");
    REQUIRE(params[1]["start"]["column"] == 25);

    const auto& body = func["body"];
    REQUIRE(body["type"] == "Block");
    REQUIRE(body["stmts"][0]["type"] == "Return");
    REQUIRE(body["stmts"][0]["value"]["value_type"] == "real");
}

TEST_CASE("The ast dump should render missing children as null", "[ast-dump]") {
    TestProgram prog("se (verdadeiro) { }\nleia(x)");
    auto root = dump_json(prog);

    const auto& stmt = root["items"][0];
    REQUIRE(stmt["type"] == "If");
    REQUIRE(stmt["else_branch"].is_null());
    REQUIRE(stmt["then_block"]["stmts"].empty());

    const auto& read = root["items"][1];
    REQUIRE(read["type"] == "Read");
    REQUIRE(read["prompt"].is_null());
    REQUIRE(read["target"]["name"] == "x");
}

TEST_CASE("The ast dump should mark error nodes", "[ast-dump]") {
    TestProgram prog("var x: = 1\nescreva(\"ok\")");
    auto root = dump_json(prog);

    REQUIRE(root["items"].size() == 2);
    REQUIRE(root["items"][0]["type"] == "Error");
    REQUIRE(root["items"][0]["has_error"] == true);
    REQUIRE(root["items"][1]["args"][0]["value"] == "ok");
}

TEST_CASE("The ast dump should accept a null node", "[ast-dump]") {
    TestProgram prog("");
    REQUIRE(dump(nullptr, prog.source_map()) == "null");
}
