#include "compiler/ast/dump.hpp"

#include <nlohmann/json.hpp>

namespace lusitano {

using nlohmann::ordered_json;

namespace {

class NodeMapper final {
public:
    explicit NodeMapper(const SourceMap& map)
        : map_(map) {}

    ordered_json map(const AstNode* node);

    void visit_program(const AstNode&, const ProgramNode& n, ordered_json& out) {
        visit_field(out, "items", n.items);
    }

    void visit_func_decl(const AstNode&, const FuncDeclNode& n, ordered_json& out) {
        visit_field(out, "name", n.name);
        visit_field(out, "params", n.params);
        visit_field(out, "return_type", n.return_type);
        visit_field(out, "body", n.body);
    }

    void visit_var_decl(const AstNode&, const VarDeclNode& n, ordered_json& out) {
        visit_field(out, "name", n.name);
        visit_field(out, "declared_type", n.declared_type);
        visit_field(out, "init", n.init);
    }

    void visit_const_decl(const AstNode&, const ConstDeclNode& n, ordered_json& out) {
        visit_field(out, "name", n.name);
        visit_field(out, "declared_type", n.declared_type);
        visit_field(out, "init", n.init);
    }

    void visit_block(const AstNode&, const BlockNode& n, ordered_json& out) {
        visit_field(out, "stmts", n.stmts);
    }

    void visit_if(const AstNode&, const IfNode& n, ordered_json& out) {
        visit_field(out, "cond", n.cond);
        visit_field(out, "then_block", n.then_block);
        visit_field(out, "else_branch", n.else_branch);
    }

    void visit_while(const AstNode&, const WhileNode& n, ordered_json& out) {
        visit_field(out, "cond", n.cond);
        visit_field(out, "body", n.body);
    }

    void visit_for_range(const AstNode&, const ForRangeNode& n, ordered_json& out) {
        visit_field(out, "var", n.var);
        visit_field(out, "start", n.start);
        visit_field(out, "end", n.end);
        visit_field(out, "step", n.step);
        visit_field(out, "body", n.body);
    }

    void visit_assignment(const AstNode&, const AssignmentNode& n, ordered_json& out) {
        visit_field(out, "target", n.target);
        visit_field(out, "value", n.value);
    }

    void visit_binary_expr(const AstNode&, const BinaryExprNode& n, ordered_json& out) {
        visit_field(out, "operator", to_string(n.op));
        visit_field(out, "lhs", n.lhs);
        visit_field(out, "rhs", n.rhs);
    }

    void visit_unary_expr(const AstNode&, const UnaryExprNode& n, ordered_json& out) {
        visit_field(out, "operator", to_string(n.op));
        visit_field(out, "operand", n.operand);
    }

    void visit_call(const AstNode&, const CallNode& n, ordered_json& out) {
        visit_field(out, "callee", n.callee);
        visit_field(out, "args", n.args);
    }

    void visit_literal(const AstNode&, const LiteralNode& n, ordered_json& out) {
        std::visit([&](const auto& value) { visit_field(out, "value", value); }, n.value);
    }

    void visit_identifier(const AstNode&, const IdentifierNode& n, ordered_json& out) {
        visit_field(out, "name", n.name);
    }

    void visit_return(const AstNode&, const ReturnNode& n, ordered_json& out) {
        visit_field(out, "value", n.value);
    }

    void visit_print(const AstNode&, const PrintNode& n, ordered_json& out) {
        visit_field(out, "args", n.args);
    }

    void visit_read(const AstNode&, const ReadNode& n, ordered_json& out) {
        visit_field(out, "prompt", n.prompt);
        visit_field(out, "target", n.target);
    }

    void visit_expr_stmt(const AstNode&, const ExprStmtNode& n, ordered_json& out) {
        visit_field(out, "expr", n.expr);
    }

    void visit_error(const AstNode&, const ErrorNode&, ordered_json&) {}

private:
    template<typename T>
    void visit_field(ordered_json& out, std::string_view name, const T& data) {
        out.emplace(std::string(name), format_value(data));
    }

    ordered_json format_value(const AstPtr& node) { return map(node.get()); }

    ordered_json format_value(const AstNodeList& list) {
        ordered_json result = ordered_json::array();
        for (const auto& child : list) {
            result.push_back(map(child.get()));
        }
        return result;
    }

    ordered_json format_value(const std::vector<AstParam>& params) {
        ordered_json result = ordered_json::array();
        for (const auto& param : params) {
            auto jv = ordered_json::object();
            jv.emplace("name", param.name);
            jv.emplace("type", to_string(param.type));
            jv.emplace("start", format_value(map_.cursor_pos(param.range)));
            result.push_back(std::move(jv));
        }
        return result;
    }

    ordered_json format_value(const CursorPosition& pos) {
        if (!pos)
            return ordered_json();

        auto jv = ordered_json::object();
        jv.emplace("line", pos.line());
        jv.emplace("column", pos.column());
        return jv;
    }

    ordered_json format_value(AstId id) { return id ? ordered_json(id.value()) : ordered_json(); }
    ordered_json format_value(ValueType type) { return ordered_json(to_string(type)); }
    ordered_json format_value(std::string_view str) { return ordered_json(str); }
    ordered_json format_value(const std::string& str) { return ordered_json(str); }

    template<typename T,
        std::enable_if_t<
            std::is_same_v<T, bool> || std::is_integral_v<T> || std::is_floating_point_v<T>>* =
            nullptr>
    ordered_json format_value(const T& v) {
        return ordered_json(v);
    }

private:
    const SourceMap& map_;
};

} // namespace

ordered_json NodeMapper::map(const AstNode* node) {
    if (!node)
        return ordered_json();

    auto result = ordered_json::object();
    visit_field(result, "type", to_string(node->type()));
    visit_field(result, "id", node->id());
    visit_field(result, "start", map_.cursor_pos(node->range().begin()));
    visit_field(result, "end", map_.cursor_pos(node->range().end()));
    visit_field(result, "value_type", node->value_type());
    visit_field(result, "has_error", node->has_error());
    visit(*node, *this, result);
    return result;
}

std::string dump(const AstNode* node, const SourceMap& map) {
    NodeMapper mapper(map);
    return mapper.map(node).dump(4);
}

} // namespace lusitano
