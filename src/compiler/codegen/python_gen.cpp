#include "compiler/codegen/python_gen.hpp"

#include "common/adt/index_map.hpp"
#include "common/format.hpp"
#include "compiler/reset_value.hpp"

#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_join.h"

#include <cmath>
#include <iterator>
#include <utility>
#include <vector>

namespace lusitano {

// Python keywords and the builtins called by the generated code.
static constexpr std::string_view python_reserved_names[] = {
    "False",
    "None",
    "True",
    "and",
    "as",
    "assert",
    "async",
    "await",
    "break",
    "class",
    "continue",
    "def",
    "del",
    "elif",
    "else",
    "except",
    "finally",
    "float",
    "for",
    "from",
    "global",
    "if",
    "import",
    "in",
    "input",
    "int",
    "is",
    "lambda",
    "nonlocal",
    "not",
    "or",
    "pass",
    "print",
    "raise",
    "range",
    "return",
    "try",
    "while",
    "with",
    "yield",
};

bool is_python_reserved(std::string_view name) {
    static const absl::flat_hash_set<std::string_view> names(
        std::begin(python_reserved_names), std::end(python_reserved_names));
    return names.contains(name) || (name.size() > 4 && name.substr(0, 2) == "__");
}

std::string python_string_literal(std::string_view value) {
    std::string result;
    result.reserve(value.size() + 2);
    result += '\'';
    for (char c : value) {
        switch (c) {
        case '\\':
            result += "\\\\";
            break;
        case '\'':
            result += "\\'";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\t':
            result += "\\t";
            break;
        case '\r':
            result += "\\r";
            break;
        default: {
            const auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20 || byte == 0x7f) {
                fmt::format_to(std::back_inserter(result), "\\x{:02x}", byte);
            } else {
                result += c;
            }
            break;
        }
        }
    }
    result += '\'';
    return result;
}

std::string python_real_literal(double value) {
    if (std::isnan(value))
        return "float('nan')";
    if (std::isinf(value))
        return value > 0 ? "float('inf')" : "(-float('inf'))";

    auto result = fmt::format("{}", value);
    if (result.find_first_of(".eE") == std::string::npos)
        result += ".0";
    return result;
}

static std::string_view python_operator(BinaryOperator op, ValueType result_type) {
    switch (op) {
    case BinaryOperator::Plus:
        return "+";
    case BinaryOperator::Minus:
        return "-";
    case BinaryOperator::Multiply:
        return "*";
    case BinaryOperator::Divide:
        // Integer division keeps the integer type.
        return result_type == ValueType::Integer ? "//" : "/";
    case BinaryOperator::Modulus:
        return "%";
    case BinaryOperator::Power:
        return "**";
    case BinaryOperator::Less:
        return "<";
    case BinaryOperator::LessEquals:
        return "<=";
    case BinaryOperator::Greater:
        return ">";
    case BinaryOperator::GreaterEquals:
        return ">=";
    case BinaryOperator::Equals:
        return "==";
    case BinaryOperator::NotEquals:
        return "!=";
    case BinaryOperator::LogicalAnd:
        return "and";
    case BinaryOperator::LogicalOr:
        return "or";
    }
    LUSITANO_UNREACHABLE("Invalid binary operator.");
}

static std::string_view python_operator(UnaryOperator op) {
    switch (op) {
    case UnaryOperator::Plus:
        return "+";
    case UnaryOperator::Minus:
        return "-";
    case UnaryOperator::LogicalNot:
        return "not ";
    }
    LUSITANO_UNREACHABLE("Invalid unary operator.");
}

// Returns +1 or -1 if the sign of the expression is known at compile time, 0 otherwise.
static int literal_sign(const AstNode& node) {
    if (node.is<LiteralNode>()) {
        const auto& value = node.as<LiteralNode>().value;
        if (auto i = std::get_if<i64>(&value))
            return *i < 0 ? -1 : 1;
        return 0;
    }

    if (node.is<UnaryExprNode>()) {
        const auto& expr = node.as<UnaryExprNode>();
        if (!expr.operand)
            return 0;

        auto sign = literal_sign(*expr.operand);
        switch (expr.op) {
        case UnaryOperator::Plus:
            return sign;
        case UnaryOperator::Minus:
            return -sign;
        case UnaryOperator::LogicalNot:
            return 0;
        }
    }
    return 0;
}

namespace {

class PythonGenerator final {
public:
    explicit PythonGenerator(const SymbolTable& symbols);

    PythonGenerator(const PythonGenerator&) = delete;
    PythonGenerator& operator=(const PythonGenerator&) = delete;

    void emit_program(const AstNode& program, std::string_view file_name,
        const PythonGenOptions& options, FormatStream& out);

private:
    // Computes unique python names for all symbols. Symbols that would clash with
    // another symbol in the same python function (e.g. because of shadowing) receive a suffix.
    void assign_names();

    // Statement emitters return false if they did not produce any output.
    bool emit_stmt(const AstNode& node, FormatStream& out);
    bool emit_block_contents(const AstNode& node, FormatStream& out);

    // Emits an indented body. Empty bodies become `pass`.
    void emit_body(
        const AstNode* body, FormatStream& out, const std::vector<std::string>& prologue = {});

    void emit_func_decl(const AstNode& node, const FuncDeclNode& func, FormatStream& out);
    void emit_if(const IfNode& stmt, FormatStream& out);
    void emit_for_range(const AstNode& node, const ForRangeNode& stmt, FormatStream& out);
    void emit_print(const PrintNode& stmt, FormatStream& out);
    void emit_read(const ReadNode& stmt, FormatStream& out);
    void emit_assignment_stmt(const AstNode& node, FormatStream& out);

    std::string expr(const AstNode* node);
    std::string expr(const AstPtr& node) { return expr(node.get()); }

    std::string default_value(ValueType type);

    // Names of declared symbols and of identifier references.
    std::string decl_name(const AstNode& decl, const std::string& source_name);
    std::string ref_name(const AstNode* ident);
    std::string sanitize(const std::string& name);

    // Returns a name for a generated temporary that is not used by any symbol.
    std::string fresh_name(std::string_view base);

    // Returns the symbols assigned to within the function body that are owned by
    // another (enclosing) scope. The result contains `global` and `nonlocal` statements.
    std::vector<std::string> scope_statements(SymbolId function, const AstNode* body);

private:
    const SymbolTable& symbols_;
    IndexMap<std::string, IdMapper<SymbolId>> names_;
    absl::flat_hash_set<std::string> taken_;
    bool in_function_ = false;
};

} // namespace

PythonGenerator::PythonGenerator(const SymbolTable& symbols)
    : symbols_(symbols) {
    assign_names();
}

void PythonGenerator::emit_program(const AstNode& program, std::string_view file_name,
    const PythonGenOptions& options, FormatStream& out) {
    const auto& items = program.as<ProgramNode>().items;

    if (options.header)
        out.format("# Gerado pelo compilador lusitano a partir de {}\n\n", file_name);

    for (const auto& item : items) {
        if (!item)
            continue;

        emit_stmt(*item, out);
        if (item->is<FuncDeclNode>())
            out.format("\n");
    }

    if (options.call_main) {
        const auto& global = symbols_[symbols_.global_scope()];
        auto main_id = global.find_local("principal");
        if (main_id) {
            const auto& main = symbols_[main_id];
            if (main.kind() == SymbolKind::Function && main.signature()
                && main.signature()->params.empty()) {
                out.format("\nif __name__ == '__main__':\n    {}()\n", names_[main_id]);
            }
        }
    }
}

void PythonGenerator::assign_names() {
    absl::flat_hash_set<std::string> source_names;
    for (size_t i = 0; i < symbols_.symbol_count(); ++i) {
        source_names.insert(symbols_[SymbolId(static_cast<u32>(i))].name());
    }
    taken_ = source_names;

    absl::flat_hash_set<std::pair<SymbolId, std::string>, UseHasher> seen;
    for (size_t i = 0; i < symbols_.symbol_count(); ++i) {
        const SymbolId id(static_cast<u32>(i));
        const auto& symbol = symbols_[id];
        const auto& scope = symbols_[symbol.parent()];

        const bool shadows = scope.parent() && symbols_.resolve(scope.parent(), symbol.name());
        const bool clashes = !seen.emplace(scope.function(), symbol.name()).second;

        // An escaped name (`print_`) must not collide with a source name.
        auto name = sanitize(symbol.name());
        const bool escape_clashes = name != symbol.name() && source_names.contains(name);
        if (shadows || clashes || escape_clashes) {
            std::string candidate;
            int counter = 2;
            do {
                candidate = fmt::format("{}_{}", symbol.name(), counter++);
            } while (taken_.contains(candidate));
            name = candidate;
        }
        taken_.insert(name);

        [[maybe_unused]] auto key = names_.push_back(std::move(name));
        LUSITANO_DEBUG_ASSERT(key == id, "Symbol names must be stored in order.");
    }
}

bool PythonGenerator::emit_stmt(const AstNode& node, FormatStream& out) {
    switch (node.type()) {
    case AstNodeType::FuncDecl:
        emit_func_decl(node, node.as<FuncDeclNode>(), out);
        return true;

    case AstNodeType::VarDecl: {
        const auto& var = node.as<VarDeclNode>();
        out.format("{} = {}\n", decl_name(node, var.name),
            var.init ? expr(var.init) : default_value(var.declared_type));
        return true;
    }

    case AstNodeType::ConstDecl: {
        const auto& decl = node.as<ConstDeclNode>();
        out.format("{} = {}\n", decl_name(node, decl.name),
            decl.init ? expr(decl.init) : default_value(decl.declared_type));
        return true;
    }

    case AstNodeType::Block:
        return emit_block_contents(node, out);

    case AstNodeType::If:
        emit_if(node.as<IfNode>(), out);
        return true;

    case AstNodeType::While: {
        const auto& stmt = node.as<WhileNode>();
        out.format("while {}:\n", expr(stmt.cond));
        emit_body(stmt.body.get(), out);
        return true;
    }

    case AstNodeType::ForRange:
        emit_for_range(node, node.as<ForRangeNode>(), out);
        return true;

    case AstNodeType::Return: {
        const auto& stmt = node.as<ReturnNode>();
        if (!in_function_) {
            out.format("pass  # retorna fora de funcao\n");
        } else if (stmt.value) {
            out.format("return {}\n", expr(stmt.value));
        } else {
            out.format("return\n");
        }
        return true;
    }

    case AstNodeType::Print:
        emit_print(node.as<PrintNode>(), out);
        return true;

    case AstNodeType::Read:
        emit_read(node.as<ReadNode>(), out);
        return true;

    case AstNodeType::ExprStmt: {
        const auto& stmt = node.as<ExprStmtNode>();
        if (!stmt.expr)
            return false;

        if (stmt.expr->is<AssignmentNode>()) {
            emit_assignment_stmt(*stmt.expr, out);
        } else {
            out.format("{}\n", expr(stmt.expr));
        }
        return true;
    }

    case AstNodeType::Error:
        out.format("pass  # erro de sintaxe\n");
        return true;

    case AstNodeType::Program:
        LUSITANO_ERROR("Programs cannot be nested.");

    case AstNodeType::Assignment:
        emit_assignment_stmt(node, out);
        return true;

    case AstNodeType::BinaryExpr:
    case AstNodeType::UnaryExpr:
    case AstNodeType::Call:
    case AstNodeType::Literal:
    case AstNodeType::Identifier:
        out.format("{}\n", expr(&node));
        return true;
    }

    LUSITANO_UNREACHABLE("Invalid node type.");
}

bool PythonGenerator::emit_block_contents(const AstNode& node, FormatStream& out) {
    if (!node.is<BlockNode>())
        return emit_stmt(node, out);

    bool emitted = false;
    for (const auto& stmt : node.as<BlockNode>().stmts) {
        if (stmt && emit_stmt(*stmt, out))
            emitted = true;
    }
    return emitted;
}

void PythonGenerator::emit_body(
    const AstNode* body, FormatStream& out, const std::vector<std::string>& prologue) {
    IndentStream indent(out, 4);

    bool emitted = false;
    for (const auto& line : prologue) {
        indent.format("{}\n", line);
        emitted = true;
    }
    if (body && emit_block_contents(*body, indent))
        emitted = true;

    if (!emitted)
        indent.format("pass\n");
}

void PythonGenerator::emit_func_decl(const AstNode& node, const FuncDeclNode& func, FormatStream& out) {
    std::vector<std::string> params;
    auto scope_id = symbols_.find_scope(node.id());
    if (scope_id) {
        for (auto param_id : symbols_[scope_id].entries()) {
            if (symbols_[param_id].kind() == SymbolKind::Parameter)
                params.push_back(names_[param_id]);
        }
    } else {
        for (const auto& param : func.params)
            params.push_back(sanitize(param.name));
    }

    out.format("def {}({}):\n", decl_name(node, func.name), absl::StrJoin(params, ", "));

    auto function = scope_id ? symbols_[scope_id].function() : SymbolId();
    auto reset_in_function = replace_value(in_function_, true);
    emit_body(func.body.get(), out, scope_statements(function, func.body.get()));
}

void PythonGenerator::emit_if(const IfNode& stmt, FormatStream& out) {
    out.format("if {}:\n", expr(stmt.cond));
    emit_body(stmt.then_block.get(), out);

    const AstNode* branch = stmt.else_branch.get();
    while (branch && branch->is<IfNode>()) {
        const auto& elif = branch->as<IfNode>();
        out.format("elif {}:\n", expr(elif.cond));
        emit_body(elif.then_block.get(), out);
        branch = elif.else_branch.get();
    }

    if (branch) {
        out.format("else:\n");
        emit_body(branch, out);
    }
}

void PythonGenerator::emit_for_range(const AstNode& node, const ForRangeNode& stmt, FormatStream& out) {
    const auto var = decl_name(node, stmt.var);
    const auto start = expr(stmt.start);
    const auto end = expr(stmt.end);

    // The upper bound is inclusive in the source language.
    if (!stmt.step) {
        out.format("for {} in range({}, {} + 1):\n", var, start, end);
    } else {
        const auto step = expr(stmt.step);
        switch (literal_sign(*stmt.step)) {
        case 1:
            out.format("for {} in range({}, {} + 1, {}):\n", var, start, end, step);
            break;
        case -1:
            out.format("for {} in range({}, {} - 1, {}):\n", var, start, end, step);
            break;
        default: {
            // The step is evaluated once, before the loop.
            auto step_var = step;
            if (!stmt.step->is<IdentifierNode>()) {
                step_var = fresh_name("_passo");
                out.format("{} = {}\n", step_var, step);
            }
            out.format("for {0} in range({1}, ({2} + 1) if {3} > 0 else ({2} - 1), {3}):\n", var,
                start, end, step_var);
            break;
        }
        }
    }
    emit_body(stmt.body.get(), out);
}

void PythonGenerator::emit_print(const PrintNode& stmt, FormatStream& out) {
    if (stmt.args.empty()) {
        out.format("print()\n");
        return;
    }

    std::vector<std::string> args;
    for (const auto& arg : stmt.args) {
        if (arg && arg->value_type() == ValueType::Logical) {
            args.push_back(fmt::format("('verdadeiro' if {} else 'falso')", expr(arg)));
        } else {
            args.push_back(expr(arg));
        }
    }
    out.format("print({}, sep='')\n", absl::StrJoin(args, ", "));
}

void PythonGenerator::emit_read(const ReadNode& stmt, FormatStream& out) {
    const auto target = ref_name(stmt.target.get());
    const auto prompt = stmt.prompt ? expr(stmt.prompt) : std::string("''");

    auto type = ValueType::Text;
    if (stmt.target) {
        if (auto symbol = symbols_.find_ref(stmt.target->id()))
            type = symbols_[symbol].type();
    }

    switch (type) {
    case ValueType::Integer:
        out.format("{} = int(input({}))\n", target, prompt);
        break;
    case ValueType::Real:
        out.format("{} = float(input({}))\n", target, prompt);
        break;
    case ValueType::Logical:
        out.format("{} = (input({}).strip() == 'verdadeiro')\n", target, prompt);
        break;
    default:
        out.format("{} = input({})\n", target, prompt);
        break;
    }
}

void PythonGenerator::emit_assignment_stmt(const AstNode& node, FormatStream& out) {
    // Chained assignments (a = b = c) map directly to python's chained assignment.
    const AstNode* current = &node;
    while (current && current->is<AssignmentNode>()) {
        const auto& assign = current->as<AssignmentNode>();
        out.format("{} = ", ref_name(assign.target.get()));
        current = assign.value.get();
    }
    out.format("{}\n", expr(current));
}

std::string PythonGenerator::expr(const AstNode* node) {
    if (!node)
        return "None";

    switch (node->type()) {
    case AstNodeType::Literal: {
        struct Visitor {
            std::string operator()(i64 value) const { return fmt::format("{}", value); }
            std::string operator()(f64 value) const { return python_real_literal(value); }
            std::string operator()(const std::string& value) const {
                return python_string_literal(value);
            }
            std::string operator()(bool value) const { return value ? "True" : "False"; }
        };
        return std::visit(Visitor(), node->as<LiteralNode>().value);
    }

    case AstNodeType::Identifier:
        return ref_name(node);

    case AstNodeType::BinaryExpr: {
        const auto& e = node->as<BinaryExprNode>();
        auto result = fmt::format("({} {} {})", expr(e.lhs),
            python_operator(e.op, node->value_type()), expr(e.rhs));

        // A negative exponent makes python return a float.
        if (e.op == BinaryOperator::Power && node->value_type() == ValueType::Integer)
            return fmt::format("int{}", result);
        return result;
    }

    case AstNodeType::UnaryExpr: {
        const auto& e = node->as<UnaryExprNode>();
        return fmt::format("({}{})", python_operator(e.op), expr(e.operand));
    }

    case AstNodeType::Call: {
        const auto& e = node->as<CallNode>();
        std::vector<std::string> args;
        args.reserve(e.args.size());
        for (const auto& arg : e.args)
            args.push_back(expr(arg));
        return fmt::format("{}({})", ref_name(e.callee.get()), absl::StrJoin(args, ", "));
    }

    case AstNodeType::Assignment: {
        const auto& e = node->as<AssignmentNode>();
        return fmt::format("({} := {})", ref_name(e.target.get()), expr(e.value));
    }

    case AstNodeType::Error:
        return "None";

    default:
        LUSITANO_ERROR("Node of type {} is not an expression.", node->type());
    }
}

std::string PythonGenerator::default_value(ValueType type) {
    switch (type) {
    case ValueType::Integer:
        return "0";
    case ValueType::Real:
        return "0.0";
    case ValueType::Text:
        return "''";
    case ValueType::Logical:
        return "False";
    default:
        return "None";
    }
}

std::string PythonGenerator::decl_name(const AstNode& decl, const std::string& source_name) {
    if (auto symbol = symbols_.find_decl(decl.id()))
        return names_[symbol];
    return sanitize(source_name);
}

std::string PythonGenerator::ref_name(const AstNode* ident) {
    if (!ident || !ident->is<IdentifierNode>())
        return "_";

    if (auto symbol = symbols_.find_ref(ident->id()))
        return names_[symbol];
    return sanitize(ident->as<IdentifierNode>().name);
}

std::string PythonGenerator::sanitize(const std::string& name) {
    if (is_python_reserved(name))
        return name + "_";
    return name;
}

std::string PythonGenerator::fresh_name(std::string_view base) {
    std::string name(base);
    int counter = 2;
    while (taken_.contains(name))
        name = fmt::format("{}_{}", base, counter++);
    taken_.insert(name);
    return name;
}

std::vector<std::string> PythonGenerator::scope_statements(SymbolId function, const AstNode* body) {
    std::vector<std::string> globals;
    std::vector<std::string> nonlocals;
    absl::flat_hash_set<SymbolId, UseHasher> seen;

    auto visit_target = [&](const AstNode* target) {
        if (!target)
            return;

        auto symbol_id = symbols_.find_ref(target->id());
        if (!symbol_id || !seen.insert(symbol_id).second)
            return;

        const auto owner = symbols_[symbols_[symbol_id].parent()].function();
        if (owner == function)
            return;

        if (!owner) {
            globals.push_back(names_[symbol_id]);
        } else {
            nonlocals.push_back(names_[symbol_id]);
        }
    };

    // Nested functions are not visited, they declare their own scope statements.
    auto walk = [&](const AstNode& node, auto& self) -> void {
        if (node.is<AssignmentNode>()) {
            visit_target(node.as<AssignmentNode>().target.get());
        } else if (node.is<ReadNode>()) {
            visit_target(node.as<ReadNode>().target.get());
        } else if (node.is<FuncDeclNode>()) {
            return;
        }
        traverse_children(node, [&](const AstNode& child) { self(child, self); });
    };
    if (body)
        walk(*body, walk);

    std::vector<std::string> result;
    if (!globals.empty())
        result.push_back(fmt::format("global {}", absl::StrJoin(globals, ", ")));
    if (!nonlocals.empty())
        result.push_back(fmt::format("nonlocal {}", absl::StrJoin(nonlocals, ", ")));
    return result;
}

std::string generate_python(const AstNode& program, const SymbolTable& symbols,
    std::string_view file_name, const PythonGenOptions& options) {
    LUSITANO_CHECK(program.is<ProgramNode>(), "The root node must be a program.");

    StringFormatStream out;
    PythonGenerator gen(symbols);
    gen.emit_program(program, file_name, options, out);
    return out.take_str();
}

} // namespace lusitano
