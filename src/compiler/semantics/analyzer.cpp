#include "compiler/semantics/analyzer.hpp"

#include "compiler/reset_value.hpp"

namespace lusitano {

namespace {

// The innermost function that is being analyzed.
struct FunctionContext {
    std::string name;
    ValueType return_type = ValueType::Void;
};

class Analyzer final {
public:
    explicit Analyzer(SymbolTable& symbols, Diagnostics& diag)
        : symbols_(symbols)
        , diag_(diag) {}

    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

    // Checks the node and annotates it with its type. Null nodes have the error type.
    ValueType check(AstNode* node);
    ValueType check(const AstPtr& node) { return check(node.get()); }

    ValueType visit_program(AstNode& node, ProgramNode& program);
    ValueType visit_func_decl(AstNode& node, FuncDeclNode& func);
    ValueType visit_var_decl(AstNode& node, VarDeclNode& var);
    ValueType visit_const_decl(AstNode& node, ConstDeclNode& decl);
    ValueType visit_block(AstNode& node, BlockNode& block);
    ValueType visit_if(AstNode& node, IfNode& stmt);
    ValueType visit_while(AstNode& node, WhileNode& stmt);
    ValueType visit_for_range(AstNode& node, ForRangeNode& stmt);
    ValueType visit_assignment(AstNode& node, AssignmentNode& expr);
    ValueType visit_binary_expr(AstNode& node, BinaryExprNode& expr);
    ValueType visit_unary_expr(AstNode& node, UnaryExprNode& expr);
    ValueType visit_call(AstNode& node, CallNode& expr);
    ValueType visit_literal(AstNode& node, LiteralNode& lit);
    ValueType visit_identifier(AstNode& node, IdentifierNode& ident);
    ValueType visit_return(AstNode& node, ReturnNode& stmt);
    ValueType visit_print(AstNode& node, PrintNode& stmt);
    ValueType visit_read(AstNode& node, ReadNode& stmt);
    ValueType visit_expr_stmt(AstNode& node, ExprStmtNode& stmt);
    ValueType visit_error(AstNode& node, ErrorNode& error);

private:
    // Checks the statements of a block in the current scope, without opening a new block scope.
    // Used for function and loop bodies, whose scope has already been entered.
    void check_body(AstNode* body);

    // Resolves the identifier node. Reports an error if the name is not declared.
    SymbolId resolve_ref(AstNode* ident);

    // Declares a symbol in the current scope. Reports an error if the name is already taken.
    SymbolId declare(const std::string& name, SymbolKind kind, ValueType type, AstNode& decl,
        const SourceRange& range);

    // Reports a type error if `actual` is not equal to `expected`. Error types are accepted silently.
    template<typename... Args>
    bool expect_type(ValueType expected, ValueType actual, const SourceRange& range,
        std::string_view format, const Args&... args);

    // Validates the declared type of a variable, constant or parameter.
    ValueType check_storable(ValueType type, std::string_view what, const std::string& name,
        const SourceRange& range);

    void check_condition(AstNode* cond, std::string_view stmt);

private:
    SymbolTable& symbols_;
    Diagnostics& diag_;
    std::optional<FunctionContext> function_;
};

} // namespace

ValueType Analyzer::check(AstNode* node) {
    if (!node)
        return ValueType::Error;

    const ValueType type = visit(*node, *this);
    node->value_type(type);
    return type;
}

ValueType Analyzer::visit_program(AstNode& node, ProgramNode& program) {
    LUSITANO_CHECK(symbols_.current_scope() == symbols_.global_scope(),
        "The analysis must start in the global scope.");
    auto program_scope = symbols_.find_scope(node.id());
    LUSITANO_CHECK(!program_scope || program_scope == symbols_.global_scope(),
        "The program node must be associated with the global scope.");

    for (const auto& item : program.items)
        check(item);
    return ValueType::Void;
}

ValueType Analyzer::visit_func_decl(AstNode& node, FuncDeclNode& func) {
    FunctionSignature signature;
    signature.return_type = func.return_type;
    for (const auto& param : func.params)
        signature.params.push_back(param.type);

    // Declared before the body is visited to make recursive calls possible.
    auto symbol = declare(func.name, SymbolKind::Function, ValueType::Function, node, node.range());
    if (symbol)
        symbols_[symbol].signature(signature);

    auto reset_function = replace_value(function_, FunctionContext{func.name, func.return_type});

    symbols_.enter(ScopeType::Function, node.id(), symbol);
    for (const auto& param : func.params) {
        auto type = check_storable(param.type, "Parameter", param.name, param.range);
        declare(param.name, SymbolKind::Parameter, type, node, param.range);
    }
    check_body(func.body.get());
    symbols_.exit();

    if (func.body && !node.has_error() && func.return_type != ValueType::Void
        && !always_returns(*func.body)) {
        diag_.reportf(DiagnosticKind::MissingReturn, node.range(),
            "Function '{}' may finish without returning a value of type {}.", func.name,
            func.return_type);
    }
    return ValueType::Void;
}

ValueType Analyzer::visit_var_decl(AstNode& node, VarDeclNode& var) {
    auto type = check_storable(var.declared_type, "Variable", var.name, node.range());

    // The initializer cannot see the new variable.
    if (var.init) {
        auto init_type = check(var.init);
        expect_type(type, init_type, var.init->range(),
            "Cannot initialize variable '{}' of type {} with a value of type {}.", var.name, type,
            init_type);
    }

    declare(var.name, SymbolKind::Variable, type, node, node.range());
    return ValueType::Void;
}

ValueType Analyzer::visit_const_decl(AstNode& node, ConstDeclNode& decl) {
    auto type = check_storable(decl.declared_type, "Constant", decl.name, node.range());

    if (decl.init) {
        auto init_type = check(decl.init);
        expect_type(type, init_type, decl.init->range(),
            "Cannot initialize constant '{}' of type {} with a value of type {}.", decl.name, type,
            init_type);
    }

    declare(decl.name, SymbolKind::Constant, type, node, node.range());
    return ValueType::Void;
}

ValueType Analyzer::visit_block(AstNode& node, BlockNode& block) {
    symbols_.enter(ScopeType::Block, node.id());
    for (const auto& stmt : block.stmts)
        check(stmt);
    symbols_.exit();
    return ValueType::Void;
}

ValueType Analyzer::visit_if(AstNode&, IfNode& stmt) {
    check_condition(stmt.cond.get(), "se");
    check(stmt.then_block);
    if (stmt.else_branch)
        check(stmt.else_branch);
    return ValueType::Void;
}

ValueType Analyzer::visit_while(AstNode&, WhileNode& stmt) {
    check_condition(stmt.cond.get(), "enquanto");
    check(stmt.body);
    return ValueType::Void;
}

ValueType Analyzer::visit_for_range(AstNode& node, ForRangeNode& stmt) {
    auto check_bound = [&](const AstPtr& expr, std::string_view what) {
        if (!expr)
            return;

        auto type = check(expr);
        expect_type(ValueType::Integer, type, expr->range(),
            "The {} of 'para' must be of type {}, found {}.", what, ValueType::Integer, type);
    };

    // The bounds are evaluated outside of the loop's scope.
    check_bound(stmt.start, "start");
    check_bound(stmt.end, "end");
    check_bound(stmt.step, "step");

    symbols_.enter(ScopeType::ForLoop, node.id());
    declare(stmt.var, SymbolKind::Variable, ValueType::Integer, node, node.range());
    check_body(stmt.body.get());
    symbols_.exit();
    return ValueType::Void;
}

ValueType Analyzer::visit_assignment(AstNode&, AssignmentNode& expr) {
    auto symbol_id = resolve_ref(expr.target.get());
    auto value_type = check(expr.value);
    if (!symbol_id)
        return ValueType::Error;

    const auto& symbol = symbols_[symbol_id];
    switch (symbol.kind()) {
    case SymbolKind::Constant:
        diag_.reportf(DiagnosticKind::ConstantReassignment, expr.target->range(),
            "Cannot assign to constant '{}'.", symbol.name());
        return ValueType::Error;
    case SymbolKind::Function:
        diag_.reportf(DiagnosticKind::TypeMismatch, expr.target->range(),
            "Cannot assign to function '{}'.", symbol.name());
        return ValueType::Error;
    case SymbolKind::Variable:
    case SymbolKind::Parameter:
        break;
    }

    if (!expr.value)
        return symbol.type();

    if (!expect_type(symbol.type(), value_type, expr.value->range(),
            "Cannot assign a value of type {} to '{}' of type {}.", value_type, symbol.name(),
            symbol.type()))
        return ValueType::Error;
    return symbol.type();
}

ValueType Analyzer::visit_binary_expr(AstNode& node, BinaryExprNode& expr) {
    auto lhs = check(expr.lhs);
    auto rhs = check(expr.rhs);
    if (lhs == ValueType::Error || rhs == ValueType::Error)
        return ValueType::Error;

    if (auto result = binary_result_type(expr.op, lhs, rhs))
        return *result;

    diag_.reportf(DiagnosticKind::TypeMismatch, node.range(),
        "Invalid operand types for '{}': {} and {}.", to_source(expr.op), lhs, rhs);
    return ValueType::Error;
}

ValueType Analyzer::visit_unary_expr(AstNode& node, UnaryExprNode& expr) {
    auto operand = check(expr.operand);
    if (operand == ValueType::Error)
        return ValueType::Error;

    if (auto result = unary_result_type(expr.op, operand))
        return *result;

    diag_.reportf(DiagnosticKind::TypeMismatch, node.range(), "Invalid operand type for '{}': {}.",
        to_source(expr.op), operand);
    return ValueType::Error;
}

ValueType Analyzer::visit_call(AstNode& node, CallNode& expr) {
    auto symbol_id = resolve_ref(expr.callee.get());

    std::vector<ValueType> arg_types;
    arg_types.reserve(expr.args.size());
    for (const auto& arg : expr.args)
        arg_types.push_back(check(arg));

    if (!symbol_id)
        return ValueType::Error;

    const auto& symbol = symbols_[symbol_id];
    if (symbol.kind() != SymbolKind::Function || !symbol.signature()) {
        diag_.reportf(DiagnosticKind::NotCallable, expr.callee->range(),
            "'{}' is not a function and cannot be called.", symbol.name());
        return ValueType::Error;
    }

    const auto& signature = *symbol.signature();
    if (signature.params.size() != arg_types.size()) {
        diag_.reportf(DiagnosticKind::ArgumentCountMismatch, node.range(),
            "Function '{}' expects {} argument(s), but {} were provided.", symbol.name(),
            signature.params.size(), arg_types.size());
        return signature.return_type;
    }

    for (size_t i = 0; i < arg_types.size(); ++i) {
        expect_type(signature.params[i], arg_types[i], expr.args[i]->range(),
            "Argument {} of '{}' must be of type {}, found {}.", i + 1, symbol.name(),
            signature.params[i], arg_types[i]);
    }
    return signature.return_type;
}

ValueType Analyzer::visit_literal(AstNode&, LiteralNode& lit) {
    struct Visitor {
        ValueType operator()(i64) const { return ValueType::Integer; }
        ValueType operator()(f64) const { return ValueType::Real; }
        ValueType operator()(const std::string&) const { return ValueType::Text; }
        ValueType operator()(bool) const { return ValueType::Logical; }
    };
    return std::visit(Visitor(), lit.value);
}

ValueType Analyzer::visit_identifier(AstNode& node, IdentifierNode& ident) {
    auto symbol_id = resolve_ref(&node);
    if (!symbol_id)
        return ValueType::Error;

    const auto& symbol = symbols_[symbol_id];
    if (symbol.kind() == SymbolKind::Function) {
        diag_.reportf(DiagnosticKind::TypeMismatch, node.range(),
            "Function '{}' cannot be used as a value.", ident.name);
        return ValueType::Error;
    }
    return symbol.type();
}

ValueType Analyzer::visit_return(AstNode& node, ReturnNode& stmt) {
    auto value_type = check(stmt.value);

    if (!function_) {
        diag_.report(DiagnosticKind::ReturnOutsideFunction, node.range(),
            "'retorna' is only allowed inside a function.");
        return ValueType::Void;
    }

    const auto& func = *function_;
    if (func.return_type == ValueType::Void) {
        if (stmt.value) {
            diag_.reportf(DiagnosticKind::ReturnTypeMismatch, stmt.value->range(),
                "Function '{}' does not return a value.", func.name);
        }
        return ValueType::Void;
    }

    if (!stmt.value) {
        diag_.reportf(DiagnosticKind::ReturnTypeMismatch, node.range(),
            "Function '{}' must return a value of type {}.", func.name, func.return_type);
        return ValueType::Void;
    }

    if (value_type != ValueType::Error && value_type != func.return_type) {
        diag_.reportf(DiagnosticKind::ReturnTypeMismatch, stmt.value->range(),
            "Function '{}' must return a value of type {}, found {}.", func.name,
            func.return_type, value_type);
    }
    return ValueType::Void;
}

ValueType Analyzer::visit_print(AstNode&, PrintNode& stmt) {
    for (const auto& arg : stmt.args) {
        auto type = check(arg);
        if (arg && type == ValueType::Void) {
            diag_.report(DiagnosticKind::TypeMismatch, arg->range(),
                "Cannot print an expression of type vazio.");
        }
    }
    return ValueType::Void;
}

ValueType Analyzer::visit_read(AstNode&, ReadNode& stmt) {
    if (stmt.prompt) {
        auto prompt_type = check(stmt.prompt);
        expect_type(ValueType::Text, prompt_type, stmt.prompt->range(),
            "The prompt of 'leia' must be of type {}, found {}.", ValueType::Text, prompt_type);
    }

    auto symbol_id = resolve_ref(stmt.target.get());
    if (!symbol_id)
        return ValueType::Void;

    const auto& symbol = symbols_[symbol_id];
    if (symbol.kind() == SymbolKind::Constant) {
        diag_.reportf(DiagnosticKind::ConstantReassignment, stmt.target->range(),
            "Cannot read a value into constant '{}'.", symbol.name());
    } else if (symbol.kind() == SymbolKind::Function) {
        diag_.reportf(DiagnosticKind::TypeMismatch, stmt.target->range(),
            "Cannot read a value into function '{}'.", symbol.name());
    }
    return ValueType::Void;
}

ValueType Analyzer::visit_expr_stmt(AstNode&, ExprStmtNode& stmt) {
    check(stmt.expr);
    return ValueType::Void;
}

ValueType Analyzer::visit_error(AstNode&, ErrorNode&) {
    return ValueType::Error;
}

void Analyzer::check_body(AstNode* body) {
    if (!body)
        return;

    if (body->is<BlockNode>()) {
        for (const auto& stmt : body->as<BlockNode>().stmts)
            check(stmt);
        body->value_type(ValueType::Void);
        return;
    }

    check(body);
}

SymbolId Analyzer::resolve_ref(AstNode* ident) {
    if (!ident || !ident->is<IdentifierNode>())
        return SymbolId();

    const auto& name = ident->as<IdentifierNode>().name;
    auto symbol_id = symbols_.resolve(name);
    if (!symbol_id) {
        diag_.reportf(
            DiagnosticKind::UndeclaredIdentifier, ident->range(), "Undeclared identifier '{}'.", name);
        ident->value_type(ValueType::Error);
        return SymbolId();
    }

    symbols_.register_ref(ident->id(), symbol_id);
    ident->value_type(symbols_[symbol_id].type());
    return symbol_id;
}

SymbolId Analyzer::declare(const std::string& name, SymbolKind kind, ValueType type,
    AstNode& decl, const SourceRange& range) {
    auto symbol_id = symbols_.declare(name, kind, type, decl.id());
    if (!symbol_id) {
        diag_.reportf(DiagnosticKind::DuplicateDeclaration, range,
            "'{}' has already been declared in this scope.", name);
        return SymbolId();
    }

    // Parameters are registered through their function's scope.
    if (kind != SymbolKind::Parameter)
        symbols_.register_decl(decl.id(), symbol_id);
    return symbol_id;
}

template<typename... Args>
bool Analyzer::expect_type(ValueType expected, ValueType actual, const SourceRange& range,
    std::string_view format, const Args&... args) {
    if (expected == ValueType::Error || actual == ValueType::Error || expected == actual)
        return true;

    diag_.reportf(DiagnosticKind::TypeMismatch, range, format, args...);
    return false;
}

ValueType Analyzer::check_storable(
    ValueType type, std::string_view what, const std::string& name, const SourceRange& range) {
    if (type == ValueType::Error || is_storable(type))
        return type;

    diag_.reportf(DiagnosticKind::InvalidType, range, "{} '{}' cannot have type {}.", what, name, type);
    return ValueType::Error;
}

void Analyzer::check_condition(AstNode* cond, std::string_view stmt) {
    if (!cond)
        return;

    auto type = check(cond);
    expect_type(ValueType::Logical, type, cond->range(),
        "The condition of '{}' must be of type {}, found {}.", stmt, ValueType::Logical, type);
}

void analyze_program(AstNode& program, SymbolTable& symbols, Diagnostics& diag) {
    LUSITANO_CHECK(program.is<ProgramNode>(), "The root node must be a program.");

    Analyzer analyzer(symbols, diag);
    analyzer.check(&program);
}

} // namespace lusitano
