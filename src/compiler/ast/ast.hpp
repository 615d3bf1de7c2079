#ifndef LUSITANO_COMPILER_AST_AST_HPP
#define LUSITANO_COMPILER_AST_AST_HPP

#include "common/assert.hpp"
#include "common/defs.hpp"
#include "common/entities/entity_id.hpp"
#include "common/error.hpp"
#include "common/format.hpp"
#include "compiler/ast/operators.hpp"
#include "compiler/semantics/types.hpp"
#include "compiler/source_range.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace lusitano {

LUSITANO_DEFINE_ENTITY_ID(AstId, u32)

/// The closed set of node kinds. The order matches the alternatives of `AstNode::Data`.
enum class AstNodeType : u8 {
    Program,
    FuncDecl,
    VarDecl,
    ConstDecl,
    Block,
    If,
    While,
    ForRange,
    Assignment,
    BinaryExpr,
    UnaryExpr,
    Call,
    Literal,
    Identifier,
    Return,
    Print,
    Read,
    ExprStmt,
    Error,
};

std::string_view to_string(AstNodeType type);

} // namespace lusitano

LUSITANO_ENABLE_FREE_TO_STRING(lusitano::AstNodeType)

namespace lusitano {

class AstNode;

/// Nodes exclusively own their children.
using AstPtr = std::unique_ptr<AstNode>;
using AstNodeList = std::vector<AstPtr>;

/// A function parameter.
struct AstParam final {
    std::string name;
    ValueType type = ValueType::Error;
    SourceRange range;
};

/// The root of the tree: all top level declarations and statements.
struct ProgramNode final {
    AstNodeList items;
};

/// `funcao name(params): type { ... }`. Functions without an explicit return type are `vazio`.
struct FuncDeclNode final {
    std::string name;
    std::vector<AstParam> params;
    ValueType return_type = ValueType::Void;
    AstPtr body;
};

/// `var name: type (= init)?`. `init` may be null.
struct VarDeclNode final {
    std::string name;
    ValueType declared_type = ValueType::Error;
    AstPtr init;
};

/// `const name: type = init`
struct ConstDeclNode final {
    std::string name;
    ValueType declared_type = ValueType::Error;
    AstPtr init;
};

struct BlockNode final {
    AstNodeList stmts;
};

/// `se (cond) { ... } senao ...`. The else branch is either null, a block
/// or another `If` node (for else-if chains).
struct IfNode final {
    AstPtr cond;
    AstPtr then_block;
    AstPtr else_branch;
};

struct WhileNode final {
    AstPtr cond;
    AstPtr body;
};

/// `para var de start ate end (passo step)? { ... }`. Both bounds are inclusive,
/// `step` may be null.
struct ForRangeNode final {
    std::string var;
    AstPtr start;
    AstPtr end;
    AstPtr step;
    AstPtr body;
};

/// `target = value`. The target is always an identifier node.
struct AssignmentNode final {
    AstPtr target;
    AstPtr value;
};

struct BinaryExprNode final {
    BinaryOperator op = BinaryOperator::Plus;
    AstPtr lhs;
    AstPtr rhs;
};

struct UnaryExprNode final {
    UnaryOperator op = UnaryOperator::Minus;
    AstPtr operand;
};

/// `callee(args...)`. The callee is always an identifier node.
struct CallNode final {
    AstPtr callee;
    AstNodeList args;
};

/// Literal values. The alternatives correspond to `inteiro`, `real`, `texto` and `logico`.
using LiteralValue = std::variant<i64, f64, std::string, bool>;

struct LiteralNode final {
    LiteralValue value;
};

struct IdentifierNode final {
    std::string name;
};

/// `retorna value?`. `value` may be null.
struct ReturnNode final {
    AstPtr value;
};

/// `escreva(args...)`
struct PrintNode final {
    AstNodeList args;
};

/// `leia(prompt?, target)`. `prompt` may be null, the target is an identifier node.
struct ReadNode final {
    AstPtr prompt;
    AstPtr target;
};

/// An expression evaluated for its side effects.
struct ExprStmtNode final {
    AstPtr expr;
};

/// Placeholder for a region of source code that could not be parsed.
struct ErrorNode final {};

/// A node in the abstract syntax tree.
class AstNode final {
public:
    using Data = std::variant<ProgramNode, FuncDeclNode, VarDeclNode, ConstDeclNode, BlockNode,
        IfNode, WhileNode, ForRangeNode, AssignmentNode, BinaryExprNode, UnaryExprNode, CallNode,
        LiteralNode, IdentifierNode, ReturnNode, PrintNode, ReadNode, ExprStmtNode, ErrorNode>;

    AstNode(AstId id, const SourceRange& range, Data data);
    ~AstNode();

    AstNode(const AstNode&) = delete;
    AstNode& operator=(const AstNode&) = delete;

    AstNodeType type() const { return static_cast<AstNodeType>(data_.index()); }

    /// The node's id. Unique within the tree.
    AstId id() const { return id_; }

    /// The node's entire source range, from start to finish. Contains all syntactic children.
    const SourceRange& range() const { return range_; }
    void range(const SourceRange& range) { range_ = range; }

    /// The resolved static type of this node. Assigned by the semantic analysis.
    /// Statements and declarations receive the type `vazio`.
    ValueType value_type() const { return value_type_; }
    void value_type(ValueType type) { value_type_ = type; }

    /// True if this node contains a syntax error.
    bool has_error() const { return has_error_; }
    void has_error(bool value) { has_error_ = value; }

    /// Returns true if the node holds the given node data type.
    template<typename T>
    bool is() const {
        return std::holds_alternative<T>(data_);
    }

    /// Returns the node data. Throws if the node holds a different type.
    template<typename T>
    T& as() {
        LUSITANO_CHECK(is<T>(), "Invalid ast node access: node is a {}.", type());
        return std::get<T>(data_);
    }

    template<typename T>
    const T& as() const {
        LUSITANO_CHECK(is<T>(), "Invalid ast node access: node is a {}.", type());
        return std::get<T>(data_);
    }

    Data& data() { return data_; }
    const Data& data() const { return data_; }

private:
    AstId id_;
    SourceRange range_;
    ValueType value_type_ = ValueType::Error;
    bool has_error_ = false;
    Data data_;
};

/// Visits the given node by invoking the visitor function that corresponds to the node's type,
/// e.g. `visitor.visit_program(node, node_data, args...)`.
template<typename Node, typename Visitor, typename... Args>
decltype(auto) visit(Node& node, Visitor&& vis, Args&&... args) {
    static_assert(std::is_same_v<std::remove_const_t<Node>, AstNode>);

    switch (node.type()) {
#define LUSITANO_VISIT(Type, DataType, func) \
    case AstNodeType::Type:                  \
        return vis.func(node, node.template as<DataType>(), std::forward<Args>(args)...);

        LUSITANO_VISIT(Program, ProgramNode, visit_program)
        LUSITANO_VISIT(FuncDecl, FuncDeclNode, visit_func_decl)
        LUSITANO_VISIT(VarDecl, VarDeclNode, visit_var_decl)
        LUSITANO_VISIT(ConstDecl, ConstDeclNode, visit_const_decl)
        LUSITANO_VISIT(Block, BlockNode, visit_block)
        LUSITANO_VISIT(If, IfNode, visit_if)
        LUSITANO_VISIT(While, WhileNode, visit_while)
        LUSITANO_VISIT(ForRange, ForRangeNode, visit_for_range)
        LUSITANO_VISIT(Assignment, AssignmentNode, visit_assignment)
        LUSITANO_VISIT(BinaryExpr, BinaryExprNode, visit_binary_expr)
        LUSITANO_VISIT(UnaryExpr, UnaryExprNode, visit_unary_expr)
        LUSITANO_VISIT(Call, CallNode, visit_call)
        LUSITANO_VISIT(Literal, LiteralNode, visit_literal)
        LUSITANO_VISIT(Identifier, IdentifierNode, visit_identifier)
        LUSITANO_VISIT(Return, ReturnNode, visit_return)
        LUSITANO_VISIT(Print, PrintNode, visit_print)
        LUSITANO_VISIT(Read, ReadNode, visit_read)
        LUSITANO_VISIT(ExprStmt, ExprStmtNode, visit_expr_stmt)
        LUSITANO_VISIT(Error, ErrorNode, visit_error)

#undef LUSITANO_VISIT
    }

    LUSITANO_UNREACHABLE("Invalid node type.");
}

/// Invokes the callback for every direct child of the given node, in source order.
/// Null children (e.g. optional initializers) are skipped.
template<typename Callback>
void traverse_children(const AstNode& node, Callback&& callback);

/// Returns the name of an identifier node.
const std::string& identifier_name(const AstNode& node);

/// Returns true if the node is a statement or declaration that always executes `retorna`
/// on every path through it.
bool always_returns(const AstNode& node);

template<typename Callback>
void traverse_children(const AstNode& node, Callback&& callback) {
    auto child = [&](const AstPtr& ptr) {
        if (ptr)
            callback(*ptr);
    };
    auto children = [&](const AstNodeList& list) {
        for (const auto& ptr : list)
            child(ptr);
    };

    switch (node.type()) {
    case AstNodeType::Program:
        children(node.as<ProgramNode>().items);
        return;
    case AstNodeType::FuncDecl:
        child(node.as<FuncDeclNode>().body);
        return;
    case AstNodeType::VarDecl:
        child(node.as<VarDeclNode>().init);
        return;
    case AstNodeType::ConstDecl:
        child(node.as<ConstDeclNode>().init);
        return;
    case AstNodeType::Block:
        children(node.as<BlockNode>().stmts);
        return;
    case AstNodeType::If: {
        const auto& d = node.as<IfNode>();
        child(d.cond);
        child(d.then_block);
        child(d.else_branch);
        return;
    }
    case AstNodeType::While: {
        const auto& d = node.as<WhileNode>();
        child(d.cond);
        child(d.body);
        return;
    }
    case AstNodeType::ForRange: {
        const auto& d = node.as<ForRangeNode>();
        child(d.start);
        child(d.end);
        child(d.step);
        child(d.body);
        return;
    }
    case AstNodeType::Assignment: {
        const auto& d = node.as<AssignmentNode>();
        child(d.target);
        child(d.value);
        return;
    }
    case AstNodeType::BinaryExpr: {
        const auto& d = node.as<BinaryExprNode>();
        child(d.lhs);
        child(d.rhs);
        return;
    }
    case AstNodeType::UnaryExpr:
        child(node.as<UnaryExprNode>().operand);
        return;
    case AstNodeType::Call: {
        const auto& d = node.as<CallNode>();
        child(d.callee);
        children(d.args);
        return;
    }
    case AstNodeType::Return:
        child(node.as<ReturnNode>().value);
        return;
    case AstNodeType::Print:
        children(node.as<PrintNode>().args);
        return;
    case AstNodeType::Read: {
        const auto& d = node.as<ReadNode>();
        child(d.prompt);
        child(d.target);
        return;
    }
    case AstNodeType::ExprStmt:
        child(node.as<ExprStmtNode>().expr);
        return;
    case AstNodeType::Literal:
    case AstNodeType::Identifier:
    case AstNodeType::Error:
        return;
    }

    LUSITANO_UNREACHABLE("Invalid node type.");
}

} // namespace lusitano

#endif // LUSITANO_COMPILER_AST_AST_HPP
