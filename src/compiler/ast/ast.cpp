#include "compiler/ast/ast.hpp"

#include <algorithm>

namespace lusitano {

std::string_view to_string(AstNodeType type) {
    switch (type) {
#define LUSITANO_CASE(T)  \
    case AstNodeType::T: \
        return #T;

        LUSITANO_CASE(Program)
        LUSITANO_CASE(FuncDecl)
        LUSITANO_CASE(VarDecl)
        LUSITANO_CASE(ConstDecl)
        LUSITANO_CASE(Block)
        LUSITANO_CASE(If)
        LUSITANO_CASE(While)
        LUSITANO_CASE(ForRange)
        LUSITANO_CASE(Assignment)
        LUSITANO_CASE(BinaryExpr)
        LUSITANO_CASE(UnaryExpr)
        LUSITANO_CASE(Call)
        LUSITANO_CASE(Literal)
        LUSITANO_CASE(Identifier)
        LUSITANO_CASE(Return)
        LUSITANO_CASE(Print)
        LUSITANO_CASE(Read)
        LUSITANO_CASE(ExprStmt)
        LUSITANO_CASE(Error)

#undef LUSITANO_CASE
    }
    LUSITANO_UNREACHABLE("Invalid node type.");
}

AstNode::AstNode(AstId id, const SourceRange& range, Data data)
    : id_(id)
    , range_(range)
    , data_(std::move(data)) {}

AstNode::~AstNode() = default;

const std::string& identifier_name(const AstNode& node) {
    return node.as<IdentifierNode>().name;
}

bool always_returns(const AstNode& node) {
    switch (node.type()) {
    case AstNodeType::Return:
        return true;
    case AstNodeType::Block: {
        const auto& stmts = node.as<BlockNode>().stmts;
        return std::any_of(stmts.begin(), stmts.end(),
            [](const AstPtr& stmt) { return stmt && always_returns(*stmt); });
    }
    case AstNodeType::If: {
        const auto& d = node.as<IfNode>();
        return d.then_block && d.else_branch && always_returns(*d.then_block)
               && always_returns(*d.else_branch);
    }
    default:
        // Loops may execute zero times.
        return false;
    }
}

} // namespace lusitano
