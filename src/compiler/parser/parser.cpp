#include "compiler/parser/parser.hpp"

#include "common/defs.hpp"
#include "common/error.hpp"
#include "compiler/parser/operators.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace lusitano {

static constexpr size_t max_call_args = 255;

static std::string unexpected_message(TokenTypes expected, TokenType seen) {
    const size_t size = expected.size();

    fmt::memory_buffer buf;
    fmt::format_to(std::back_inserter(buf), "Unexpected {}", to_description(seen));
    if (size > 0 && size <= 3) {
        fmt::format_to(std::back_inserter(buf), ", expected {}", expected.to_description());
    }
    fmt::format_to(std::back_inserter(buf), ".");
    return fmt::to_string(buf);
}

// Keywords that start a statement or a declaration. The parser synchronizes
// on these tokens after a syntax error.
static const TokenTypes STMT_FIRST = {
    TokenType::KwFuncao,
    TokenType::KwVar,
    TokenType::KwConst,
    TokenType::KwSe,
    TokenType::KwEnquanto,
    TokenType::KwPara,
    TokenType::KwRetorna,
    TokenType::KwEscreva,
    TokenType::KwLeia,
};

static const TokenTypes TYPE_FIRST = {
    TokenType::KwInteiro,
    TokenType::KwReal,
    TokenType::KwTexto,
    TokenType::KwLogico,
    TokenType::KwVazio,
};

AstIdGenerator::AstIdGenerator()
    : next_id_(0) {}

AstId AstIdGenerator::generate() {
    LUSITANO_CHECK(next_id_ != AstId::invalid_value, "Generated too many ast ids.");
    return AstId(next_id_++);
}

Parser::Parser(std::vector<Token> tokens, Diagnostics& diag)
    : tokens_(std::move(tokens))
    , diag_(diag) {
    LUSITANO_CHECK(!tokens_.empty() && tokens_.back().type() == TokenType::Eof,
        "The token sequence must end with an end of file token.");
}

AstPtr Parser::parse_program() {
    auto start = mark_position();
    ProgramNode program;

    while (!accept(TokenType::Eof)) {
        if (accept(TokenType::Semicolon))
            continue;

        if (auto brace = accept({TokenType::RightBrace, TokenType::RightParen})) {
            diag_.reportf(DiagnosticKind::SyntaxError, brace->range(), "Unbalanced {}.",
                to_description(brace->type()));
            continue;
        }

        program.items.push_back(parse_item({}));
    }

    return make_node(std::move(program), start, false);
}

AstPtr Parser::parse_item(TokenTypes sync) {
    const auto start = mark_position();
    const size_t start_index = pos_;

    auto item = parse_item_inner(sync.union_with(STMT_FIRST));
    if (item) {
        accept(TokenType::Semicolon);
        return item.take_node();
    }

    // The partial node is dropped, the whole region becomes an error node.
    recover_statement(start_index, sync);
    return make_node(ErrorNode{}, start, true);
}

Parser::Result Parser::parse_item_inner(TokenTypes sync) {
    switch (head().type()) {
    case TokenType::KwFuncao:
        return parse_func_decl(sync);
    case TokenType::KwVar:
        return parse_var_decl(sync);
    case TokenType::KwConst:
        return parse_const_decl(sync);
    default:
        return parse_stmt(sync);
    }
}

Parser::Result Parser::parse_func_decl(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwFuncao))
        return syntax_error();

    FuncDeclNode func;

    auto name = expect(TokenType::Identifier);
    if (!name)
        return partial(std::move(func), start);
    func.name = name->data().as_string();

    if (!expect(TokenType::LeftParen) || !parse_param_list(func.params, sync))
        return partial(std::move(func), start);

    if (accept(TokenType::Colon)) {
        auto type = parse_type();
        if (!type)
            return partial(std::move(func), start);
        func.return_type = *type;
    }

    auto body = parse_block(sync);
    func.body = body.take_node();
    if (!body)
        return partial(std::move(func), start);

    return complete(std::move(func), start);
}

bool Parser::parse_param_list(std::vector<AstParam>& params, TokenTypes sync) {
    if (accept(TokenType::RightParen))
        return true;

    while (1) {
        auto param_start = mark_position();

        auto name = expect(TokenType::Identifier);
        if (!name || !expect(TokenType::Colon))
            return false;

        auto type = parse_type();
        if (!type)
            return false;

        params.push_back(AstParam{name->data().as_string(), *type, range_from(param_start)});

        auto next = expect({TokenType::Comma, TokenType::RightParen});
        if (!next)
            return false;
        if (next->type() == TokenType::RightParen)
            return true;
    }
}

Parser::Result Parser::parse_var_decl(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwVar))
        return syntax_error();

    VarDeclNode var;

    auto name = expect(TokenType::Identifier);
    if (!name)
        return partial(std::move(var), start);
    var.name = name->data().as_string();

    if (!expect(TokenType::Colon))
        return partial(std::move(var), start);

    auto type = parse_type();
    if (!type)
        return partial(std::move(var), start);
    var.declared_type = *type;

    if (accept(TokenType::Equals)) {
        auto init = parse_expr(sync);
        var.init = init.take_node();
        if (!init)
            return partial(std::move(var), start);
    }

    return complete(std::move(var), start);
}

Parser::Result Parser::parse_const_decl(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwConst))
        return syntax_error();

    ConstDeclNode decl;

    auto name = expect(TokenType::Identifier);
    if (!name)
        return partial(std::move(decl), start);
    decl.name = name->data().as_string();

    if (!expect(TokenType::Colon))
        return partial(std::move(decl), start);

    auto type = parse_type();
    if (!type)
        return partial(std::move(decl), start);
    decl.declared_type = *type;

    if (!expect(TokenType::Equals))
        return partial(std::move(decl), start);

    auto init = parse_expr(sync);
    decl.init = init.take_node();
    if (!init)
        return partial(std::move(decl), start);

    return complete(std::move(decl), start);
}

std::optional<ValueType> Parser::parse_type() {
    auto tok = accept(TYPE_FIRST);
    if (!tok) {
        report_unexpected("a type name");
        return {};
    }

    switch (tok->type()) {
    case TokenType::KwInteiro:
        return ValueType::Integer;
    case TokenType::KwReal:
        return ValueType::Real;
    case TokenType::KwTexto:
        return ValueType::Text;
    case TokenType::KwLogico:
        return ValueType::Logical;
    case TokenType::KwVazio:
        return ValueType::Void;
    default:
        LUSITANO_UNREACHABLE("Unhandled type token.");
    }
}

Parser::Result Parser::parse_stmt(TokenTypes sync) {
    switch (head().type()) {
    case TokenType::KwSe:
        return parse_if_stmt(sync);
    case TokenType::KwEnquanto:
        return parse_while_stmt(sync);
    case TokenType::KwPara:
        return parse_for_stmt(sync);
    case TokenType::KwRetorna:
        return parse_return_stmt(sync);
    case TokenType::KwEscreva:
        return parse_print_stmt(sync);
    case TokenType::KwLeia:
        return parse_read_stmt(sync);
    case TokenType::LeftBrace:
        return parse_block(sync);
    default:
        return parse_expr_stmt(sync);
    }
}

Parser::Result Parser::parse_block(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::LeftBrace))
        return syntax_error();

    BlockNode block;
    while (!accept(TokenType::RightBrace)) {
        if (head().type() == TokenType::Eof) {
            expect(TokenType::RightBrace);
            return partial(std::move(block), start);
        }

        if (accept(TokenType::Semicolon))
            continue;

        block.stmts.push_back(parse_item(sync.union_with(TokenType::RightBrace)));
    }

    return complete(std::move(block), start);
}

Parser::Result Parser::parse_if_stmt(TokenTypes sync) {
    auto start = mark_position();
    if (!expect({TokenType::KwSe, TokenType::KwSenaose}))
        return syntax_error();

    IfNode stmt;
    bool has_error = false;

    if (!expect(TokenType::LeftParen))
        return partial(std::move(stmt), start);

    auto cond_start = mark_position();
    auto cond = parse_expr(sync);
    stmt.cond = take_or_error(cond, cond_start);
    if (!cond || !expect(TokenType::RightParen)) {
        // Continue with the body if it can be found.
        has_error = true;
        recover_consume(TokenType::RightParen, sync.union_with(TokenType::LeftBrace));
        if (!recover_seek(TokenType::LeftBrace, sync))
            return partial(std::move(stmt), start);
    }

    auto then_block = parse_block(sync.union_with({TokenType::KwSenao, TokenType::KwSenaose}));
    stmt.then_block = then_block.take_node();
    if (!then_block)
        return partial(std::move(stmt), start);

    if (head().type() == TokenType::KwSenaose) {
        auto nested = parse_if_stmt(sync);
        stmt.else_branch = nested.take_node();
        if (!nested)
            return partial(std::move(stmt), start);
    } else if (accept(TokenType::KwSenao)) {
        auto else_branch = head().type() == TokenType::KwSe ? parse_if_stmt(sync)
                                                             : parse_block(sync);
        stmt.else_branch = else_branch.take_node();
        if (!else_branch)
            return partial(std::move(stmt), start);
    }

    return complete(std::move(stmt), start, has_error);
}

Parser::Result Parser::parse_while_stmt(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwEnquanto))
        return syntax_error();

    WhileNode stmt;
    bool has_error = false;

    if (!expect(TokenType::LeftParen))
        return partial(std::move(stmt), start);

    auto cond_start = mark_position();
    auto cond = parse_expr(sync);
    stmt.cond = take_or_error(cond, cond_start);
    if (!cond || !expect(TokenType::RightParen)) {
        has_error = true;
        recover_consume(TokenType::RightParen, sync.union_with(TokenType::LeftBrace));
        if (!recover_seek(TokenType::LeftBrace, sync))
            return partial(std::move(stmt), start);
    }

    auto body = parse_block(sync);
    stmt.body = body.take_node();
    if (!body)
        return partial(std::move(stmt), start);

    return complete(std::move(stmt), start, has_error);
}

Parser::Result Parser::parse_for_stmt(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwPara))
        return syntax_error();

    ForRangeNode stmt;

    auto var = expect(TokenType::Identifier);
    if (!var)
        return partial(std::move(stmt), start);
    stmt.var = var->data().as_string();

    if (!expect(TokenType::KwDe))
        return partial(std::move(stmt), start);

    auto first = parse_expr(sync.union_with(TokenType::KwAte));
    stmt.start = first.take_node();
    if (!first || !expect(TokenType::KwAte))
        return partial(std::move(stmt), start);

    auto last = parse_expr(sync.union_with({TokenType::KwPasso, TokenType::LeftBrace}));
    stmt.end = last.take_node();
    if (!last)
        return partial(std::move(stmt), start);

    if (accept(TokenType::KwPasso)) {
        auto step = parse_expr(sync.union_with(TokenType::LeftBrace));
        stmt.step = step.take_node();
        if (!step)
            return partial(std::move(stmt), start);
    }

    auto body = parse_block(sync);
    stmt.body = body.take_node();
    if (!body)
        return partial(std::move(stmt), start);

    return complete(std::move(stmt), start);
}

Parser::Result Parser::parse_return_stmt(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwRetorna))
        return syntax_error();

    ReturnNode stmt;

    const TokenType next = head().type();
    const bool has_value = !(next == TokenType::Semicolon || next == TokenType::RightBrace
                             || next == TokenType::Eof || STMT_FIRST.contains(next));
    if (has_value) {
        auto value = parse_expr(sync);
        stmt.value = value.take_node();
        if (!value)
            return partial(std::move(stmt), start);
    }

    return complete(std::move(stmt), start);
}

Parser::Result Parser::parse_print_stmt(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwEscreva))
        return syntax_error();

    PrintNode stmt;
    if (!expect(TokenType::LeftParen) || !parse_call_args(stmt.args, sync))
        return partial(std::move(stmt), start);

    return complete(std::move(stmt), start);
}

Parser::Result Parser::parse_read_stmt(TokenTypes sync) {
    auto start = mark_position();
    if (!expect(TokenType::KwLeia))
        return syntax_error();

    ReadNode stmt;
    if (!expect(TokenType::LeftParen))
        return partial(std::move(stmt), start);

    // `leia(x)` has no prompt, otherwise the first argument is the prompt.
    const bool has_prompt = !(head().type() == TokenType::Identifier
                              && peek(1).type() == TokenType::RightParen);
    if (has_prompt) {
        auto prompt = parse_expr(sync.union_with(TokenType::Comma));
        stmt.prompt = prompt.take_node();
        if (!prompt || !expect(TokenType::Comma))
            return partial(std::move(stmt), start);
    }

    auto target = expect(TokenType::Identifier);
    if (!target)
        return partial(std::move(stmt), start);
    stmt.target = make_identifier(target->data().as_string(), target->range());

    if (!expect(TokenType::RightParen))
        return partial(std::move(stmt), start);

    return complete(std::move(stmt), start);
}

Parser::Result Parser::parse_expr_stmt(TokenTypes sync) {
    auto start = mark_position();

    auto expr = parse_expr(sync);
    if (!expr)
        return syntax_error(expr.take_node());

    return complete(ExprStmtNode{expr.take_node()}, start);
}

Parser::Result Parser::parse_expr(TokenTypes sync) {
    return parse_expr(assignment_precedence, sync);
}

Parser::Result Parser::parse_expr(int min_precedence, TokenTypes sync) {
    LUSITANO_DEBUG_ASSERT(min_precedence >= 0, "Precedence must be non-negative.");

    auto left = parse_prefix_expr(sync);
    if (!left)
        return left;

    return parse_infix_expr(left.take_node(), min_precedence, sync);
}

Parser::Result Parser::parse_infix_expr(AstPtr left, int min_precedence, TokenTypes sync) {
    while (1) {
        const TokenType op_type = head().type();
        const int op_precedence = infix_operator_precedence(op_type);
        if (op_precedence == -1 || op_precedence < min_precedence)
            break;

        const u32 start = left->range().begin();
        advance();

        if (is_assignment_operator(op_type)) {
            // Assignments are right associative.
            auto right = parse_expr(op_precedence, sync);
            if (!right)
                return syntax_error();

            if (left->type() != AstNodeType::Identifier) {
                diag_.report(DiagnosticKind::InvalidAssignmentTarget, left->range(),
                    "Invalid assignment target, only variables can be assigned to.");
                left = make_node(ErrorNode{}, start, true);
                continue;
            }

            // `x op= e` is the same as `x = x op e`.
            AstPtr value = right.take_node();
            if (op_type != TokenType::Equals) {
                auto op = to_binary_operator(op_type);
                LUSITANO_CHECK(op, "Invalid compound assignment operator {}.", op_type);
                value = make_node(BinaryExprNode{*op,
                                      make_identifier(identifier_name(*left), left->range()),
                                      std::move(value)},
                    start, false);
            }

            left = make_node(AssignmentNode{std::move(left), std::move(value)}, start, false);
            continue;
        }

        auto op = to_binary_operator(op_type);
        LUSITANO_CHECK(op, "Invalid binary operator {}.", op_type);

        const int next_precedence = operator_is_right_associative(*op) ? op_precedence
                                                                       : op_precedence + 1;
        auto right = parse_expr(next_precedence, sync);
        if (!right)
            return syntax_error();

        left = make_node(BinaryExprNode{*op, std::move(left), right.take_node()}, start, false);
    }

    return parse_success(std::move(left));
}

Parser::Result Parser::parse_prefix_expr(TokenTypes sync) {
    auto start = mark_position();

    auto op = to_unary_operator(head().type());
    if (!op)
        return parse_primary_expr(sync);

    advance();
    auto operand = parse_expr(unary_precedence, sync);
    if (!operand)
        return syntax_error();

    return complete(UnaryExprNode{*op, operand.take_node()}, start);
}

Parser::Result Parser::parse_primary_expr(TokenTypes sync) {
    auto start = mark_position();
    const Token& tok = head();

    switch (tok.type()) {
    case TokenType::Identifier: {
        auto ident = make_identifier(tok.data().as_string(), tok.range());
        advance();

        // Calls are only allowed on plain identifiers.
        if (!accept(TokenType::LeftParen))
            return parse_success(std::move(ident));

        CallNode call;
        call.callee = std::move(ident);
        if (!parse_call_args(call.args, sync))
            return partial(std::move(call), start);

        bool has_error = false;
        if (call.args.size() > max_call_args) {
            diag_.reportf(DiagnosticKind::SyntaxError, range_from(start),
                "Too many arguments in function call (maximum is {}).", max_call_args);
            has_error = true;
        }
        return complete(std::move(call), start, has_error);
    }

    case TokenType::IntegerLiteral: {
        const bool has_error = tok.has_error();
        LiteralValue value(std::in_place_type<i64>, tok.data().as_integer());
        advance();
        return complete(LiteralNode{std::move(value)}, start, has_error);
    }

    case TokenType::RealLiteral: {
        const bool has_error = tok.has_error();
        LiteralValue value(std::in_place_type<f64>, tok.data().as_real());
        advance();
        return complete(LiteralNode{std::move(value)}, start, has_error);
    }

    case TokenType::StringLiteral: {
        const bool has_error = tok.has_error();
        LiteralValue value(std::in_place_type<std::string>, tok.data().as_string());
        advance();
        return complete(LiteralNode{std::move(value)}, start, has_error);
    }

    case TokenType::KwVerdadeiro:
    case TokenType::KwFalso: {
        LiteralValue value(std::in_place_type<bool>, tok.type() == TokenType::KwVerdadeiro);
        advance();
        return complete(LiteralNode{std::move(value)}, start);
    }

    case TokenType::LeftParen:
        return parse_paren_expr(sync);

    default:
        break;
    }

    report_unexpected("an expression");
    return syntax_error();
}

bool Parser::parse_call_args(AstNodeList& args, TokenTypes sync) {
    if (accept(TokenType::RightParen))
        return true;

    while (1) {
        auto arg = parse_expr(sync.union_with({TokenType::Comma, TokenType::RightParen}));
        if (arg.has_node())
            args.push_back(arg.take_node());
        if (!arg)
            return false;

        auto next = expect({TokenType::Comma, TokenType::RightParen});
        if (!next)
            return false;
        if (next->type() == TokenType::RightParen)
            return true;
    }
}

Parser::Result Parser::parse_paren_expr(TokenTypes sync) {
    if (!expect(TokenType::LeftParen))
        return syntax_error();

    auto expr = parse_expr(sync.union_with(TokenType::RightParen));
    if (!expr)
        return syntax_error();

    if (!expect(TokenType::RightParen))
        return syntax_error(expr.take_node());

    return expr;
}

AstPtr Parser::make_identifier(std::string name, const SourceRange& range) {
    return std::make_unique<AstNode>(node_ids_.generate(), range, IdentifierNode{std::move(name)});
}

const Token& Parser::head() const {
    return tokens_[std::min(pos_, tokens_.size() - 1)];
}

const Token& Parser::peek(size_t n) const {
    return tokens_[std::min(pos_ + n, tokens_.size() - 1)];
}

void Parser::advance() {
    if (pos_ < tokens_.size()) {
        last_end_ = tokens_[pos_].range().end();
        ++pos_;
    }
}

std::optional<Token> Parser::accept(TokenTypes tokens) {
    if (const Token& current = head(); tokens.contains(current.type())) {
        Token tok = current;
        advance();
        return {std::move(tok)};
    }
    return {};
}

std::optional<Token> Parser::expect(TokenTypes tokens) {
    LUSITANO_DEBUG_ASSERT(tokens.size() != 0, "Token set must not be empty.");

    auto res = accept(tokens);
    if (!res) {
        const Token& tok = head();
        diag_.report_unexpected(DiagnosticKind::SyntaxError, tok.range(),
            unexpected_message(tokens, tok.type()), tokens.to_description(),
            std::string(to_description(tok.type())));
    }
    return res;
}

void Parser::report_unexpected(std::string_view expected) {
    const Token& tok = head();
    diag_.report_unexpected(DiagnosticKind::SyntaxError, tok.range(),
        fmt::format("Unexpected {}, expected {}.", to_description(tok.type()), expected),
        std::string(expected), std::string(to_description(tok.type())));
}

bool Parser::recover_seek(TokenTypes expected, TokenTypes sync) {
    while (1) {
        const Token& tok = head();

        if (tok.type() == TokenType::Eof)
            return false;

        if (expected.contains(tok.type()))
            return true;

        if (sync.contains(tok.type()))
            return false;

        advance();
    }
}

std::optional<Token> Parser::recover_consume(TokenTypes expected, TokenTypes sync) {
    if (recover_seek(expected, sync)) {
        Token tok = head();
        LUSITANO_DEBUG_ASSERT(expected.contains(tok.type()), "Invalid token.");
        advance();
        return tok;
    }

    return {};
}

void Parser::recover_statement(size_t start_index, TokenTypes sync) {
    // Always make progress.
    if (pos_ == start_index && head().type() != TokenType::Eof)
        advance();

    while (1) {
        const TokenType type = head().type();
        if (type == TokenType::Eof || type == TokenType::LeftBrace
            || type == TokenType::RightBrace || STMT_FIRST.contains(type) || sync.contains(type))
            return;

        advance();
        if (type == TokenType::Semicolon)
            return;
    }
}

u32 Parser::mark_position() const {
    return head().range().begin();
}

SourceRange Parser::range_from(u32 start) const {
    return SourceRange(start, std::max(start, last_end_));
}

Parser::Result Parser::complete(AstNode::Data data, u32 start, bool has_error) {
    return parse_success(make_node(std::move(data), start, has_error));
}

Parser::Result Parser::partial(AstNode::Data data, u32 start) {
    return syntax_error(make_node(std::move(data), start, true));
}

AstPtr Parser::make_node(AstNode::Data data, u32 start, bool has_error) {
    auto node = std::make_unique<AstNode>(node_ids_.generate(), range_from(start), std::move(data));
    node->has_error(has_error);
    return node;
}

AstPtr Parser::take_or_error(Result& result, u32 start) {
    if (result.has_node())
        return result.take_node();
    return make_node(ErrorNode{}, start, true);
}

} // namespace lusitano
