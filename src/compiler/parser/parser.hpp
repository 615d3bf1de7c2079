#ifndef LUSITANO_COMPILER_PARSER_PARSER_HPP
#define LUSITANO_COMPILER_PARSER_PARSER_HPP

#include "compiler/ast/ast.hpp"
#include "compiler/diagnostics.hpp"
#include "compiler/parser/parse_result.hpp"
#include "compiler/parser/token.hpp"
#include "compiler/parser/token_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lusitano {

/// Generates ast node ids.
class AstIdGenerator final {
public:
    AstIdGenerator();

    AstId generate();

private:
    u32 next_id_;
};

/// A recursive descent parser.
///
/// A key design choice in this recursive descent parser is that it handles
/// partially valid nonterminals. Statements that cannot be parsed are replaced
/// by error nodes and the parser synchronizes at the next statement boundary
/// in order to give as many diagnostics as reasonably possible before exiting.
class Parser final {
public:
    using Result = ParseResult;

public:
    /// Constructs a parser for the given token sequence, which must end with an Eof token.
    explicit Parser(std::vector<Token> tokens, Diagnostics& diag);

    Parser(const Parser&) = delete;
    Parser& operator=(const Parser& parser) = delete;

    Diagnostics& diag() { return diag_; }

    // Parses a program. A program is a sequence of declarations and statements.
    // Always returns a program node, syntax errors are represented by error nodes.
    AstPtr parse_program();

    // Parses a declaration or a statement. Never fails: if the item cannot be parsed,
    // the parser synchronizes at the next statement boundary and returns an error node.
    AstPtr parse_item(TokenTypes sync);

    // Parses a single statement.
    Result parse_stmt(TokenTypes sync);

    // Parses a single expression.
    Result parse_expr(TokenTypes sync);

private:
    Result parse_item_inner(TokenTypes sync);

    // Parses a function declaration.
    Result parse_func_decl(TokenTypes sync);
    bool parse_param_list(std::vector<AstParam>& params, TokenTypes sync);

    // Parses `var name: type (= init)?`.
    Result parse_var_decl(TokenTypes sync);

    // Parses `const name: type = init`.
    Result parse_const_decl(TokenTypes sync);

    // Parses a type name.
    std::optional<ValueType> parse_type();

    // Parses a block, i.e. { STMT... }.
    Result parse_block(TokenTypes sync);

    // Parses `se (cond) { ... } senao ...`. Also handles `senaose`.
    Result parse_if_stmt(TokenTypes sync);

    // Parses `enquanto (cond) { ... }`.
    Result parse_while_stmt(TokenTypes sync);

    // Parses `para i de a ate b (passo s)? { ... }`.
    Result parse_for_stmt(TokenTypes sync);

    // Parses `retorna expr?`.
    Result parse_return_stmt(TokenTypes sync);

    // Parses `escreva(args...)`.
    Result parse_print_stmt(TokenTypes sync);

    // Parses `leia(prompt?, target)`.
    Result parse_read_stmt(TokenTypes sync);

    // Parses an expression and wraps it into an expression statement.
    Result parse_expr_stmt(TokenTypes sync);

    // Recursive parsing function for expressions with infix operators.
    Result parse_expr(int min_precedence, TokenTypes sync);

    // Parse an expression initiated by an infix operator.
    Result parse_infix_expr(AstPtr left, int current_precedence, TokenTypes sync);

    // Parses an expression preceeded by unary operators.
    Result parse_prefix_expr(TokenTypes sync);

    // Parses primary expressions (literals, variables, function calls, parenthesized expressions).
    Result parse_primary_expr(TokenTypes sync);

    // Parses the argument list of a call, starting at the opening paren.
    bool parse_call_args(AstNodeList& args, TokenTypes sync);

    // Parses `(expr)`.
    Result parse_paren_expr(TokenTypes sync);

    // Creates a new identifier node with the given name and range.
    AstPtr make_identifier(std::string name, const SourceRange& range);

private:
    // Returns the current token.
    const Token& head() const;

    // Returns the token `n` positions after the current one (or the final Eof token).
    const Token& peek(size_t n) const;

    // Advances to the next token.
    void advance();

    // Accept a token of the given types. Returns the token and advances if it matches,
    // does nothing otherwise.
    std::optional<Token> accept(TokenTypes tokens);

    // Expects a token of the given types. Returns the token if successful and
    // reports an error otherwise (without advancing).
    std::optional<Token> expect(TokenTypes tokens);

    // Reports an unexpected token, with a custom description of the expected input.
    void report_unexpected(std::string_view expected);

    // Attempts to recover from a parser error by seeking to a token in `expected`. Returns true
    // if such a token was found. Stops at tokens in `sync` (and at the end of file) and returns false.
    bool recover_seek(TokenTypes expected, TokenTypes sync);

    // Like recover_seek, but also consumes the expected token on success.
    std::optional<Token> recover_consume(TokenTypes expected, TokenTypes sync);

    // Skips tokens until the next statement boundary. Consumes a terminating `;`.
    void recover_statement(size_t start_index, TokenTypes sync);

    // Returns the byte offset of the current token.
    u32 mark_position() const;

    // Returns the range from `start` to the end of the last consumed token.
    SourceRange range_from(u32 start) const;

    // Constructs a successfully parsed node that starts at `start`.
    Result complete(AstNode::Data data, u32 start, bool has_error = false);

    // Constructs a partial node for a failed parse operation.
    Result partial(AstNode::Data data, u32 start);

    AstPtr make_node(AstNode::Data data, u32 start, bool has_error);

    // Returns the result's node, or a new error node if the result does not contain one.
    AstPtr take_or_error(Result& result, u32 start);

private:
    std::vector<Token> tokens_;
    size_t pos_ = 0;
    u32 last_end_ = 0;
    Diagnostics& diag_;
    AstIdGenerator node_ids_;
};

} // namespace lusitano

#endif // LUSITANO_COMPILER_PARSER_PARSER_HPP
