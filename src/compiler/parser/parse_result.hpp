#ifndef LUSITANO_COMPILER_PARSER_PARSE_RESULT_HPP
#define LUSITANO_COMPILER_PARSER_PARSE_RESULT_HPP

#include "compiler/ast/ast.hpp"

namespace lusitano {

/// Represents a syntax error with a partial result.
/// The parser must recover from the syntax error but can use
/// the partial data.
struct PartialSyntaxError {
    AstPtr partial;
};

/// Represents a syntax error without any data. The parser must
/// recover from the error.
struct EmptySyntaxError {};

enum class ParseResultType {
    Success,
    SyntaxError,
};

/// Represents the result of a parse step.
///
/// A successful parse operation always returns a valid ast node. A failed parse operation
/// *may* still return a partial node (which may be an error node or contain error nodes as children).
///
/// Errors that can be handled locally are not propagated through results: the parser
/// will recover on its own if it can do so (e.g. by seeking to an opening brace).
/// Errors that cannot be handled locally are signaled by returning a parse failure. The caller must
/// attempt to recover from the syntax error or forward the error to its caller.
class [[nodiscard]] ParseResult final {
public:
    ParseResult()
        : type_(ParseResultType::SyntaxError) {}

    /// Represents successful completion of a parsing operation.
    ParseResult(AstPtr node)
        : type_(ParseResultType::Success)
        , node_(std::move(node)) {}

    ParseResult(PartialSyntaxError error)
        : type_(ParseResultType::SyntaxError)
        , node_(std::move(error.partial)) {}

    /// Parse failure without an AST node. Recovery by the caller is needed.
    ParseResult(EmptySyntaxError)
        : type_(ParseResultType::SyntaxError)
        , node_() {}

    /// True if no syntax error occurred. False if the parser must recover.
    explicit operator bool() const { return is_ok(); }

    /// True if no syntax error occurred. False if the parser must recover.
    bool is_ok() const { return type_ == ParseResultType::Success; }

    /// True if a syntax error occurred, i.e. if recovery is necessary.
    bool is_error() const { return type_ == ParseResultType::SyntaxError; }

    /// Returns true if the result contains a valid node pointer. Note that the node may still
    /// have internal errors (such as invalid children or errors that the parser may have recovered from).
    bool has_node() const { return static_cast<bool>(node_); }

    /// Extracts the node from this result.
    AstPtr take_node() { return std::move(node_); }

private:
    ParseResultType type_;
    AstPtr node_;
};

inline ParseResult parse_success(AstPtr node) {
    return {std::move(node)};
}

inline PartialSyntaxError syntax_error(AstPtr partial) {
    return {std::move(partial)};
}

inline EmptySyntaxError syntax_error() {
    return {};
}

} // namespace lusitano

#endif // LUSITANO_COMPILER_PARSER_PARSE_RESULT_HPP
