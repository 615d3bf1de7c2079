#ifndef LUSITANO_COMPILER_PARSER_OPERATORS_HPP
#define LUSITANO_COMPILER_PARSER_OPERATORS_HPP

#include "compiler/ast/operators.hpp"
#include "compiler/parser/token.hpp"

#include <optional>

namespace lusitano {

// The common precedence for all unary operators.
extern const int unary_precedence;

// The precedence of all assignment operators (the loosest binding operators).
extern const int assignment_precedence;

// Returns the operator precedence for the given token type,
// when treated as an infix operator. Returns -1 if this is not
// an infix operator.
int infix_operator_precedence(TokenType t);

// Returns true iff the given binary operator is right associative.
bool operator_is_right_associative(BinaryOperator op);

// Returns true iff the token is `=` or a compound assignment operator.
bool is_assignment_operator(TokenType t);

// Attempts to parse the given token type as a unary operator.
std::optional<UnaryOperator> to_unary_operator(TokenType t);

// Attempts to parse the given token type as a binary operator.
// Compound assignment operators map to the operator they apply (e.g. `+=` to Plus).
std::optional<BinaryOperator> to_binary_operator(TokenType t);

} // namespace lusitano

#endif // LUSITANO_COMPILER_PARSER_OPERATORS_HPP
