#ifndef LUSITANO_COMPILER_AST_OPERATORS_HPP
#define LUSITANO_COMPILER_AST_OPERATORS_HPP

#include "common/defs.hpp"
#include "common/format.hpp"

#include <string_view>

namespace lusitano {

/// The operator used in a unary operation.
enum class UnaryOperator : u8 {
    // Arithmetic
    Plus,
    Minus,

    // Boolean
    LogicalNot
};

std::string_view to_string(UnaryOperator op);

/// The operator used in a binary operation.
enum class BinaryOperator : u8 {
    // Arithmetic
    Plus,
    Minus,
    Multiply,
    Divide,
    Modulus,
    Power,

    // Boolean
    Less,
    LessEquals,
    Greater,
    GreaterEquals,
    Equals,
    NotEquals,
    LogicalAnd,
    LogicalOr,
};

std::string_view to_string(BinaryOperator op);

/// Returns the operator as written in source code (e.g. "+", "ou").
std::string_view to_source(BinaryOperator op);

/// Returns the operator as written in source code (e.g. "-", "nao").
std::string_view to_source(UnaryOperator op);

/// Operator classes used by the type checker.
bool is_arithmetic(BinaryOperator op);
bool is_equality(BinaryOperator op);
bool is_ordering(BinaryOperator op);
bool is_logical(BinaryOperator op);

} // namespace lusitano

LUSITANO_ENABLE_FREE_TO_STRING(lusitano::UnaryOperator)
LUSITANO_ENABLE_FREE_TO_STRING(lusitano::BinaryOperator)

#endif // LUSITANO_COMPILER_AST_OPERATORS_HPP
