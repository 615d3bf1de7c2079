#include "compiler/ast/operators.hpp"

#include "common/assert.hpp"

namespace lusitano {

std::string_view to_string(UnaryOperator op) {
#define LUSITANO_CASE(op)   \
    case UnaryOperator::op: \
        return #op;

    switch (op) {
        LUSITANO_CASE(Plus)
        LUSITANO_CASE(Minus)
        LUSITANO_CASE(LogicalNot)
    }

#undef LUSITANO_CASE

    LUSITANO_UNREACHABLE("Invalid unary operation.");
}

std::string_view to_string(BinaryOperator op) {
#define LUSITANO_CASE(op)    \
    case BinaryOperator::op: \
        return #op;

    switch (op) {
        LUSITANO_CASE(Plus)
        LUSITANO_CASE(Minus)
        LUSITANO_CASE(Multiply)
        LUSITANO_CASE(Divide)
        LUSITANO_CASE(Modulus)
        LUSITANO_CASE(Power)

        LUSITANO_CASE(Less)
        LUSITANO_CASE(LessEquals)
        LUSITANO_CASE(Greater)
        LUSITANO_CASE(GreaterEquals)
        LUSITANO_CASE(Equals)
        LUSITANO_CASE(NotEquals)
        LUSITANO_CASE(LogicalAnd)
        LUSITANO_CASE(LogicalOr)
    }

#undef LUSITANO_CASE

    LUSITANO_UNREACHABLE("Invalid binary operation.");
}

std::string_view to_source(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Plus:
        return "+";
    case BinaryOperator::Minus:
        return "-";
    case BinaryOperator::Multiply:
        return "*";
    case BinaryOperator::Divide:
        return "/";
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
        return "e";
    case BinaryOperator::LogicalOr:
        return "ou";
    }
    LUSITANO_UNREACHABLE("Invalid binary operation.");
}

std::string_view to_source(UnaryOperator op) {
    switch (op) {
    case UnaryOperator::Plus:
        return "+";
    case UnaryOperator::Minus:
        return "-";
    case UnaryOperator::LogicalNot:
        return "nao";
    }
    LUSITANO_UNREACHABLE("Invalid unary operation.");
}

bool is_arithmetic(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Plus:
    case BinaryOperator::Minus:
    case BinaryOperator::Multiply:
    case BinaryOperator::Divide:
    case BinaryOperator::Modulus:
    case BinaryOperator::Power:
        return true;
    default:
        return false;
    }
}

bool is_equality(BinaryOperator op) {
    return op == BinaryOperator::Equals || op == BinaryOperator::NotEquals;
}

bool is_ordering(BinaryOperator op) {
    switch (op) {
    case BinaryOperator::Less:
    case BinaryOperator::LessEquals:
    case BinaryOperator::Greater:
    case BinaryOperator::GreaterEquals:
        return true;
    default:
        return false;
    }
}

bool is_logical(BinaryOperator op) {
    return op == BinaryOperator::LogicalAnd || op == BinaryOperator::LogicalOr;
}

} // namespace lusitano
