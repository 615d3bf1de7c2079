#include "compiler/parser/operators.hpp"

namespace lusitano {

const int unary_precedence = 8;

const int assignment_precedence = 0;

int infix_operator_precedence(TokenType t) {
    switch (t) {
    // Assigment
    case TokenType::Equals:
    case TokenType::PlusEquals:
    case TokenType::MinusEquals:
    case TokenType::StarEquals:
    case TokenType::SlashEquals:
        return assignment_precedence;

    case TokenType::KwOu:
        return 1;

    case TokenType::KwE:
        return 2;

    case TokenType::EqualsEquals:
    case TokenType::NotEquals:
        return 3;

    case TokenType::Less:
    case TokenType::LessEquals:
    case TokenType::Greater:
    case TokenType::GreaterEquals:
        return 4;

    case TokenType::Plus:
    case TokenType::Minus:
        return 5;

    case TokenType::Star:    // Multiply
    case TokenType::Slash:   // Divide
    case TokenType::Percent: // Modulus
        return 6;

    case TokenType::StarStar: // Power
        return 7;

        // UNARY OPERATORS == 8

    default:
        return -1;
    }
}

bool operator_is_right_associative(BinaryOperator op) {
    return op == BinaryOperator::Power;
}

bool is_assignment_operator(TokenType t) {
    switch (t) {
    case TokenType::Equals:
    case TokenType::PlusEquals:
    case TokenType::MinusEquals:
    case TokenType::StarEquals:
    case TokenType::SlashEquals:
        return true;
    default:
        return false;
    }
}

std::optional<UnaryOperator> to_unary_operator(TokenType t) {
    switch (t) {
    case TokenType::Plus:
        return UnaryOperator::Plus;
    case TokenType::Minus:
        return UnaryOperator::Minus;
    case TokenType::KwNao:
        return UnaryOperator::LogicalNot;
    default:
        return {};
    }
}

std::optional<BinaryOperator> to_binary_operator(TokenType t) {
#define LUSITANO_MAP_TOKEN(token, op) \
    case TokenType::token:            \
        return BinaryOperator::op;

    switch (t) {
        LUSITANO_MAP_TOKEN(Plus, Plus)
        LUSITANO_MAP_TOKEN(Minus, Minus)
        LUSITANO_MAP_TOKEN(Star, Multiply)
        LUSITANO_MAP_TOKEN(Slash, Divide)
        LUSITANO_MAP_TOKEN(Percent, Modulus)
        LUSITANO_MAP_TOKEN(StarStar, Power)

        LUSITANO_MAP_TOKEN(Less, Less)
        LUSITANO_MAP_TOKEN(LessEquals, LessEquals)
        LUSITANO_MAP_TOKEN(Greater, Greater)
        LUSITANO_MAP_TOKEN(GreaterEquals, GreaterEquals)
        LUSITANO_MAP_TOKEN(EqualsEquals, Equals)
        LUSITANO_MAP_TOKEN(NotEquals, NotEquals)
        LUSITANO_MAP_TOKEN(KwE, LogicalAnd)
        LUSITANO_MAP_TOKEN(KwOu, LogicalOr)

        LUSITANO_MAP_TOKEN(PlusEquals, Plus)
        LUSITANO_MAP_TOKEN(MinusEquals, Minus)
        LUSITANO_MAP_TOKEN(StarEquals, Multiply)
        LUSITANO_MAP_TOKEN(SlashEquals, Divide)

    default:
        return {};
    }

#undef LUSITANO_MAP_TOKEN
}

} // namespace lusitano
