#include "compiler/semantics/types.hpp"

#include "common/assert.hpp"

namespace lusitano {

std::string_view to_string(ValueType type) {
    switch (type) {
    case ValueType::Integer:
        return "inteiro";
    case ValueType::Real:
        return "real";
    case ValueType::Text:
        return "texto";
    case ValueType::Logical:
        return "logico";
    case ValueType::Function:
        return "funcao";
    case ValueType::Void:
        return "vazio";
    case ValueType::Error:
        return "<erro>";
    }
    LUSITANO_UNREACHABLE("Invalid value type.");
}

bool is_numeric(ValueType type) {
    return type == ValueType::Integer || type == ValueType::Real;
}

bool is_storable(ValueType type) {
    switch (type) {
    case ValueType::Integer:
    case ValueType::Real:
    case ValueType::Text:
    case ValueType::Logical:
        return true;
    default:
        return false;
    }
}

std::optional<ValueType> parse_type_name(std::string_view name) {
    if (name == "inteiro")
        return ValueType::Integer;
    if (name == "real")
        return ValueType::Real;
    if (name == "texto")
        return ValueType::Text;
    if (name == "logico")
        return ValueType::Logical;
    if (name == "vazio")
        return ValueType::Void;
    return {};
}

std::optional<ValueType> binary_result_type(BinaryOperator op, ValueType lhs, ValueType rhs) {
    LUSITANO_DEBUG_ASSERT(
        lhs != ValueType::Error && rhs != ValueType::Error, "Operands must not be errors.");

    if (is_arithmetic(op)) {
        if (is_numeric(lhs) && is_numeric(rhs)) {
            return lhs == ValueType::Real || rhs == ValueType::Real ? ValueType::Real
                                                                    : ValueType::Integer;
        }
        if (op == BinaryOperator::Plus && lhs == ValueType::Text && rhs == ValueType::Text)
            return ValueType::Text;
        return {};
    }

    if (is_equality(op)) {
        if (lhs == rhs && is_storable(lhs))
            return ValueType::Logical;
        return {};
    }

    if (is_ordering(op)) {
        if (lhs == rhs && (is_numeric(lhs) || lhs == ValueType::Text))
            return ValueType::Logical;
        return {};
    }

    if (is_logical(op)) {
        if (lhs == ValueType::Logical && rhs == ValueType::Logical)
            return ValueType::Logical;
        return {};
    }

    LUSITANO_UNREACHABLE("Invalid binary operation.");
}

std::optional<ValueType> unary_result_type(UnaryOperator op, ValueType operand) {
    LUSITANO_DEBUG_ASSERT(operand != ValueType::Error, "Operand must not be an error.");

    switch (op) {
    case UnaryOperator::Plus:
    case UnaryOperator::Minus:
        if (is_numeric(operand))
            return operand;
        return {};
    case UnaryOperator::LogicalNot:
        if (operand == ValueType::Logical)
            return ValueType::Logical;
        return {};
    }
    LUSITANO_UNREACHABLE("Invalid unary operation.");
}

void FunctionSignature::format(FormatStream& stream) const {
    stream.format("(");
    for (size_t i = 0; i < params.size(); ++i) {
        if (i > 0)
            stream.format(", ");
        stream.format("{}", params[i]);
    }
    stream.format("): {}", return_type);
}

} // namespace lusitano
