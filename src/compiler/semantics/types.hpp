#ifndef LUSITANO_COMPILER_SEMANTICS_TYPES_HPP
#define LUSITANO_COMPILER_SEMANTICS_TYPES_HPP

#include "common/defs.hpp"
#include "common/format.hpp"
#include "compiler/ast/operators.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace lusitano {

/// The static type of a value. `Error` is the sentinel type assigned to
/// expressions that failed to type check; it never causes follow-up errors.
enum class ValueType : u8 {
    Integer,
    Real,
    Text,
    Logical,
    Function,
    Void,
    Error,
};

/// Returns the source language name of the type (e.g. "inteiro").
std::string_view to_string(ValueType type);

/// True for `inteiro` and `real`.
bool is_numeric(ValueType type);

/// True if values of this type can be stored in a variable, constant or parameter.
bool is_storable(ValueType type);

/// Parses a type name as written in source code. Returns an empty optional
/// if `name` is not a type name.
std::optional<ValueType> parse_type_name(std::string_view name);

/// The result type of a well typed binary operation, or an empty optional if the
/// operand types are not valid for that operator. Operands must not be `Error`.
std::optional<ValueType> binary_result_type(BinaryOperator op, ValueType lhs, ValueType rhs);

/// The result type of a well typed unary operation, or an empty optional if the
/// operand type is not valid for that operator. The operand must not be `Error`.
std::optional<ValueType> unary_result_type(UnaryOperator op, ValueType operand);

/// The signature of a declared function.
struct FunctionSignature final {
    std::vector<ValueType> params;
    ValueType return_type = ValueType::Void;

    void format(FormatStream& stream) const;
};

} // namespace lusitano

LUSITANO_ENABLE_FREE_TO_STRING(lusitano::ValueType)
LUSITANO_ENABLE_MEMBER_FORMAT(lusitano::FunctionSignature)

#endif // LUSITANO_COMPILER_SEMANTICS_TYPES_HPP
