#ifndef LUSITANO_COMPILER_CODEGEN_PYTHON_GEN_HPP
#define LUSITANO_COMPILER_CODEGEN_PYTHON_GEN_HPP

#include "compiler/ast/ast.hpp"
#include "compiler/semantics/symbol_table.hpp"

#include <string>
#include <string_view>

namespace lusitano {

struct PythonGenOptions {
    /// Emit a comment that names the compiler and the source file.
    bool header = true;

    /// Call `principal()` at the end of the module if such a function exists.
    bool call_main = true;
};

/// Translates the analyzed program into python 3 source code.
///
/// The generator trusts the annotations of the semantic analysis (node types and
/// resolved symbols). It does not fail on programs with semantic errors: the output is
/// produced on a best effort basis, error nodes become `pass` statements.
std::string generate_python(const AstNode& program, const SymbolTable& symbols,
    std::string_view file_name, const PythonGenOptions& options = {});

/// Formats the string as a single quoted python string literal.
std::string python_string_literal(std::string_view value);

/// Formats the number as a python float literal. The result always contains a `.`
/// or an exponent.
std::string python_real_literal(double value);

/// True if `name` cannot be used as a python identifier because it is a keyword
/// or a builtin used by the generated code.
bool is_python_reserved(std::string_view name);

} // namespace lusitano

#endif // LUSITANO_COMPILER_CODEGEN_PYTHON_GEN_HPP
