#ifndef LUSITANO_COMPILER_SEMANTICS_ANALYZER_HPP
#define LUSITANO_COMPILER_SEMANTICS_ANALYZER_HPP

#include "compiler/ast/ast.hpp"
#include "compiler/diagnostics.hpp"
#include "compiler/semantics/symbol_table.hpp"

namespace lusitano {

/// Resolves all names in the program and checks the static types of all expressions.
///
/// The analysis walks the tree once, from top to bottom. Declarations are added to the
/// current scope when they are reached, so names must be declared before they are used.
/// A function's own name is visible inside its body (recursion).
///
/// Every node receives a value type, even if errors were found: expressions receive
/// their static type (or `Error`), statements and declarations receive `Void`.
/// Diagnostics are reported for every problem and the walk always completes.
///
/// The symbol table must only contain the global scope when the analysis starts. It
/// records scopes, declarations and resolved references for later phases.
void analyze_program(AstNode& program, SymbolTable& symbols, Diagnostics& diag);

} // namespace lusitano

#endif // LUSITANO_COMPILER_SEMANTICS_ANALYZER_HPP
