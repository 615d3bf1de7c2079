#ifndef LUSITANO_TEST_SUPPORT_TEST_COMPILER_HPP
#define LUSITANO_TEST_SUPPORT_TEST_COMPILER_HPP

#include "compiler/ast/ast.hpp"
#include "compiler/codegen/python_gen.hpp"
#include "compiler/diagnostics.hpp"
#include "compiler/semantics/symbol_table.hpp"
#include "compiler/source_map.hpp"

#include <string>
#include <string_view>

namespace lusitano::test_support {

/// Runs the front end (lexer, parser and optionally the semantic analysis) on a
/// source snippet and keeps all intermediate results alive for inspection.
class TestProgram final {
public:
    explicit TestProgram(std::string_view source, bool analyze = true);
    ~TestProgram();

    TestProgram(const TestProgram&) = delete;
    TestProgram& operator=(const TestProgram&) = delete;

    const std::string& source() const { return source_; }
    const SourceMap& source_map() const { return map_; }
    Diagnostics& diag() { return diag_; }
    SymbolTable& symbols() { return symbols_; }

    AstNode& program() { return *program_; }

    /// Returns the top level item at the given index. Fails the test if there is none.
    AstNode& item(size_t index);

    /// Number of top level items.
    size_t item_count() const;

    /// Number of diagnostic messages of the given kind.
    size_t count(DiagnosticKind kind) const { return diag_.count(kind); }

    /// Returns the first message of the given kind. Fails the test if there is none.
    const Diagnostics::Message& message(DiagnosticKind kind) const;

    /// Line and column of the message's start position.
    CursorPosition pos(const Diagnostics::Message& message) const;

    /// Generates python code for the analyzed program. The header comment is
    /// omitted unless requested.
    std::string python(bool header = false, bool call_main = true) const;

    /// Renders all messages, one per line. Useful for CAPTURE().
    std::string report() const;

private:
    std::string source_;
    SourceMap map_;
    Diagnostics diag_;
    AstPtr program_;
    SymbolTable symbols_;
};

/// Parses the source as a program and returns the python code. Fails the test
/// if the program contains any errors.
std::string compile_python(std::string_view source);

} // namespace lusitano::test_support

#endif // LUSITANO_TEST_SUPPORT_TEST_COMPILER_HPP
