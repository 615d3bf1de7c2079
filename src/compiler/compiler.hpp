#ifndef LUSITANO_COMPILER_COMPILER_HPP
#define LUSITANO_COMPILER_COMPILER_HPP

#include "common/defs.hpp"
#include "compiler/diagnostics.hpp"
#include "compiler/source_map.hpp"

#include <optional>
#include <string>

namespace lusitano {

struct CompilerOptions {
    bool analyze = true;
    bool generate = true;

    /// Passed to the code generator.
    bool header = true;
    bool call_main = true;

    bool keep_tokens = false;
    bool keep_ast = false;
    bool keep_symbols = false;
};

struct CompilerResult {
    /// True if compilation completed without any diagnostic messages (warnings included).
    bool success = false;

    /// Token list. Set if options.keep_tokens was true.
    std::optional<std::string> tokens;

    /// Abstract syntax tree as json. Set if options.keep_ast was true.
    std::optional<std::string> ast;

    /// Scopes and symbols. Set if options.keep_symbols was true and the program was analyzed.
    std::optional<std::string> symbols;

    /// The generated python code. Set if code generation was requested and the
    /// program has no lexical or syntax errors.
    std::optional<std::string> python;
};

/// Compiles a single source file. Runs the scanner, the parser, the semantic analysis
/// and the code generator in that order. Instances can only be used once.
class Compiler final {
public:
    explicit Compiler(
        std::string file_name, std::string content, const CompilerOptions& options = {});

    Compiler(const Compiler&) = delete;
    Compiler& operator=(const Compiler&) = delete;

    const std::string& file_name() const { return file_name_; }
    const std::string& content() const { return content_; }

    Diagnostics& diag() { return diag_; }
    const Diagnostics& diag() const { return diag_; }
    bool has_errors() const { return diag_.has_errors(); }

    CompilerResult run();

    // Compute the concrete cursor position (i.e. line and column) for the given
    // source range.
    CursorPosition cursor_pos(const SourceRange& range) const;

private:
    CompilerOptions options_;
    std::string file_name_;
    std::string content_;
    SourceMap source_map_;
    Diagnostics diag_;
    bool started_ = false;
};

} // namespace lusitano

#endif // LUSITANO_COMPILER_COMPILER_HPP
