#include "compiler/compiler.hpp"

#include "common/error.hpp"
#include "common/text/unicode.hpp"
#include "compiler/ast/ast.hpp"
#include "compiler/ast/dump.hpp"
#include "compiler/codegen/python_gen.hpp"
#include "compiler/parser/lexer.hpp"
#include "compiler/parser/parser.hpp"
#include "compiler/semantics/analyzer.hpp"
#include "compiler/semantics/symbol_table.hpp"

namespace lusitano {

static std::string dump_tokens(const std::vector<Token>& tokens) {
    StringFormatStream stream;
    for (const auto& token : tokens) {
        stream.format("{} {}", token.pos(), token.type());
        if (token.data().type() != TokenDataType::None)
            stream.format(" {}", token.data());
        if (token.has_error())
            stream.format(" (error)");
        stream.format("\n");
    }
    return stream.take_str();
}

Compiler::Compiler(std::string file_name, std::string content, const CompilerOptions& options)
    : options_(options)
    , file_name_(std::move(file_name))
    , content_(std::move(content))
    , source_map_(file_name_, content_) {
    LUSITANO_CHECK(!file_name_.empty(), "The file name must not be empty.");
}

CompilerResult Compiler::run() {
    if (started_)
        LUSITANO_ERROR_WITH_CODE(Errc::BadState, "The compiler already ran on this file.");
    started_ = true;

    CompilerResult result;

    if (auto res = validate_utf8(content_); !res.ok) {
        diag_.report(DiagnosticKind::LexicalError, SourceRange::from_std_offset(res.error_offset),
            "The file contains invalid utf8.");
        return result;
    }

    auto tokens = [&]() {
        Lexer lexer(content_, source_map_, diag_);
        return lexer.tokenize();
    }();
    if (options_.keep_tokens)
        result.tokens = dump_tokens(tokens);

    // Tokens are not retained past parsing.
    auto program = [&]() {
        Parser parser(std::move(tokens), diag_);
        return parser.parse_program();
    }();
    LUSITANO_CHECK(program && program->is<ProgramNode>(), "Failed to build a program ast.");

    SymbolTable symbols(program->id());
    if (options_.analyze)
        analyze_program(*program, symbols, diag_);

    if (options_.keep_ast)
        result.ast = dump(program.get(), source_map_);

    if (options_.analyze && options_.keep_symbols) {
        StringFormatStream stream;
        symbols.format(stream);
        result.symbols = stream.take_str();
    }

    const bool can_generate = !diag_.has_errors(Phase::Lexical) && !diag_.has_errors(Phase::Syntax);
    if (options_.analyze && options_.generate && can_generate) {
        PythonGenOptions gen_options;
        gen_options.header = options_.header;
        gen_options.call_main = options_.call_main;
        result.python = generate_python(*program, symbols, file_name_, gen_options);
    }

    result.success = diag_.message_count() == 0;
    return result;
}

CursorPosition Compiler::cursor_pos(const SourceRange& range) const {
    return source_map_.cursor_pos(range);
}

} // namespace lusitano
