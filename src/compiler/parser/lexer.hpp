#ifndef LUSITANO_COMPILER_PARSER_LEXER_HPP
#define LUSITANO_COMPILER_PARSER_LEXER_HPP

#include "common/defs.hpp"
#include "common/text/unicode.hpp"
#include "compiler/diagnostics.hpp"
#include "compiler/parser/token.hpp"
#include "compiler/source_map.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace lusitano {

/// The lexer splits the source code into tokens.
/// Whitespace and comments are skipped. Invalid input is reported to the diagnostics
/// instance and skipped, lexing always continues until the end of the file.
class Lexer final {
public:
    /// Note: file_content and source_map are stored by reference!
    Lexer(std::string_view file_content, const SourceMap& source_map, Diagnostics& diag);

    Lexer(const Lexer&) = delete;
    Lexer& operator=(const Lexer&) = delete;

    /// Returns the next token from the current position within the source text.
    /// Returns an Eof token (repeatedly) once the end of the file has been reached.
    Token next();

    /// Lexes the remaining input. The returned vector always ends with an Eof token.
    std::vector<Token> tokenize();

    /// Index of the current character.
    size_t pos() const { return pos_; }

private:
    std::optional<Token> lex_token();
    Token lex_string_literal();
    Token lex_number();
    Token lex_name();
    std::optional<Token> lex_operator();

    // Skips a line comment, starting at the current `//`.
    void skip_line_comment();

    // Skips a block comment, starting at the current `/*`. Returns false if the comment is unterminated.
    bool skip_block_comment();

    // Skips identifier characters that illegally follow a number literal.
    void skip_identifier_tail(Token& number);

    // Returns a new token that spans from begin to the current position.
    Token make_token(TokenType type, size_t begin) const;

    SourceRange range(size_t begin) const;
    SourceRange range(size_t begin, size_t end) const;

    bool at_end() const { return pos_ >= file_content_.size(); }

    // Returns the current character. Must not be at eof.
    char current() const;

    // Returns the code point at the current position and its length in bytes. Must not be at eof.
    std::tuple<CodePoint, size_t> current_code_point() const;

    // Advances over the current code point if it can be part of an identifier.
    bool accept_identifier_part();

    // Returns the character after the current one, or 0 if there is none.
    char peek(size_t n = 1) const;

    void advance(size_t n = 1);

    // Advances if the current character is equal to `c` and returns true in that case.
    bool accept(char c);

private:
    std::string_view file_content_;
    const SourceMap& source_map_;
    Diagnostics& diag_;
    size_t pos_ = 0;
};

/// Returns the keyword token type for the given name, or an empty optional
/// if `name` is not a reserved word.
std::optional<TokenType> keyword_type(std::string_view name);

} // namespace lusitano

#endif // LUSITANO_COMPILER_PARSER_LEXER_HPP
