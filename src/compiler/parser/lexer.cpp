#include "compiler/parser/lexer.hpp"

#include "common/assert.hpp"

#include "absl/container/flat_hash_map.h"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace lusitano {

static constexpr struct {
    std::string_view name;
    TokenType type;
} keywords_table[] = {
    {"funcao", TokenType::KwFuncao},
    {"var", TokenType::KwVar},
    {"const", TokenType::KwConst},
    {"se", TokenType::KwSe},
    {"senao", TokenType::KwSenao},
    {"senaose", TokenType::KwSenaose},
    {"enquanto", TokenType::KwEnquanto},
    {"para", TokenType::KwPara},
    {"de", TokenType::KwDe},
    {"ate", TokenType::KwAte},
    {"passo", TokenType::KwPasso},
    {"retorna", TokenType::KwRetorna},
    {"escreva", TokenType::KwEscreva},
    {"leia", TokenType::KwLeia},
    {"e", TokenType::KwE},
    {"ou", TokenType::KwOu},
    {"nao", TokenType::KwNao},
    {"verdadeiro", TokenType::KwVerdadeiro},
    {"falso", TokenType::KwFalso},
    {"inteiro", TokenType::KwInteiro},
    {"real", TokenType::KwReal},
    {"texto", TokenType::KwTexto},
    {"logico", TokenType::KwLogico},
    {"vazio", TokenType::KwVazio},
};

// Built once, shared read-only by all lexer instances.
static const absl::flat_hash_map<std::string_view, TokenType>& keywords() {
    static const absl::flat_hash_map<std::string_view, TokenType> map = [] {
        absl::flat_hash_map<std::string_view, TokenType> result;
        for (const auto& e : keywords_table)
            result.emplace(e.name, e.type);
        return result;
    }();
    return map;
}

std::optional<TokenType> keyword_type(std::string_view name) {
    const auto& kws = keywords();
    if (auto pos = kws.find(name); pos != kws.end())
        return pos->second;
    return {};
}

static bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool is_decimal_digit(char c) {
    return c >= '0' && c <= '9';
}

static bool is_identifier_begin(CodePoint c) {
    return is_identifier_letter(c) || c == '_';
}

static bool is_identifier_part(CodePoint c) {
    return is_identifier_begin(c) || (c >= '0' && c <= '9');
}

Lexer::Lexer(std::string_view file_content, const SourceMap& source_map, Diagnostics& diag)
    : file_content_(file_content)
    , source_map_(source_map)
    , diag_(diag) {}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    while (1) {
        Token tok = next();
        const bool eof = tok.type() == TokenType::Eof;
        tokens.push_back(std::move(tok));
        if (eof)
            break;
    }
    return tokens;
}

Token Lexer::next() {
    while (1) {
        if (auto tok = lex_token())
            return std::move(*tok);
    }
}

// Returns an empty optional if the input at the current position did not produce a token
// (e.g. comments or invalid characters).
std::optional<Token> Lexer::lex_token() {
    // Skip whitespace
    while (!at_end() && is_whitespace(current()))
        advance();

    if (at_end())
        return make_token(TokenType::Eof, pos_);

    const char c = current();

    if (c == '/' && peek() == '/') {
        skip_line_comment();
        return {};
    }

    if (c == '/' && peek() == '*') {
        const size_t begin = pos_;
        if (!skip_block_comment()) {
            diag_.report(DiagnosticKind::LexicalError, range(begin, begin + 2),
                "Unterminated block comment at the end of file.");
        }
        return {};
    }

    if (c == '"' || c == '\'')
        return lex_string_literal();

    if (is_decimal_digit(c))
        return lex_number();

    const auto [cp, cp_length] = current_code_point();
    if (is_identifier_begin(cp))
        return lex_name();

    if (auto op = lex_operator())
        return std::move(*op);

    const size_t begin = pos_;
    advance(cp_length);
    if (c == '!') {
        diag_.report(DiagnosticKind::LexicalError, range(begin),
            "Invalid character `!` (use 'nao' for logical negation).");
    } else {
        diag_.reportf(DiagnosticKind::LexicalError, range(begin), "Invalid character `{}`.",
            file_content_.substr(begin, cp_length));
    }
    return {};
}

Token Lexer::lex_string_literal() {
    LUSITANO_DEBUG_ASSERT(!at_end(), "Already at the end of file.");

    const size_t begin = pos_;
    const char delim = current();
    advance();

    std::string buffer;
    bool ok = true;
    bool terminated = false;
    while (!at_end()) {
        const char read = current();
        if (read == delim) {
            advance();
            terminated = true;
            break;
        }

        if (read == '\n')
            break;

        if (read == '\\') {
            const size_t escape_pos = pos_;
            advance();
            if (at_end())
                break;

            const char escape_char = current();
            advance();
            switch (escape_char) {
            case 'n':
                buffer += '\n';
                break;
            case 'r':
                buffer += '\r';
                break;
            case 't':
                buffer += '\t';
                break;
            case '"':
            case '\'':
            case '\\':
                buffer += escape_char;
                break;
            default:
                diag_.reportf(DiagnosticKind::LexicalError, range(escape_pos),
                    "Invalid escape sequence `\\{}`.", std::string_view(&escape_char, 1));
                ok = false;
                break;
            }
            continue;
        }

        buffer += read;
        advance();
    }

    if (!terminated) {
        diag_.report(
            DiagnosticKind::LexicalError, range(begin), "Unterminated string literal.");
        ok = false;
    }

    Token result = make_token(TokenType::StringLiteral, begin);
    result.has_error(!ok);
    result.data(TokenData::make_string(std::move(buffer)));
    return result;
}

Token Lexer::lex_number() {
    LUSITANO_DEBUG_ASSERT(!at_end(), "Already at the end of file.");
    LUSITANO_DEBUG_ASSERT(is_decimal_digit(current()), "Character does not start a number");

    const size_t number_start = pos_;

    // Parse the integer part of the number literal
    i64 int_value = 0;
    bool overflow = false;
    while (!at_end() && is_decimal_digit(current())) {
        const i64 digit = current() - '0';
        if (int_value > (std::numeric_limits<i64>::max() - digit) / 10) {
            overflow = true;
        } else {
            int_value = int_value * 10 + digit;
        }
        advance();
    }

    bool is_real = false;

    // Optional fractional part, only if a digit follows the dot.
    if (!at_end() && current() == '.' && is_decimal_digit(peek())) {
        is_real = true;
        advance();
        while (!at_end() && is_decimal_digit(current()))
            advance();
    }

    // Optional exponent: e10, E+3, e-2
    if (!at_end() && (current() == 'e' || current() == 'E')) {
        const char next = peek();
        if (is_decimal_digit(next)
            || ((next == '+' || next == '-') && is_decimal_digit(peek(2)))) {
            is_real = true;
            advance(is_decimal_digit(next) ? 1 : 2);
            while (!at_end() && is_decimal_digit(current()))
                advance();
        }
    }

    if (is_real) {
        const std::string text(file_content_.substr(number_start, pos_ - number_start));
        errno = 0;
        const f64 value = std::strtod(text.c_str(), nullptr);

        Token result = make_token(TokenType::RealLiteral, number_start);
        result.data(TokenData::make_real(value));
        if (errno == ERANGE) {
            diag_.report(DiagnosticKind::LexicalError, result.range(),
                "Real number is out of range.");
            result.has_error(true);
        }
        skip_identifier_tail(result);
        return result;
    }

    Token result = make_token(TokenType::IntegerLiteral, number_start);
    result.data(TokenData::make_integer(overflow ? 0 : int_value));
    if (overflow) {
        diag_.report(DiagnosticKind::LexicalError, result.range(),
            "Integer literal is too large (overflow).");
        result.has_error(true);
    }
    skip_identifier_tail(result);
    return result;
}

void Lexer::skip_identifier_tail(Token& number) {
    const size_t begin = pos_;
    if (!accept_identifier_part())
        return;

    while (accept_identifier_part())
        ;

    diag_.report(DiagnosticKind::LexicalError, range(begin),
        "Invalid start of an identifier after a number.");
    number.has_error(true);
}

Token Lexer::lex_name() {
    LUSITANO_DEBUG_ASSERT(!at_end(), "Already at the end of file.");
    LUSITANO_DEBUG_ASSERT(is_identifier_begin(std::get<0>(current_code_point())),
        "Character does not start an identifier.");

    const size_t name_start = pos_;
    while (accept_identifier_part())
        ;

    const std::string_view name = file_content_.substr(name_start, pos_ - name_start);
    const TokenType type = keyword_type(name).value_or(TokenType::Identifier);

    Token tok = make_token(type, name_start);
    if (type == TokenType::Identifier)
        tok.data(TokenData::make_string(std::string(name)));
    return tok;
}

std::optional<Token> Lexer::lex_operator() {
    LUSITANO_DEBUG_ASSERT(!at_end(), "Already at the end of file.");

    const size_t begin = pos_;

    auto getop = [&]() -> std::optional<TokenType> {
        switch (current()) {

#define LUSITANO_OP(c, ...) \
    case c: {               \
        advance();          \
        __VA_ARGS__         \
    }

            // Braces
            LUSITANO_OP('(', return TokenType::LeftParen;)
            LUSITANO_OP(')', return TokenType::RightParen;)
            LUSITANO_OP('{', return TokenType::LeftBrace;)
            LUSITANO_OP('}', return TokenType::RightBrace;)

            // Operators
            LUSITANO_OP(',', return TokenType::Comma;)
            LUSITANO_OP(':', return TokenType::Colon;)
            LUSITANO_OP(';', return TokenType::Semicolon;)
            LUSITANO_OP('+', {
                if (accept('='))
                    return TokenType::PlusEquals;
                return TokenType::Plus;
            })
            LUSITANO_OP('-', {
                if (accept('='))
                    return TokenType::MinusEquals;
                return TokenType::Minus;
            })
            LUSITANO_OP('*', {
                if (accept('*'))
                    return TokenType::StarStar;
                if (accept('='))
                    return TokenType::StarEquals;
                return TokenType::Star;
            })
            LUSITANO_OP('/', {
                if (accept('='))
                    return TokenType::SlashEquals;
                return TokenType::Slash;
            })
            LUSITANO_OP('%', return TokenType::Percent;)
            LUSITANO_OP('=', {
                if (accept('='))
                    return TokenType::EqualsEquals;
                return TokenType::Equals;
            })
            LUSITANO_OP('<', {
                if (accept('='))
                    return TokenType::LessEquals;
                return TokenType::Less;
            })
            LUSITANO_OP('>', {
                if (accept('='))
                    return TokenType::GreaterEquals;
                return TokenType::Greater;
            })
        case '!': {
            if (peek() != '=')
                return {};
            advance(2);
            return TokenType::NotEquals;
        }
        default:
            return {};

#undef LUSITANO_OP
        }
    };

    if (auto op = getop()) {
        return make_token(*op, begin);
    }
    return {};
}

void Lexer::skip_line_comment() {
    LUSITANO_DEBUG_ASSERT(
        current() == '/' && peek() == '/', "Not the start of a line comment.");

    advance(2);
    while (!at_end() && current() != '\n')
        advance();
}

bool Lexer::skip_block_comment() {
    LUSITANO_DEBUG_ASSERT(
        current() == '/' && peek() == '*', "Not the start of a block comment.");

    advance(2);
    while (!at_end()) {
        if (current() == '*' && peek() == '/') {
            advance(2);
            return true;
        }
        advance();
    }
    return false;
}

Token Lexer::make_token(TokenType type, size_t begin) const {
    Token tok(type, range(begin));
    tok.pos(source_map_.cursor_pos(tok.range()));
    return tok;
}

SourceRange Lexer::range(size_t begin) const {
    return range(begin, pos_);
}

SourceRange Lexer::range(size_t begin, size_t end) const {
    return SourceRange::from_std_offsets(begin, end);
}

char Lexer::current() const {
    LUSITANO_DEBUG_ASSERT(!at_end(), "Already at the end of file.");
    return file_content_[pos_];
}

std::tuple<CodePoint, size_t> Lexer::current_code_point() const {
    LUSITANO_DEBUG_ASSERT(!at_end(), "Already at the end of file.");
    const char* begin = file_content_.data() + pos_;
    const auto [cp, after] = decode_utf8(begin, file_content_.data() + file_content_.size());
    return std::tuple(cp, static_cast<size_t>(after - begin));
}

bool Lexer::accept_identifier_part() {
    if (at_end())
        return false;

    const auto [cp, length] = current_code_point();
    if (!is_identifier_part(cp))
        return false;

    advance(length);
    return true;
}

char Lexer::peek(size_t n) const {
    const size_t index = pos_ + n;
    return index < file_content_.size() ? file_content_[index] : '\0';
}

void Lexer::advance(size_t n) {
    LUSITANO_DEBUG_ASSERT(pos_ + n <= file_content_.size(), "Cannot advance past the end.");
    pos_ += n;
}

bool Lexer::accept(char c) {
    if (!at_end() && current() == c) {
        advance();
        return true;
    }
    return false;
}

} // namespace lusitano
