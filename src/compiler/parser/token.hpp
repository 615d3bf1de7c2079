#ifndef LUSITANO_COMPILER_PARSER_TOKEN_HPP
#define LUSITANO_COMPILER_PARSER_TOKEN_HPP

#include "common/defs.hpp"
#include "common/format.hpp"
#include "compiler/source_map.hpp"
#include "compiler/source_range.hpp"

#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace lusitano {

/// List of all known tokens.
///
/// Note: if you add a new keyword, you will likely want to
/// add the string --> token_type mapping in lexer.cpp (keywords_table) as well.
enum class TokenType : u8 {
    InvalidToken = 0,
    Eof,

    // Primitives
    Identifier,     // ordinary variable names
    StringLiteral,  // "abc" or 'abc'
    RealLiteral,    // 123.456 1e10
    IntegerLiteral, // 123

    // Keywords
    KwFuncao,
    KwVar,
    KwConst,
    KwSe,
    KwSenao,
    KwSenaose,
    KwEnquanto,
    KwPara,
    KwDe,
    KwAte,
    KwPasso,
    KwRetorna,
    KwEscreva,
    KwLeia,
    KwE,
    KwOu,
    KwNao,
    KwVerdadeiro,
    KwFalso,

    // Type names
    KwInteiro,
    KwReal,
    KwTexto,
    KwLogico,
    KwVazio,

    // Braces
    LeftParen,  // (
    RightParen, // )
    LeftBrace,  // {
    RightBrace, // }

    // Operators
    Comma,         // ,
    Colon,         // :
    Semicolon,     // ;
    Plus,          // +
    Minus,         // -
    Star,          // *
    StarStar,      // **
    Slash,         // /
    Percent,       // %
    PlusEquals,    // +=
    MinusEquals,   // -=
    StarEquals,    // *=
    SlashEquals,   // /=
    Equals,        // =
    EqualsEquals,  // ==
    NotEquals,     // !=
    Less,          // <
    Greater,       // >
    LessEquals,    // <=
    GreaterEquals, // >=

    // Must keep in sync with largest value!
    MaxEnumValue = GreaterEquals
};

// Returns the name of the enum identifier.
std::string_view to_token_name(TokenType tok);

// Returns a human readable string for the given token.
std::string_view to_description(TokenType tok);

inline std::string_view to_string(TokenType tok) {
    return to_token_name(tok);
}

// Returns the raw numeric value of the given token type.
constexpr auto to_underlying(TokenType type) {
    return static_cast<std::underlying_type_t<TokenType>>(type);
}

enum class TokenDataType : u8 {
    None,
    Integer,
    Real,
    String,
};

std::string_view to_string(TokenDataType type);

/// Represents data associated with a token.
class TokenData final {
public:
    /// No additional value at all (the most common case).
    struct None final {};

    using Integer = i64;

    using Real = f64;

    /// The decoded value of a string literal, or the name of an identifier.
    using String = std::string;

    static TokenData make_none();
    static TokenData make_integer(Integer integer);
    static TokenData make_real(Real real);
    static TokenData make_string(String string);

    TokenDataType type() const noexcept { return static_cast<TokenDataType>(data_.index()); }

    const Integer& as_integer() const;
    const Real& as_real() const;
    const String& as_string() const;

    void format(FormatStream& stream) const;

private:
    using Storage = std::variant<None, Integer, Real, String>;

    explicit TokenData(Storage data)
        : data_(std::move(data)) {}

private:
    Storage data_;
};

class Token final {
public:
    Token() = default;

    Token(TokenType type, const SourceRange& range)
        : type_(type)
        , range_(range) {}

    // Type of the token.
    TokenType type() const { return type_; }
    void type(TokenType t) { type_ = t; }

    // Source code part that contains the token.
    const SourceRange& range() const { return range_; }
    void range(const SourceRange& range) { range_ = range; }

    // Line and column of the first character of the token.
    const CursorPosition& pos() const { return pos_; }
    void pos(const CursorPosition& pos) { pos_ = pos; }

    // True if the Token contains an error (e.g. an invalid escape sequence
    // within a string literal or an overflowing integer).
    bool has_error() const { return has_error_; }
    void has_error(bool has_error) { has_error_ = has_error; }

    const TokenData& data() const { return data_; }
    void data(TokenData data) { data_ = std::move(data); }

    void format(FormatStream& stream) const;

private:
    TokenType type_ = TokenType::InvalidToken;
    bool has_error_ = false;
    SourceRange range_;
    CursorPosition pos_;
    TokenData data_ = TokenData::make_none();
};

} // namespace lusitano

LUSITANO_ENABLE_FREE_TO_STRING(lusitano::TokenType)
LUSITANO_ENABLE_FREE_TO_STRING(lusitano::TokenDataType)
LUSITANO_ENABLE_MEMBER_FORMAT(lusitano::TokenData)
LUSITANO_ENABLE_MEMBER_FORMAT(lusitano::Token)

#endif // LUSITANO_COMPILER_PARSER_TOKEN_HPP
