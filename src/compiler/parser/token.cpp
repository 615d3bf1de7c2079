#include "compiler/parser/token.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"

namespace lusitano {

std::string_view to_token_name(TokenType tok) {
    switch (tok) {
#define LUSITANO_CASE(x) \
    case (TokenType::x): \
        return #x;

        LUSITANO_CASE(InvalidToken)
        LUSITANO_CASE(Eof)

        LUSITANO_CASE(Identifier)
        LUSITANO_CASE(StringLiteral)
        LUSITANO_CASE(RealLiteral)
        LUSITANO_CASE(IntegerLiteral)

        LUSITANO_CASE(KwFuncao)
        LUSITANO_CASE(KwVar)
        LUSITANO_CASE(KwConst)
        LUSITANO_CASE(KwSe)
        LUSITANO_CASE(KwSenao)
        LUSITANO_CASE(KwSenaose)
        LUSITANO_CASE(KwEnquanto)
        LUSITANO_CASE(KwPara)
        LUSITANO_CASE(KwDe)
        LUSITANO_CASE(KwAte)
        LUSITANO_CASE(KwPasso)
        LUSITANO_CASE(KwRetorna)
        LUSITANO_CASE(KwEscreva)
        LUSITANO_CASE(KwLeia)
        LUSITANO_CASE(KwE)
        LUSITANO_CASE(KwOu)
        LUSITANO_CASE(KwNao)
        LUSITANO_CASE(KwVerdadeiro)
        LUSITANO_CASE(KwFalso)

        LUSITANO_CASE(KwInteiro)
        LUSITANO_CASE(KwReal)
        LUSITANO_CASE(KwTexto)
        LUSITANO_CASE(KwLogico)
        LUSITANO_CASE(KwVazio)

        LUSITANO_CASE(LeftParen)
        LUSITANO_CASE(RightParen)
        LUSITANO_CASE(LeftBrace)
        LUSITANO_CASE(RightBrace)

        LUSITANO_CASE(Comma)
        LUSITANO_CASE(Colon)
        LUSITANO_CASE(Semicolon)
        LUSITANO_CASE(Plus)
        LUSITANO_CASE(Minus)
        LUSITANO_CASE(Star)
        LUSITANO_CASE(StarStar)
        LUSITANO_CASE(Slash)
        LUSITANO_CASE(Percent)
        LUSITANO_CASE(PlusEquals)
        LUSITANO_CASE(MinusEquals)
        LUSITANO_CASE(StarEquals)
        LUSITANO_CASE(SlashEquals)
        LUSITANO_CASE(Equals)
        LUSITANO_CASE(EqualsEquals)
        LUSITANO_CASE(NotEquals)
        LUSITANO_CASE(Less)
        LUSITANO_CASE(Greater)
        LUSITANO_CASE(LessEquals)
        LUSITANO_CASE(GreaterEquals)

#undef LUSITANO_CASE
    }

    LUSITANO_UNREACHABLE("Invalid token type");
}

std::string_view to_description(TokenType tok) {
    switch (tok) {
#define LUSITANO_CASE(x, s) \
    case TokenType::x:      \
        return s;

#define LUSITANO_CASE_Q(x, s) LUSITANO_CASE(x, "'" s "'")

        LUSITANO_CASE(InvalidToken, "<invalid_token>")
        LUSITANO_CASE(Eof, "<end of file>")

        LUSITANO_CASE(Identifier, "<identifier>")
        LUSITANO_CASE(StringLiteral, "<string>")
        LUSITANO_CASE(RealLiteral, "<real>")
        LUSITANO_CASE(IntegerLiteral, "<integer>")

        LUSITANO_CASE_Q(KwFuncao, "funcao")
        LUSITANO_CASE_Q(KwVar, "var")
        LUSITANO_CASE_Q(KwConst, "const")
        LUSITANO_CASE_Q(KwSe, "se")
        LUSITANO_CASE_Q(KwSenao, "senao")
        LUSITANO_CASE_Q(KwSenaose, "senaose")
        LUSITANO_CASE_Q(KwEnquanto, "enquanto")
        LUSITANO_CASE_Q(KwPara, "para")
        LUSITANO_CASE_Q(KwDe, "de")
        LUSITANO_CASE_Q(KwAte, "ate")
        LUSITANO_CASE_Q(KwPasso, "passo")
        LUSITANO_CASE_Q(KwRetorna, "retorna")
        LUSITANO_CASE_Q(KwEscreva, "escreva")
        LUSITANO_CASE_Q(KwLeia, "leia")
        LUSITANO_CASE_Q(KwE, "e")
        LUSITANO_CASE_Q(KwOu, "ou")
        LUSITANO_CASE_Q(KwNao, "nao")
        LUSITANO_CASE_Q(KwVerdadeiro, "verdadeiro")
        LUSITANO_CASE_Q(KwFalso, "falso")

        LUSITANO_CASE_Q(KwInteiro, "inteiro")
        LUSITANO_CASE_Q(KwReal, "real")
        LUSITANO_CASE_Q(KwTexto, "texto")
        LUSITANO_CASE_Q(KwLogico, "logico")
        LUSITANO_CASE_Q(KwVazio, "vazio")

        LUSITANO_CASE_Q(LeftParen, "(")
        LUSITANO_CASE_Q(RightParen, ")")
        LUSITANO_CASE_Q(LeftBrace, "{")
        LUSITANO_CASE_Q(RightBrace, "}")

        LUSITANO_CASE_Q(Comma, ",")
        LUSITANO_CASE_Q(Colon, ":")
        LUSITANO_CASE_Q(Semicolon, ";")
        LUSITANO_CASE_Q(Plus, "+")
        LUSITANO_CASE_Q(Minus, "-")
        LUSITANO_CASE_Q(Star, "*")
        LUSITANO_CASE_Q(StarStar, "**")
        LUSITANO_CASE_Q(Slash, "/")
        LUSITANO_CASE_Q(Percent, "%")
        LUSITANO_CASE_Q(PlusEquals, "+=")
        LUSITANO_CASE_Q(MinusEquals, "-=")
        LUSITANO_CASE_Q(StarEquals, "*=")
        LUSITANO_CASE_Q(SlashEquals, "/=")
        LUSITANO_CASE_Q(Equals, "=")
        LUSITANO_CASE_Q(EqualsEquals, "==")
        LUSITANO_CASE_Q(NotEquals, "!=")
        LUSITANO_CASE_Q(Less, "<")
        LUSITANO_CASE_Q(Greater, ">")
        LUSITANO_CASE_Q(LessEquals, "<=")
        LUSITANO_CASE_Q(GreaterEquals, ">=")

#undef LUSITANO_CASE
#undef LUSITANO_CASE_Q
    }

    LUSITANO_UNREACHABLE("Invalid token type");
}

std::string_view to_string(TokenDataType type) {
    switch (type) {
    case TokenDataType::None:
        return "None";
    case TokenDataType::Integer:
        return "Integer";
    case TokenDataType::Real:
        return "Real";
    case TokenDataType::String:
        return "String";
    }
    LUSITANO_UNREACHABLE("Invalid TokenDataType.");
}

TokenData TokenData::make_none() {
    return TokenData(Storage(std::in_place_type<None>));
}

TokenData TokenData::make_integer(Integer integer) {
    return TokenData(Storage(std::in_place_type<Integer>, integer));
}

TokenData TokenData::make_real(Real real) {
    return TokenData(Storage(std::in_place_type<Real>, real));
}

TokenData TokenData::make_string(String string) {
    return TokenData(Storage(std::in_place_type<String>, std::move(string)));
}

const TokenData::Integer& TokenData::as_integer() const {
    LUSITANO_CHECK(type() == TokenDataType::Integer,
        "Bad member access on TokenData: not a Integer.");
    return std::get<Integer>(data_);
}

const TokenData::Real& TokenData::as_real() const {
    LUSITANO_CHECK(type() == TokenDataType::Real, "Bad member access on TokenData: not a Real.");
    return std::get<Real>(data_);
}

const TokenData::String& TokenData::as_string() const {
    LUSITANO_CHECK(
        type() == TokenDataType::String, "Bad member access on TokenData: not a String.");
    return std::get<String>(data_);
}

void TokenData::format(FormatStream& stream) const {
    switch (type()) {
    case TokenDataType::None:
        stream.format("None");
        return;
    case TokenDataType::Integer:
        stream.format("Integer({})", as_integer());
        return;
    case TokenDataType::Real:
        stream.format("Real({})", as_real());
        return;
    case TokenDataType::String:
        stream.format("String(\"{}\")", as_string());
        return;
    }
    LUSITANO_UNREACHABLE("Invalid TokenDataType.");
}

void Token::format(FormatStream& stream) const {
    stream.format("Token(type: {}, range: {}, pos: {}, has_error: {}, data: {})", type_, range_,
        pos_, has_error_, data_);
}

} // namespace lusitano
