#include "common/text/unicode.hpp"

#include "common/error.hpp"

#include <catch2/catch.hpp>

#include <string>

using namespace lusitano;

TEST_CASE("decode_utf8 should return code points and their length", "[unicode]") {
    const std::string str = "aç€";
    const char* pos = str.data();
    const char* end = str.data() + str.size();

    auto [a, after_a] = decode_utf8(pos, end);
    REQUIRE(a == CodePoint('a'));
    REQUIRE(after_a == pos + 1);

    auto [c, after_c] = decode_utf8(after_a, end);
    REQUIRE(c == 0xE7u);
    REQUIRE(after_c == pos + 3);

    auto [euro, after_euro] = decode_utf8(after_c, end);
    REQUIRE(euro == 0x20ACu);
    REQUIRE(after_euro == end);

    auto [eof, after_eof] = decode_utf8(end, end);
    REQUIRE(eof == invalid_code_point);
    REQUIRE(after_eof == end);
}

TEST_CASE("decode_utf8 should throw on invalid input", "[unicode]") {
    const std::string str = "\xC3";
    REQUIRE_THROWS_AS(decode_utf8(str.data(), str.data() + str.size()), Error);
}

TEST_CASE("Identifier letters should include latin letters", "[unicode]") {
    for (CodePoint cp : {CodePoint('a'), CodePoint('Z'), CodePoint(0xC0), CodePoint(0xE3),
             CodePoint(0xE7), CodePoint(0xFF), CodePoint(0x0131), CodePoint(0x017E)}) {
        CAPTURE(cp);
        REQUIRE(is_identifier_letter(cp));
    }
}

TEST_CASE("Identifier letters should exclude symbols and compatibility characters",
    "[unicode]") {
    for (CodePoint cp : {CodePoint('0'), CodePoint('_'), CodePoint(' '), CodePoint(0xA0),
             CodePoint(0xAA), CodePoint(0xB5), CodePoint(0xD7), CodePoint(0xF7),
             CodePoint(0x0132), CodePoint(0x0149), CodePoint(0x017F), CodePoint(0x20AC)}) {
        CAPTURE(cp);
        REQUIRE(!is_identifier_letter(cp));
    }
}

TEST_CASE("validate_utf8 should report the first invalid byte", "[unicode]") {
    REQUIRE(validate_utf8("não").ok);

    auto result = validate_utf8("ab\xFF");
    REQUIRE(!result.ok);
    REQUIRE(result.error_offset == 2u);
}
