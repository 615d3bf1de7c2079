#ifndef LUSITANO_COMMON_TEXT_UNICODE_HPP
#define LUSITANO_COMMON_TEXT_UNICODE_HPP

#include "common/defs.hpp"

#include <string_view>
#include <tuple>

namespace lusitano {

using CodePoint = u32;

inline constexpr CodePoint invalid_code_point = CodePoint(-1);

struct Utf8ValidationResult {
    // True if the string is valid utf8.
    bool ok = false;

    // Byte offset of the first invalid sequence. Only meaningful if `ok` is false.
    size_t error_offset = 0;
};

// Validates the given string. Returns the position of the first invalid byte sequence on failure.
Utf8ValidationResult validate_utf8(std::string_view str);

// Decodes the code point at `pos` and returns it together with the position of the
// next code point. Returns `invalid_code_point` if `pos == end`.
// Throws if the input is not valid utf8.
std::tuple<CodePoint, const char*> decode_utf8(const char* pos, const char* end);

// True if the code point is a letter that may be used in identifiers.
// Accepted are ascii letters and the latin letters of the Latin-1 and Latin Extended-A blocks,
// minus the compatibility characters (e.g. `ſ` or `ĳ`) that python would normalize
// into a different name.
bool is_identifier_letter(CodePoint cp);

} // namespace lusitano

#endif // LUSITANO_COMMON_TEXT_UNICODE_HPP
