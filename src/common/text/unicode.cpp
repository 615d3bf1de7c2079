#include "common/text/unicode.hpp"

#include "common/error.hpp"

#include <utf8.h>

#include <algorithm>
#include <iterator>

namespace lusitano {

namespace {

struct Interval {
    CodePoint first;
    CodePoint last;
};

} // namespace

// Sorted and disjoint.
static constexpr Interval identifier_letters[] = {
    {0x0041, 0x005A}, // A-Z
    {0x0061, 0x007A}, // a-z
    {0x00C0, 0x00D6}, // À-Ö
    {0x00D8, 0x00F6}, // Ø-ö
    {0x00F8, 0x0131}, // ø-ı
    {0x0134, 0x013E}, // Ĵ-ľ
    {0x0141, 0x0148}, // Ł-ň
    {0x014A, 0x017E}, // Ŋ-ž
};

static bool interval_set_contains(CodePoint cp) {
    // Find the first interval that has last >= cp
    auto pos = std::lower_bound(std::begin(identifier_letters), std::end(identifier_letters), cp,
        [&](const Interval& entry, CodePoint key) { return entry.last < key; });
    if (pos == std::end(identifier_letters))
        return false;

    return pos->first <= cp;
}

Utf8ValidationResult validate_utf8(std::string_view str) {
    Utf8ValidationResult result;

    auto invalid = utf8::find_invalid(str.begin(), str.end());
    if (invalid == str.end()) {
        result.ok = true;
        return result;
    }

    result.ok = false;
    result.error_offset = static_cast<size_t>(invalid - str.begin());
    return result;
}

std::tuple<CodePoint, const char*> decode_utf8(const char* pos, const char* end) {
    if (pos == end)
        return std::tuple(invalid_code_point, end);

    try {
        CodePoint cp = utf8::next(pos, end);
        return std::tuple(cp, pos);
    } catch (const utf8::exception& e) {
        LUSITANO_ERROR("Invalid utf8: {}", e.what());
    }
}

bool is_identifier_letter(CodePoint cp) {
    return interval_set_contains(cp);
}

} // namespace lusitano
