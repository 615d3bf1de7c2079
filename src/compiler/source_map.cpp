#include "compiler/source_map.hpp"

#include "common/assert.hpp"
#include "common/error.hpp"

#include <algorithm>

namespace lusitano {

// Counts utf8 code points by skipping continuation bytes.
static size_t count_code_points(const char* begin, const char* end) {
    size_t count = 0;
    for (const char* pos = begin; pos != end; ++pos) {
        if ((static_cast<unsigned char>(*pos) & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

CursorPosition::CursorPosition(u32 line, u32 column)
    : line_(line)
    , column_(column) {
    LUSITANO_DEBUG_ASSERT(line_ > 0, "Invalid line.");
    LUSITANO_DEBUG_ASSERT(column_ > 0, "Invalid column.");
}

void CursorPosition::format(FormatStream& stream) const {
    stream.format("{}:{}", line_, column_);
}

SourceMap::SourceMap(std::string file_name, std::string_view source_text)
    : file_name_(std::move(file_name))
    , source_text_(source_text)
    , file_size_(source_text.size())
    , line_starts_(compute_line_starts(source_text)) {}

CursorPosition SourceMap::cursor_pos(const SourceRange& range) const {
    return cursor_pos(range.begin());
}

CursorPosition SourceMap::cursor_pos(u32 offset) const {
    LUSITANO_CHECK(offset <= file_size_, "Source offset is out of bounds.");

    // Find the start of the current line.
    const auto line_start_pos = [&] {
        // First one greater than offset
        auto pos = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
        LUSITANO_DEBUG_ASSERT(pos != line_starts_.begin(),
            "Invariant error."); // 0 is part of the vector

        // Last one <= offset
        return pos - 1;
    }();

    // 0-based index of the current line within the source text.
    const size_t line_index = static_cast<size_t>(line_start_pos - line_starts_.begin());

    // 0-based byte offset of the start of the current line within the source text.
    const size_t line_start_offset = *line_start_pos;

    const size_t code_points = count_code_points(
        source_text_.data() + line_start_offset, source_text_.data() + offset);

    return CursorPosition(static_cast<u32>(line_index + 1), static_cast<u32>(code_points + 1));
}

std::vector<size_t> SourceMap::compute_line_starts(std::string_view source_text) {
    std::vector<size_t> line_starts{0};

    const size_t size = source_text.size();
    for (size_t i = 0; i < size; ++i) {
        if (source_text[i] == '\n')
            line_starts.push_back(i + 1);
    }

    return line_starts;
}

} // namespace lusitano
