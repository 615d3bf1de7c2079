#ifndef LUSITANO_COMPILER_SOURCE_MAP_HPP
#define LUSITANO_COMPILER_SOURCE_MAP_HPP

#include "common/format.hpp"
#include "compiler/source_range.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace lusitano {

/// Represents the position of a cursor (line and column) in a source text.
/// Note that the line and column numbers refer to unicode code points.
class CursorPosition final {
public:
    /// Constructs an invalid instance.
    CursorPosition() = default;

    /// Constructs a valid instance (line and column > 0).
    CursorPosition(u32 line, u32 column);

    /// 1 based
    u32 line() const { return line_; }

    /// 1 based
    u32 column() const { return column_; }

    /// True iff valid.
    explicit operator bool() const { return line_ != 0; }

    void format(FormatStream& stream) const;

private:
    u32 line_ = 0;
    u32 column_ = 0;
};

inline bool operator==(const CursorPosition& lhs, const CursorPosition& rhs) {
    return lhs.line() == rhs.line() && lhs.column() == rhs.column();
}

inline bool operator!=(const CursorPosition& lhs, const CursorPosition& rhs) {
    return !(lhs == rhs);
}

class SourceMap final {
public:
    // Note: source_text is stored by reference!
    explicit SourceMap(std::string file_name, std::string_view source_text);

    const std::string& file_name() const { return file_name_; }

    // Computes the cursor position for the start of the given source range.
    CursorPosition cursor_pos(const SourceRange& range) const;

    // Computes the cursor position for the given byte offset.
    CursorPosition cursor_pos(u32 offset) const;

private:
    static std::vector<size_t> compute_line_starts(std::string_view source_text);

private:
    std::string file_name_;
    std::string_view source_text_;
    size_t file_size_ = 0;

    // Contains the indices of line starts within the source string,
    // in ascending order.
    std::vector<size_t> line_starts_;
};

} // namespace lusitano

LUSITANO_ENABLE_MEMBER_FORMAT(lusitano::CursorPosition)

#endif // LUSITANO_COMPILER_SOURCE_MAP_HPP
