#include "compiler/source_range.hpp"

#include "common/error.hpp"

#include <limits>

namespace lusitano {

SourceRange SourceRange::from_std_offsets(size_t begin, size_t end) {
    LUSITANO_CHECK(begin <= std::numeric_limits<u32>::max(), "Index too large for 32 bit.");
    LUSITANO_CHECK(end <= std::numeric_limits<u32>::max(), "Index too large for 32 bit.");
    return SourceRange(static_cast<u32>(begin), static_cast<u32>(end));
}

SourceRange SourceRange::from_std_offset(size_t offset) {
    return from_std_offsets(offset, offset);
}

SourceRange::SourceRange(u32 begin, u32 end)
    : begin_(begin)
    , end_(end) {
    LUSITANO_CHECK(begin <= end, "Invalid range: 'begin' must be <= 'end'.");
}

void SourceRange::format(FormatStream& stream) const {
    if (empty()) {
        stream.format("[{}, empty]", begin());
        return;
    }

    stream.format("[{}, {}]", begin(), end());
}

std::string_view substring(std::string_view file, const SourceRange& range) {
    LUSITANO_CHECK(range.end() <= file.size(),
        "Source file range is out of bounds for the given source content.");
    return file.substr(range.begin(), range.end() - range.begin());
}

} // namespace lusitano
