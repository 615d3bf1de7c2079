#include "common/format.hpp"

#include <iterator>

namespace lusitano {

std::string StringFormatStream::take_str() {
    std::string result;
    result.swap(buffer_);
    return result;
}

void StringFormatStream::do_vformat(std::string_view format, fmt::format_args args) {
    fmt::vformat_to(std::back_inserter(buffer_), format, args);
}

void IndentStream::do_vformat(std::string_view format, fmt::format_args args) {
    const std::string text = fmt::vformat(format, args);

    std::string_view rest = text;
    while (!rest.empty()) {
        if (line_start_)
            base_.format("{}", spaces(indent_));

        const size_t newline = rest.find('\n');
        const size_t length = newline == std::string_view::npos ? rest.size() : newline + 1;
        base_.format("{}", rest.substr(0, length));

        line_start_ = newline != std::string_view::npos;
        rest.remove_prefix(length);
    }
}

} // namespace lusitano
