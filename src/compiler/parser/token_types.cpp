#include "compiler/parser/token_types.hpp"

namespace lusitano {

std::string TokenTypes::to_description() const {
    const size_t count = size();

    std::string result;
    size_t written = 0;
    for (size_t index = 0; index < set_.size(); ++index) {
        if (!set_.test(index))
            continue;

        if (written > 0)
            result += written + 1 == count ? " or " : ", ";
        result += lusitano::to_description(static_cast<TokenType>(index));
        ++written;
    }
    return result;
}

} // namespace lusitano
