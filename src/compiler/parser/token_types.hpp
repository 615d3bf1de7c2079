#ifndef LUSITANO_COMPILER_PARSER_TOKEN_TYPES_HPP
#define LUSITANO_COMPILER_PARSER_TOKEN_TYPES_HPP

#include "common/defs.hpp"
#include "compiler/parser/token.hpp"

#include <bitset>
#include <initializer_list>
#include <string>

namespace lusitano {

/// A small set of token types. Used for the expected tokens of a parser rule
/// and for the synchronization tokens of error recovery.
class TokenTypes final {
public:
    TokenTypes() = default;

    TokenTypes(TokenType type) { set_.set(to_underlying(type)); }

    TokenTypes(std::initializer_list<TokenType> types) {
        for (auto type : types)
            set_.set(to_underlying(type));
    }

    bool contains(TokenType type) const { return set_.test(to_underlying(type)); }

    size_t size() const { return set_.count(); }

    /// Returns a copy of this set that additionally contains all members of `other`.
    TokenTypes union_with(TokenTypes other) const {
        other.set_ |= set_;
        return other;
    }

    /// Returns a human readable list of the token descriptions in enum order,
    /// e.g. "')' or ','".
    std::string to_description() const;

private:
    std::bitset<to_underlying(TokenType::MaxEnumValue) + 1> set_;
};

} // namespace lusitano

#endif // LUSITANO_COMPILER_PARSER_TOKEN_TYPES_HPP
