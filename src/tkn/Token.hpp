#ifndef HEADER_tkn_Token_hpp_ALREADY_INCLUDED
#define HEADER_tkn_Token_hpp_ALREADY_INCLUDED

#include <str/Range.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace tkn {

    using Number = double;

    struct Symbol
    {
        std::string text;
        bool operator==(const Symbol &) const = default;
    };
    struct Identifier
    {
        std::string text;
        bool operator==(const Identifier &) const = default;
    };
    // Unescaped content, without the surrounding quotes
    struct StringLiteral
    {
        std::string content;
        bool operator==(const StringLiteral &) const = default;
    };
    struct NumberLiteral
    {
        std::string text;
        Number value{};
        bool operator==(const NumberLiteral &) const = default;
    };
    struct Keyword
    {
        std::string text;
        bool operator==(const Keyword &) const = default;
    };
    struct Comment
    {
        std::string text;
        bool operator==(const Comment &) const = default;
    };

    using Kind = std::variant<Symbol, Identifier, StringLiteral, NumberLiteral, Keyword, Comment>;

    std::ostream &operator<<(std::ostream &os, const Kind &kind);

    // One record per emitted token: kind, span and line are always pushed together
    struct Token
    {
        Kind kind;
        str::Range range;
        std::uint32_t line{};
    };
    std::ostream &operator<<(std::ostream &os, const Token &token);

    using Tokens = std::vector<Token>;

} // namespace tkn

#endif
