#include <tkn/Token.hpp>

namespace tkn {

    namespace {
        template<class... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template<class... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;
    } // namespace

    std::ostream &operator<<(std::ostream &os, const Kind &kind)
    {
        std::visit(Overloaded{
                       [&](const Symbol &v) { os << "Symbol(" << v.text << ")"; },
                       [&](const Identifier &v) { os << "Identifier(" << v.text << ")"; },
                       [&](const StringLiteral &v) { os << "StringLiteral(\"" << v.content << "\")"; },
                       [&](const NumberLiteral &v) { os << "NumberLiteral(" << v.text << ", " << v.value << ")"; },
                       [&](const Keyword &v) { os << "Keyword(" << v.text << ")"; },
                       [&](const Comment &v) { os << "Comment(" << v.text << ")"; },
                   },
                   kind);
        return os;
    }

    std::ostream &operator<<(std::ostream &os, const Token &token)
    {
        os << token.kind << ' ' << token.line << ' ' << token.range.ix << ' ' << token.range.size;
        return os;
    }

} // namespace tkn
