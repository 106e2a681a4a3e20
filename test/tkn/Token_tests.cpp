#include <tkn/Error.hpp>
#include <tkn/Token.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>

namespace {
    template<typename T>
    std::string to_string(const T &t)
    {
        std::ostringstream oss;
        oss << t;
        return oss.str();
    }
} // namespace

TEST_CASE("tkn::Kind printing", "[ut][tkn][Token]")
{
    REQUIRE(to_string(tkn::Kind{tkn::Symbol{"=="}}) == "Symbol(==)");
    REQUIRE(to_string(tkn::Kind{tkn::Identifier{"abc"}}) == "Identifier(abc)");
    REQUIRE(to_string(tkn::Kind{tkn::StringLiteral{"a b"}}) == "StringLiteral(\"a b\")");
    REQUIRE(to_string(tkn::Kind{tkn::NumberLiteral{"0b11", 3}}) == "NumberLiteral(0b11, 3)");
    REQUIRE(to_string(tkn::Kind{tkn::Keyword{"end"}}) == "Keyword(end)");
    REQUIRE(to_string(tkn::Kind{tkn::Comment{"-- x"}}) == "Comment(-- x)");

    const tkn::Token token{.kind = tkn::Keyword{"if"}, .range = str::Range{.ix = 4, .size = 2}, .line = 3};
    REQUIRE(to_string(token) == "Keyword(if) 3 4 2");
}

TEST_CASE("tkn::Error printing", "[ut][tkn][Error]")
{
    REQUIRE(to_string(tkn::Error{.kind = tkn::ErrorKind::UnknownToken, .line = 2, .offset = 17}) == "2:17 : unknown token");
    REQUIRE(to_string(tkn::Error{.kind = tkn::ErrorKind::UnexpectedEof, .line = 1, .offset = 8}) == "1:8 : unexpected end of file");
}
