#include <str/Utf8.hpp>

#include <catch2/catch_test_macros.hpp>

TEST_CASE("str::decode", "[ut][str][Utf8]")
{
    std::u32string dst;
    std::optional<std::size_t> bad_offset;

    SECTION("ascii")
    {
        REQUIRE(str::decode(dst, "abc", &bad_offset) == ReturnCode::Ok);
        REQUIRE(dst == U"abc");
        REQUIRE(!bad_offset);
    }
    SECTION("multi-byte")
    {
        REQUIRE(str::decode(dst, "là €𝄞", &bad_offset) == ReturnCode::Ok);
        REQUIRE(dst == U"là €𝄞");
    }
    SECTION("truncated sequence")
    {
        REQUIRE(str::decode(dst, "a\xC3", &bad_offset) != ReturnCode::Ok);
        REQUIRE(bad_offset == 1u);
    }
    SECTION("lone continuation byte")
    {
        REQUIRE(str::decode(dst, "ab\x80", &bad_offset) != ReturnCode::Ok);
        REQUIRE(bad_offset == 2u);
    }
    SECTION("overlong encoding")
    {
        REQUIRE(str::decode(dst, "\xC0\xAF", &bad_offset) != ReturnCode::Ok);
        REQUIRE(bad_offset == 0u);
    }
    SECTION("surrogate")
    {
        REQUIRE(str::decode(dst, "x\xED\xA0\x80", &bad_offset) != ReturnCode::Ok);
        REQUIRE(bad_offset == 1u);
    }
    SECTION("beyond U+10FFFF")
    {
        REQUIRE(str::decode(dst, "\xF4\x90\x80\x80", &bad_offset) != ReturnCode::Ok);
    }
}

TEST_CASE("str::encode", "[ut][str][Utf8]")
{
    REQUIRE(str::encode(U"") == "");
    REQUIRE(str::encode(U"a") == "a");
    REQUIRE(str::encode(U"à") == "à");
    REQUIRE(str::encode(U"€") == "€");
    REQUIRE(str::encode(U"𝄞") == "𝄞");
}

TEST_CASE("str::length", "[ut][str][Utf8]")
{
    REQUIRE(str::length("") == 0);
    REQUIRE(str::length("abc") == 3);
    REQUIRE(str::length("là") == 2);
    REQUIRE(str::length("→𝄞") == 2);
}
