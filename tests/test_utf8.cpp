#include <doctest/doctest.h>
#include "ghostcomm/utf8.hpp"

using namespace ghostcomm;

TEST_CASE("UTF-8 decode of ASCII, 2, 3 and 4 byte sequences") {
    const std::string s = "a\xC3\xA9\xE4\xB8\x80\xF0\x9F\x98\x80";   // a é 一 😀
    SymbolString d = utf8::decode(s);
    REQUIRE(d.size() == 4);
    CHECK(d[0] == U'a');
    CHECK(d[1] == U'\u00E9');
    CHECK(d[2] == U'\u4E00');
    CHECK(d[3] == U'\U0001F600');
}

TEST_CASE("UTF-8 encode mirrors decode for valid text") {
    const SymbolString s = U"GC:\u4E00\uCDFF";
    CHECK(utf8::decode(utf8::encode(s)) == s);
    CHECK(utf8::encode(U"\u4E00") == std::string("\xE4\xB8\x80"));
}

TEST_CASE("Malformed input is skipped, not fatal") {
    SUBCASE("stray continuation byte") {
        CHECK(utf8::decode(std::string("a\x80" "b")) == SymbolString(U"ab"));
    }
    SUBCASE("truncated sequence at end") {
        CHECK(utf8::decode(std::string("a\xE4\xB8")) == SymbolString(U"a"));
    }
    SUBCASE("overlong encoding of '/'") {
        CHECK(utf8::decode(std::string("\xC0\xAF" "x")) == SymbolString(U"x"));
    }
    SUBCASE("encoded surrogate") {
        CHECK(utf8::decode(std::string("\xED\xA0\x80" "x")) == SymbolString(U"x"));
    }
}

TEST_CASE("append refuses code points UTF-8 cannot carry") {
    std::string out;
    CHECK(utf8::append(out, U'\u4E00'));
    CHECK_FALSE(utf8::append(out, static_cast<char32_t>(0xD800)));
    CHECK_FALSE(utf8::append(out, static_cast<char32_t>(0x110000)));
    CHECK(out == "\xE4\xB8\x80");
}
