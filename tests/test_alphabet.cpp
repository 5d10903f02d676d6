#include <doctest/doctest.h>
#include "ghostcomm/alphabet.hpp"

using namespace ghostcomm;

TEST_CASE("Default alphabet covers U+4E00 .. U+CDFF") {
    Alphabet a;
    REQUIRE(a.size() == GC_ALPHABET_SIZE);

    CHECK(a.symbol_of(0)     == U'\u4E00');
    CHECK(a.symbol_of(1)     == U'\u4E01');
    CHECK(a.symbol_of(32767) == U'\uCDFF');

    CHECK(a.index_of(U'\u4E00').value() == 0);
    CHECK(a.index_of(U'\uCDFF').value() == 32767);
    CHECK_FALSE(a.index_of(U'\uCE00').has_value());
    CHECK_FALSE(a.index_of(U'\u4DFF').has_value());
}

TEST_CASE("Delimiter and ASCII are never symbols") {
    Alphabet a;
    CHECK_FALSE(a.contains(U':'));
    CHECK_FALSE(a.contains(U'G'));
    CHECK_FALSE(a.contains(U' '));
    CHECK_FALSE(a.contains(U'\n'));
}

TEST_CASE("Every index maps back to itself") {
    Alphabet a;
    bool all = true;
    for (uint32_t i = 0; i < GC_ALPHABET_SIZE; ++i) {
        auto back = a.index_of(a.symbol_of(static_cast<uint16_t>(i)));
        if (!back || *back != i) { all = false; break; }
    }
    CHECK(all);
}

TEST_CASE("symbol_of ignores bits above 15") {
    Alphabet a;
    CHECK(a.symbol_of(0x8000) == a.symbol_of(0));
    CHECK(a.symbol_of(0xFFFF) == a.symbol_of(0x7FFF));
}

TEST_CASE("clean keeps only alphabet symbols, in order") {
    Alphabet a;
    SymbolString dirty = U"x\u4E00 \u4E01\n:\u00A0\u4E02!";
    CHECK(a.clean(dirty) == SymbolString(U"\u4E00\u4E01\u4E02"));
    CHECK(a.clean(SymbolString()).empty());
}

TEST_CASE("Custom ranges are validated") {
    Alphabet out;

    SUBCASE("too few") {
        const CodeRange r[] = {{0x4E00, 100}};
        CHECK(Alphabet::build(r, 1, out) == AlphabetStatus::TooFewSymbols);
    }
    SUBCASE("overlapping ranges") {
        const CodeRange r[] = {{0x4E00, 16384}, {0x4E00, 16384}};
        CHECK(Alphabet::build(r, 2, out) == AlphabetStatus::DuplicateSymbol);
    }
    SUBCASE("range containing the delimiter") {
        const CodeRange r[] = {{0x30, 32768}};
        CHECK(Alphabet::build(r, 1, out) == AlphabetStatus::ReservedSymbol);
    }
    SUBCASE("control characters") {
        const CodeRange r[] = {{0x00, 32768}};
        CHECK(Alphabet::build(r, 1, out) == AlphabetStatus::InvalidCodePoint);
    }
    SUBCASE("surrogates") {
        const CodeRange r[] = {{0xD000, 32768}};
        CHECK(Alphabet::build(r, 1, out) == AlphabetStatus::InvalidCodePoint);
    }
    SUBCASE("failed build leaves the target untouched") {
        Alphabet def;
        const CodeRange r[] = {{0x4E00, 10}};
        REQUIRE(Alphabet::build(r, 1, def) == AlphabetStatus::TooFewSymbols);
        CHECK(def.size() == GC_ALPHABET_SIZE);
        CHECK(def.symbol_of(0) == U'\u4E00');
    }
}

TEST_CASE("Split ranges build a usable table") {
    // Hangul syllables + the tail of CJK Extension A + CJK unified
    const CodeRange r[] = {{0xAC00, 11172}, {0x4E00, 21596}};
    Alphabet a;
    REQUIRE(Alphabet::build(r, 2, a) == AlphabetStatus::Ok);
    CHECK(a.size() == GC_ALPHABET_SIZE);
    CHECK(a.symbol_of(0) == U'\uAC00');
    CHECK(a.symbol_of(11172) == U'\u4E00');
    CHECK(a.index_of(U'\u4E00').value() == 11172);
}
