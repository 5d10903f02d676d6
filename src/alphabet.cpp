// -----------------------------------------------------------------------------
// alphabet.cpp - Implementation of the GhostComm Alphabet
//
// API & construction rule:
//   see include/ghostcomm/alphabet.hpp
//
// The table is collected range by range, validated, then a sorted copy is kept
// for reverse lookups. Nothing here allocates after construction.
// -----------------------------------------------------------------------------
#include "ghostcomm/alphabet.hpp"

#include <algorithm>

namespace ghostcomm {

const char* to_string(AlphabetStatus status) {
    switch (status) {
        case AlphabetStatus::Ok:               return "ok";
        case AlphabetStatus::TooFewSymbols:    return "too_few_symbols";
        case AlphabetStatus::DuplicateSymbol:  return "duplicate_symbol";
        case AlphabetStatus::ReservedSymbol:   return "reserved_symbol";
        case AlphabetStatus::InvalidCodePoint: return "invalid_code_point";
    }
    return "unknown";
}

Alphabet::Alphabet() {
    // The default ranges are a compile-time constant; if they were ever edited into
    // something invalid the table stays empty and size() reports 0.
    Alphabet built{Empty{}};
    if (build(GC_DEFAULT_RANGES, sizeof(GC_DEFAULT_RANGES) / sizeof(GC_DEFAULT_RANGES[0]), built)
            == AlphabetStatus::Ok) {
        *this = std::move(built);
    }
}

// The delimiter is the only reserved printable character. Anything else that
// would survive a chat app is acceptable.
bool Alphabet::is_reserved(char32_t cp) {
    return cp == static_cast<char32_t>(GC_FIELD_DELIMITER);
}

bool Alphabet::is_invalid(char32_t cp) {
    if (cp <= 0x20 || cp == 0x7F) return true;          // C0 controls, space, DEL
    if (cp >= 0x80 && cp <= 0xA0) return true;          // C1 controls, NBSP
    if (cp >= 0xD800 && cp <= 0xDFFF) return true;      // surrogates
    if (cp > 0x10FFFF) return true;                     // outside Unicode
    if (cp >= 0x2000 && cp <= 0x200F) return true;      // spaces, zero-width, direction marks
    if (cp == 0x1680 || cp == 0x2028 || cp == 0x2029 || cp == 0x202F ||
        cp == 0x205F || cp == 0x3000) return true;      // other Unicode whitespace
    return cp == 0xFEFF;                                // BOM gets stripped by editors
}

AlphabetStatus Alphabet::build(const CodeRange* ranges, size_t count, Alphabet& out) {
    std::vector<Symbol> symbols;
    symbols.reserve(GC_ALPHABET_SIZE);

    // Step 1: walk ranges in order until the table is full
    for (size_t r = 0; r < count && symbols.size() < GC_ALPHABET_SIZE; ++r) {
        for (uint32_t i = 0; i < ranges[r].count && symbols.size() < GC_ALPHABET_SIZE; ++i) {
            const char32_t cp = ranges[r].first + i;
            if (is_reserved(cp)) return AlphabetStatus::ReservedSymbol;
            if (is_invalid(cp))  return AlphabetStatus::InvalidCodePoint;
            symbols.push_back(cp);
        }
    }

    if (symbols.size() < GC_ALPHABET_SIZE) return AlphabetStatus::TooFewSymbols;

    // Step 2: sorted (symbol, index) view; adjacent equal symbols mean overlap
    std::vector<std::pair<Symbol, uint16_t>> by_symbol;
    by_symbol.reserve(GC_ALPHABET_SIZE);
    for (size_t i = 0; i < symbols.size(); ++i) {
        by_symbol.emplace_back(symbols[i], static_cast<uint16_t>(i));
    }
    std::sort(by_symbol.begin(), by_symbol.end());

    for (size_t i = 1; i < by_symbol.size(); ++i) {
        if (by_symbol[i].first == by_symbol[i - 1].first) return AlphabetStatus::DuplicateSymbol;
    }

    out.symbols_   = std::move(symbols);
    out.by_symbol_ = std::move(by_symbol);
    return AlphabetStatus::Ok;
}

std::optional<uint16_t> Alphabet::index_of(Symbol symbol) const {
    auto it = std::lower_bound(by_symbol_.begin(), by_symbol_.end(), symbol,
                               [](const std::pair<Symbol, uint16_t>& e, Symbol s) { return e.first < s; });
    if (it == by_symbol_.end() || it->first != symbol) return std::nullopt;
    return it->second;
}

SymbolString Alphabet::clean(const SymbolString& text) const {
    SymbolString out;
    out.reserve(text.size());
    for (Symbol c : text) {
        if (contains(c)) out.push_back(c);
    }
    return out;
}

} // namespace ghostcomm
