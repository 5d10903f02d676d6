/**
 * @file alphabet.hpp
 * @brief GhostComm Alphabet - fixed, bijective table of 32768 transport-safe symbols.
 *
 * Every symbol of an encoded stream carries exactly 15 bits, so the alphabet must
 * hold exactly 2^15 = 32768 distinct Unicode code points. The table is built once
 * from an ordered list of contiguous code point ranges and never changes afterwards.
 *
 * ## Construction rule
 *
 * Ranges are walked in order and their code points appended until 32768 symbols
 * are collected; whatever is left of the last range is ignored. The default list
 * holds a single range:
 *
 * | Range            | Count | Content                                   |
 * |------------------|-------|-------------------------------------------|
 * | U+4E00..U+CDFF   | 32768 | CJK ideographs, then following BMP blocks |
 *
 * This is the table the existing GhostComm clients use, so volumes produced here
 * paste straight into them and vice versa.
 *
 * ## Compatibility contract
 *
 * Sender and receiver must use bit-identical alphabets. There is no version
 * field on the wire: decoding with a different table does not fail, it silently
 * yields different bytes. Treat any change to `GC_DEFAULT_RANGES` as a wire
 * format break.
 *
 * ## Reserved characters
 *
 * A symbol may never be:
 * - the field delimiter `:` (volume headers are split on it),
 * - ASCII control characters or whitespace (chat apps rewrite them),
 * - a UTF-16 surrogate or anything above U+10FFFF (not encodable in UTF-8).
 *
 * `Alphabet::build()` reports these as an `AlphabetStatus` instead of building a
 * broken table.
 *
 * ## Example
 * @code
 * ghostcomm::Alphabet alphabet;                 // default table
 * char32_t s = alphabet.symbol_of(0x1234);
 * auto idx  = alphabet.index_of(s);             // -> 0x1234
 * @endcode
 */
#ifndef GHOSTCOMM_ALPHABET_HPP
#define GHOSTCOMM_ALPHABET_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ghostcomm {

/// One symbol: a Unicode code point.
using Symbol = char32_t;

/// A sequence of symbols (code points, not UTF-8 bytes).
using SymbolString = std::u32string;

static constexpr size_t   GC_ALPHABET_SIZE   = 32768;   ///< 2^15 symbols
static constexpr uint32_t GC_SYMBOL_BITS     = 15;      ///< payload bits per symbol
static constexpr uint16_t GC_SYMBOL_MASK     = 0x7FFF;  ///< low 15 bits
static constexpr char     GC_FIELD_DELIMITER = ':';     ///< volume header separator

/// A contiguous run of code points `[first, first + count)`.
struct CodeRange {
    char32_t first;
    uint32_t count;
};

/// Default construction rule. Changing this breaks compatibility with every deployed peer.
static constexpr CodeRange GC_DEFAULT_RANGES[] = {
    { 0x4E00, 32768 },
};

/// Result codes for Alphabet::build().
enum class AlphabetStatus : uint8_t {
    Ok = 0,
    TooFewSymbols,     ///< ranges ran out before 32768 symbols
    DuplicateSymbol,   ///< two ranges overlap
    ReservedSymbol,    ///< a range contains the field delimiter
    InvalidCodePoint,  ///< control, whitespace, surrogate or > U+10FFFF
};

/// Short reason string ("too_few_symbols", ...).
const char* to_string(AlphabetStatus status);

/**
 * @class Alphabet
 * @brief Immutable index <-> symbol table.
 *
 * Forward lookup is a direct array access. Reverse lookup is a binary search over
 * a sorted copy of the table, so arbitrary (non-contiguous) range lists work.
 *
 * Instances are meant to be built once and passed by `const Alphabet&` to the
 * codec, the extractor and the receiver, all of which keep the reference.
 */
class Alphabet {
public:
    /// Builds the default table from GC_DEFAULT_RANGES.
    Alphabet();

    /**
     * @brief Build a table from a custom range list.
     * @param ranges Ordered ranges; consumed until 32768 symbols are collected.
     * @param count  Number of entries in `ranges`.
     * @param out    Receives the table on success; left untouched on failure.
     * @return AlphabetStatus::Ok or the first problem found.
     */
    static AlphabetStatus build(const CodeRange* ranges, size_t count, Alphabet& out);

    /// Symbol for a 15-bit index. Bits above the low 15 are ignored.
    Symbol symbol_of(uint16_t index) const { return symbols_[index & GC_SYMBOL_MASK]; }

    /// Index for a symbol, or std::nullopt if the code point is not in the table.
    std::optional<uint16_t> index_of(Symbol symbol) const;

    /// Convenience membership test.
    bool contains(Symbol symbol) const { return index_of(symbol).has_value(); }

    /// Always GC_ALPHABET_SIZE for a built table.
    size_t size() const { return symbols_.size(); }

    /// Copy of `text` with every character outside the table removed.
    SymbolString clean(const SymbolString& text) const;

private:
    struct Empty {};
    explicit Alphabet(Empty) {}

    static bool is_reserved(char32_t cp);
    static bool is_invalid(char32_t cp);

    std::vector<Symbol> symbols_;                          ///< index -> symbol
    std::vector<std::pair<Symbol, uint16_t>> by_symbol_;   ///< sorted by symbol
};

} // namespace ghostcomm

#endif // GHOSTCOMM_ALPHABET_HPP
