/**
 * @file checksum.hpp
 * @brief GhostComm Checksum - 4-character base-36 fingerprint of a symbol string.
 *
 * Algorithm (kept bit-compatible with deployed clients):
 *   1. `hash = 0`
 *   2. for each code point: `hash = hash * 31 + cp`, wrapping as signed 32-bit
 *   3. take `|hash|` (as a 64-bit value, so INT32_MIN stays positive)
 *   4. render in base 36, keep the first (most significant) 4 digits, uppercase
 *
 * The result is 1–4 characters; it is shorter than 4 only when `|hash| < 36^3`.
 *
 * This catches the usual paste accidents (a dropped or doubled character, a
 * truncated tail beyond the last couple of symbols). It is not a MAC: anyone
 * can forge it, and because only the leading digits are kept, a change that
 * moves the hash by less than about 36^2 can go unnoticed.
 */
#ifndef GHOSTCOMM_CHECKSUM_HPP
#define GHOSTCOMM_CHECKSUM_HPP

#include "ghostcomm/alphabet.hpp"
#include "etl/string.h"
#include <stdint.h>
#include <stddef.h>

namespace ghostcomm {

static constexpr size_t GC_CHECKSUM_LEN = 4;   ///< max fingerprint characters

/// Fixed-capacity fingerprint string ("3F9K").
using ChecksumStr = etl::string<GC_CHECKSUM_LEN>;

/// Fingerprint of `len` code points starting at `data`.
ChecksumStr checksum(const Symbol* data, size_t len);

/// Fingerprint of a whole symbol string.
inline ChecksumStr checksum(const SymbolString& s) { return checksum(s.data(), s.size()); }

/// True if `text` could be a fingerprint: 1..4 characters from [0-9A-Z].
bool is_checksum_text(const char* text, size_t len);

} // namespace ghostcomm

#endif // GHOSTCOMM_CHECKSUM_HPP
