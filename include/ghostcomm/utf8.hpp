#pragma once
/**
 * @file utf8.hpp
 * @brief UTF-8 <-> code point conversion for text crossing the transport boundary.
 *
 * Volumes travel as UTF-8 text. Decoding is deliberately forgiving: a malformed,
 * truncated or overlong sequence, or an encoded surrogate, is dropped exactly
 * like any other stray character a chat app might inject. Nothing here fails.
 */

#include "ghostcomm/alphabet.hpp"
#include <string>

namespace ghostcomm {
namespace utf8 {

/// Decode UTF-8 text to code points, skipping anything that is not well-formed.
SymbolString decode(const std::string& text);

/// Decode a byte range. Same rules as decode(const std::string&).
SymbolString decode(const char* data, size_t len);

/// Encode code points as UTF-8. Invalid code points (surrogates, > U+10FFFF) are skipped.
std::string encode(const SymbolString& symbols);

/// Append one code point to `out` as UTF-8. Returns false (and appends nothing) if invalid.
bool append(std::string& out, char32_t cp);

} // namespace utf8
} // namespace ghostcomm
