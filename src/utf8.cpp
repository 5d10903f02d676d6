/**
 * @file utf8.cpp
 * @brief Lenient UTF-8 codec. See utf8.hpp.
 */
#include "ghostcomm/utf8.hpp"

namespace ghostcomm {
namespace utf8 {

static bool is_continuation(unsigned char c) { return (c & 0xC0) == 0x80; }

SymbolString decode(const char* data, size_t len) {
    SymbolString out;
    out.reserve(len / 3 + 1);   // CJK payloads are 3 bytes per symbol

    const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
    size_t i = 0;
    while (i < len) {
        const unsigned char lead = p[i];

        // Single byte
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        }

        // Sequence length from the lead byte; 0xC0/0xC1 and 0xF5+ can never start one
        size_t extra;
        char32_t cp;
        if      (lead >= 0xC2 && lead <= 0xDF) { extra = 1; cp = lead & 0x1F; }
        else if (lead >= 0xE0 && lead <= 0xEF) { extra = 2; cp = lead & 0x0F; }
        else if (lead >= 0xF0 && lead <= 0xF4) { extra = 3; cp = lead & 0x07; }
        else { ++i; continue; }

        if (i + extra >= len) {   // truncated at end of input
            ++i;
            continue;
        }

        bool ok = true;
        for (size_t k = 1; k <= extra; ++k) {
            if (!is_continuation(p[i + k])) { ok = false; break; }
            cp = (cp << 6) | (p[i + k] & 0x3F);
        }
        if (!ok) {           // resync on the next byte
            ++i;
            continue;
        }

        // Overlong forms, surrogates and out-of-range values are noise too
        const bool overlong = (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000);
        const bool invalid  = (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF;
        if (!overlong && !invalid) out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

SymbolString decode(const std::string& text) {
    return decode(text.data(), text.size());
}

static bool is_encodable(char32_t cp) {
    return !(cp >= 0xD800 && cp <= 0xDFFF) && cp <= 0x10FFFF;
}

static void put(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool append(std::string& out, char32_t cp) {
    if (!is_encodable(cp)) return false;
    put(out, cp);
    return true;
}

std::string encode(const SymbolString& symbols) {
    std::string out;
    out.reserve(symbols.size() * 3);
    for (char32_t cp : symbols) {
        if (is_encodable(cp)) put(out, cp);   // dropped otherwise, matching decode()
    }
    return out;
}

} // namespace utf8
} // namespace ghostcomm
