// -----------------------------------------------------------------------------
// bitpack.cpp - Implementation of the GhostComm Bit-Pack Codec
//
// API & stream layout:
//   see include/ghostcomm/bitpack.hpp
//
// Both directions run a small shift register. The register never holds more
// than 22 live bits (14 leftover + 8 new on encode, 7 leftover + 15 new on
// decode), so a uint32_t is enough; consumed bits are masked off each step.
// -----------------------------------------------------------------------------
#include "ghostcomm/bitpack.hpp"

namespace ghostcomm {

const char* to_string(DecodeStatus status) {
    switch (status) {
        case DecodeStatus::Ok:            return "ok";
        case DecodeStatus::TooShort:      return "too_short";
        case DecodeStatus::LengthOverrun: return "length_overrun";
    }
    return "unknown";
}

size_t BitPackCodec::encoded_length(size_t byte_count) {
    const size_t bits = 8 * (byte_count + GC_LENGTH_HEADER_BYTES);
    return (bits + GC_SYMBOL_BITS - 1) / GC_SYMBOL_BITS;
}

SymbolString BitPackCodec::encode(const uint8_t* data, size_t len) const {
    SymbolString out;
    out.reserve(encoded_length(len));

    // Step 1: length header, big-endian
    const uint32_t n = static_cast<uint32_t>(len);
    const uint8_t header[GC_LENGTH_HEADER_BYTES] = {
        static_cast<uint8_t>((n >> 24) & 0xFF),
        static_cast<uint8_t>((n >> 16) & 0xFF),
        static_cast<uint8_t>((n >> 8)  & 0xFF),
        static_cast<uint8_t>( n        & 0xFF),
    };

    uint32_t buffer = 0;   // live bits are the low `bits` bits
    uint32_t bits   = 0;

    // Step 2: shift in one byte, drain whole 15-bit groups from the top
    auto push_byte = [&](uint8_t byte) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= GC_SYMBOL_BITS) {
            bits -= GC_SYMBOL_BITS;
            const uint16_t index = static_cast<uint16_t>((buffer >> bits) & GC_SYMBOL_MASK);
            out.push_back(alphabet_.symbol_of(index));
            buffer &= (1u << bits) - 1;
        }
    };

    for (uint8_t b : header) push_byte(b);
    for (size_t i = 0; i < len; ++i) push_byte(data[i]);

    // Step 3: zero-pad the remainder on the low end into one last symbol
    if (bits > 0) {
        const uint16_t index = static_cast<uint16_t>((buffer << (GC_SYMBOL_BITS - bits)) & GC_SYMBOL_MASK);
        out.push_back(alphabet_.symbol_of(index));
    }
    return out;
}

DecodeStatus BitPackCodec::decode(const SymbolString& symbols, Bytes& out) const {
    out.clear();

    Bytes raw;
    raw.reserve(symbols.size() * GC_SYMBOL_BITS / 8 + 1);

    uint32_t buffer = 0;
    uint32_t bits   = 0;

    // Step 1: recognized symbols only; everything else is transport noise
    for (Symbol c : symbols) {
        const std::optional<uint16_t> index = alphabet_.index_of(c);
        if (!index) continue;

        buffer = (buffer << GC_SYMBOL_BITS) | *index;
        bits += GC_SYMBOL_BITS;
        while (bits >= 8) {
            bits -= 8;
            raw.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
            buffer &= (1u << bits) - 1;
        }
    }

    // Step 2: header must be present
    if (raw.size() < GC_LENGTH_HEADER_BYTES) return DecodeStatus::TooShort;

    const uint32_t n = (static_cast<uint32_t>(raw[0]) << 24) |
                       (static_cast<uint32_t>(raw[1]) << 16) |
                       (static_cast<uint32_t>(raw[2]) << 8)  |
                        static_cast<uint32_t>(raw[3]);

    // Step 3: the header may not point past the decoded data
    if (n > raw.size() - GC_LENGTH_HEADER_BYTES) return DecodeStatus::LengthOverrun;

    // Step 4: exact payload slice; padding-derived tail bytes are dropped
    out.assign(raw.begin() + GC_LENGTH_HEADER_BYTES,
               raw.begin() + GC_LENGTH_HEADER_BYTES + n);
    return DecodeStatus::Ok;
}

Bytes BitPackCodec::decode(const SymbolString& symbols) const {
    Bytes out;
    if (decode(symbols, out) != DecodeStatus::Ok) out.clear();
    return out;
}

} // namespace ghostcomm
