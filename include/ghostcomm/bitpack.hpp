/**
 * @file bitpack.hpp
 * @brief GhostComm Bit-Pack Codec - bytes <-> 15-bit alphabet symbols.
 *
 * ---
 *
 * ## Stream layout
 *
 * After mapping every symbol back to its 15-bit index and concatenating the bits
 * (most significant first), an encoded stream reads:
 *
 * | Bytes      | Content                                         |
 * |------------|-------------------------------------------------|
 * | 0–3        | payload length N, unsigned 32-bit big-endian    |
 * | 4–(4+N-1)  | payload                                         |
 * | tail       | 0–14 zero padding bits filling the last symbol  |
 *
 * The length header is what lets the decoder throw the padding away: bits that
 * complete the last symbol can produce one spurious trailing byte, which is
 * never part of the payload.
 *
 * ### Size
 * `encoded_length(n) = ceil(8 * (n + 4) / 15)` symbols. An empty payload still
 * produces 3 symbols (the header alone).
 *
 * ---
 *
 * ## Noise tolerance
 *
 * `decode()` ignores every character that is not in the alphabet: line breaks,
 * spaces, zero-width joiners, quote markers a messenger adds on paste. Only
 * alphabet symbols feed the bit buffer.
 *
 * ---
 *
 * ## Example
 * @code
 * ghostcomm::Alphabet alphabet;
 * ghostcomm::BitPackCodec codec(alphabet);
 *
 * ghostcomm::Bytes in = {0xDE, 0xAD, 0xBE, 0xEF};
 * ghostcomm::SymbolString s = codec.encode(in);      // 4 symbols
 *
 * ghostcomm::Bytes out;
 * if (codec.decode(s, out) == ghostcomm::DecodeStatus::Ok) {
 *     // out == in
 * }
 * @endcode
 */
#ifndef GHOSTCOMM_BITPACK_HPP
#define GHOSTCOMM_BITPACK_HPP

#include "ghostcomm/alphabet.hpp"
#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace ghostcomm {

/// Raw payload bytes.
using Bytes = std::vector<uint8_t>;

static constexpr size_t GC_LENGTH_HEADER_BYTES = 4;   ///< big-endian u32 length prefix

/// Result codes for BitPackCodec::decode().
enum class DecodeStatus : uint8_t {
    Ok = 0,
    TooShort,        ///< fewer than 4 bytes decoded; no length header
    LengthOverrun,   ///< header claims more bytes than the stream holds
};

/// Short reason string ("too_short", ...).
const char* to_string(DecodeStatus status);

/**
 * @class BitPackCodec
 * @brief Stateless encoder/decoder bound to one Alphabet.
 *
 * The codec keeps a reference to the alphabet; the alphabet must outlive it.
 * All methods are const and re-entrant.
 */
class BitPackCodec {
public:
    explicit BitPackCodec(const Alphabet& alphabet) : alphabet_(alphabet) {}

    /**
     * @brief Encode bytes (with length header) to symbols.
     * @param data Payload bytes; may be nullptr when `len == 0`.
     * @param len  Payload length. Must fit in 32 bits.
     * @return Exactly encoded_length(len) symbols.
     */
    SymbolString encode(const uint8_t* data, size_t len) const;

    /// Encode a byte vector. Never fails.
    SymbolString encode(const Bytes& data) const { return encode(data.data(), data.size()); }

    /**
     * @brief Decode symbols back to the payload.
     * @param symbols Symbol text; characters outside the alphabet are skipped.
     * @param out     Receives exactly the payload on success; cleared on failure.
     * @return DecodeStatus::Ok, TooShort or LengthOverrun.
     */
    DecodeStatus decode(const SymbolString& symbols, Bytes& out) const;

    /// Decode, returning an empty buffer on any failure.
    Bytes decode(const SymbolString& symbols) const;

    /// Number of symbols encode() produces for `byte_count` payload bytes.
    static size_t encoded_length(size_t byte_count);

    const Alphabet& alphabet() const { return alphabet_; }

private:
    const Alphabet& alphabet_;
};

} // namespace ghostcomm

#endif // GHOSTCOMM_BITPACK_HPP
