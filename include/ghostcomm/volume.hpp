/**
 * @file volume.hpp
 * @brief GhostComm Volume - one self-describing, checksummed fragment of an encoded stream.
 *
 * A volume is what the user actually pastes into a chat. On the wire it is one
 * line of UTF-8 text:
 *
 *     GC:<type>:<total>:<index>:<checksum>:<payload>
 *
 * | Field      | Form                         | Meaning                              |
 * |------------|------------------------------|--------------------------------------|
 * | `GC`       | literal prefix               | marks the start of a volume          |
 * | `type`     | `I`, `A` or `V`              | media kind of the whole transmission |
 * | `total`    | ASCII decimal                | number of volumes in the transmission|
 * | `index`    | ASCII decimal, 0-based       | position of this volume              |
 * | `checksum` | 1–4 chars of [0-9A-Z]        | fingerprint of `payload` only        |
 * | `payload`  | alphabet symbols             | contiguous slice of the stream       |
 *
 * The payload never contains `:` (the alphabet excludes it), so everything after
 * the fourth delimiter belongs to the payload.
 *
 * ### Validity
 * - `index < total`, `total >= 1`
 * - every volume of one transmission shares `type` and `total`
 * - `checksum == checksum(payload)`, otherwise the volume is discarded
 *
 * Volumes are plain values; parsing lives in the extractor, building in the chunker.
 */

#pragma once
#include "ghostcomm/alphabet.hpp"
#include "ghostcomm/checksum.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>

namespace ghostcomm {

static constexpr const char* GC_PREFIX     = "GC";    ///< volume marker
static constexpr size_t      GC_PREFIX_LEN = 2;
static constexpr size_t      GC_VOLUMES_MAX = 256;    ///< largest accepted `total`

/// Media kind carried by a transmission. The value is the wire character.
enum class MediaType : char {
  Image = 'I',
  Audio = 'A',
  Video = 'V',
};

/// Wire character for a media type.
inline char to_char(MediaType t) { return static_cast<char>(t); }

/// Parse a wire character. Returns false for anything but I/A/V.
bool media_type_from_char(char c, MediaType& out);

/// Parse a user-facing name: "I"/"image", "A"/"audio", "V"/"video" (case-insensitive).
bool media_type_from_name(const std::string& name, MediaType& out);

/// MIME label used when handing rebuilt bytes to a renderer.
const char* mime_type(MediaType t);

/// Lower-case name ("image", "audio", "video").
const char* to_string(MediaType t);

/// One fragment.
struct Volume {
  MediaType    type  = MediaType::Image;
  uint16_t     total = 0;
  uint16_t     index = 0;
  ChecksumStr  checksum;
  SymbolString payload;

  /// Structural validity: `total` in [1, GC_VOLUMES_MAX] and `index < total`.
  bool in_range() const { return total >= 1 && total <= GC_VOLUMES_MAX && index < total; }

  /// True if the declared checksum matches the payload.
  bool verified() const { return checksum == ghostcomm::checksum(payload); }

  bool operator==(const Volume& o) const {
    return type == o.type && total == o.total && index == o.index &&
           checksum == o.checksum && payload == o.payload;
  }
  bool operator!=(const Volume& o) const { return !(*this == o); }
};

/// Render a volume as wire text ("GC:I:3:0:K2P9:...").
std::string to_wire(const Volume& v);

/// Number of code points to_wire() would produce.
size_t wire_length(const Volume& v);

/// Identity of a transmission as seen on the wire.
struct TransmissionKey {
  MediaType type  = MediaType::Image;
  uint16_t  total = 0;

  bool operator==(const TransmissionKey& o) const { return type == o.type && total == o.total; }
  bool operator!=(const TransmissionKey& o) const { return !(*this == o); }
  bool operator<(const TransmissionKey& o) const {
    if (type != o.type) return to_char(type) < to_char(o.type);
    return total < o.total;
  }
};

inline TransmissionKey key_of(const Volume& v) { return TransmissionKey{v.type, v.total}; }

/// Decimal digit count of `n` (1 for 0).
size_t decimal_digits(size_t n);

} // namespace ghostcomm
