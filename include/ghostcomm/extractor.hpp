/**
 * @file extractor.hpp
 * @brief GhostComm Volume Extractor - find and validate volumes inside arbitrary pasted text.
 *
 * @details
 * Receivers get whatever the chat app hands back: several volumes glued
 * together, quoted replies, timestamps, wrapped lines, stray spaces inside the
 * payload, the same volume pasted twice. The extractor does not care. It:
 *
 *  1. splits the text on every `GC:` occurrence (text before the first one is
 *     preamble and ignored),
 *  2. splits each segment on `:` into type, total, index, checksum, payload
 *     (everything after the fourth `:` is payload),
 *  3. keeps only alphabet symbols from the payload,
 *  4. recomputes the checksum and compares it with the declared one.
 *
 * Nothing throws. Each segment yields a `SegmentResult` tagged with a
 * `SegmentStatus`; a bad segment never stops the scan of the rest.
 *
 * | Status             | Meaning                                             |
 * |--------------------|-----------------------------------------------------|
 * | `Ok`               | valid volume                                        |
 * | `Empty`            | nothing but whitespace after the prefix             |
 * | `MissingFields`    | fewer than 5 `:`-separated fields                   |
 * | `BadType`          | type is not `I`, `A` or `V`                         |
 * | `BadTotal`         | total is not a decimal number >= 1                  |
 * | `BadIndex`         | index is not a decimal number                       |
 * | `IndexOutOfRange`  | index >= total                                      |
 * | `TotalTooLarge`    | total > GC_VOLUMES_MAX                              |
 * | `EmptyPayload`     | no alphabet symbols left after cleaning             |
 * | `ChecksumMismatch` | payload damaged in transit                          |
 *
 * @par Example
 * @code
 * ghostcomm::Alphabet alphabet;
 * ghostcomm::VolumeExtractor extractor(alphabet);
 * for (const auto& v : extractor.extract(clipboard_text)) {
 *   // v.index, v.total, v.payload ...
 * }
 * @endcode
 */
#pragma once

#include "ghostcomm/alphabet.hpp"
#include "ghostcomm/checksum.hpp"
#include "ghostcomm/volume.hpp"
#include <map>
#include <string>
#include <vector>

namespace ghostcomm {

/// Per-segment scan outcome.
enum class SegmentStatus : uint8_t {
  Ok = 0,
  Empty,
  MissingFields,
  BadType,
  BadTotal,
  BadIndex,
  IndexOutOfRange,
  TotalTooLarge,
  EmptyPayload,
  ChecksumMismatch,
};

/// Short reason string ("checksum_mismatch", ...).
const char* to_string(SegmentStatus status);

/// One scanned segment. `volume` holds whatever fields parsed before the failure.
struct SegmentResult {
  SegmentStatus status = SegmentStatus::Empty;
  Volume        volume;
  ChecksumStr   computed;   ///< recomputed fingerprint (set once the payload is cleaned)

  bool ok() const { return status == SegmentStatus::Ok; }
};

/**
 * @class VolumeExtractor
 * @brief Stateless scanner bound to one Alphabet (kept by reference).
 */
class VolumeExtractor {
public:
  explicit VolumeExtractor(const Alphabet& alphabet) : alphabet_(alphabet) {}

  /// Every segment after a `GC:` prefix, with its status.
  std::vector<SegmentResult> scan(const std::string& text) const;

  /// Valid volumes only, in the order they appear in `text`.
  std::vector<Volume> extract(const std::string& text) const;

  /**
   * @brief Parse one segment (the text following a `GC:` prefix).
   * @param segment Raw UTF-8 text up to, not including, the next prefix.
   */
  SegmentResult parse_segment(const std::string& segment) const;

private:
  const Alphabet& alphabet_;
};

/// Split valid volumes by (type, total). Order inside each group is preserved.
std::map<TransmissionKey, std::vector<Volume>> group_by_transmission(const std::vector<Volume>& volumes);

} // namespace ghostcomm
