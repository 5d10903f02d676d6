/**
 * @file chunker.hpp
 * @brief GhostComm Volume Chunker - split an encoded stream into size-bounded volumes.
 *
 * ---
 *
 * ## Purpose
 *
 * Messengers cap how many characters one message may hold. The chunker cuts a
 * symbol string into equal slices so that every resulting volume, header
 * included, fits in `max_chars` code points.
 *
 * ---
 *
 * ## Header overhead
 *
 * The header is `GC:` + type + `:` + total + `:` + index + `:` + checksum + `:`.
 * Its size depends on how many digits `total` needs, and `total` depends on how
 * much room the header leaves, so the plan is solved to a fixed point:
 *
 * @code
 * overhead(t) = 2 + 1 + 1 + 1 + digits(t) + 1 + digits(t - 1) + 1 + 4 + 1
 * t0 = 1
 * repeat: size = max_chars - overhead(t); t' = ceil(len / size)
 *         until overhead(t') <= overhead(t)
 * @endcode
 *
 * The reserved checksum width is always 4 even when the actual fingerprint is
 * shorter, so a volume can come out a few characters under the limit but never
 * over it.
 *
 * ---
 *
 * ## Failure modes
 *
 * | Status           | Cause                                                |
 * |------------------|------------------------------------------------------|
 * | `LimitTooLow`    | `max_chars` leaves no room for payload               |
 * | `TooManyVolumes` | payload needs more than GC_VOLUMES_MAX volumes      |
 *
 * Receivers refuse `total > GC_VOLUMES_MAX`, so producing such a set would only
 * create volumes nobody can reassemble.
 *
 * ---
 *
 * ## Example
 * @code
 * std::vector<std::string> volumes;
 * auto status = ghostcomm::chunk(ghostcomm::MediaType::Image, symbols, 4000, volumes);
 * if (status != ghostcomm::ChunkStatus::Ok) { ... }
 * @endcode
 */
#ifndef GHOSTCOMM_CHUNKER_HPP
#define GHOSTCOMM_CHUNKER_HPP

#include "ghostcomm/alphabet.hpp"
#include "ghostcomm/volume.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace ghostcomm {

/// Result codes for chunking.
enum class ChunkStatus : uint8_t {
    Ok = 0,
    LimitTooLow,
    TooManyVolumes,
};

/// Short reason string ("limit_too_low", ...).
const char* to_string(ChunkStatus status);

/// Outcome of the size computation.
struct ChunkPlan {
    ChunkStatus status         = ChunkStatus::Ok;
    size_t      effective_size = 0;   ///< payload symbols per volume
    size_t      total          = 0;   ///< number of volumes
};

/// Header characters reserved for a transmission of `total` volumes.
size_t header_overhead(size_t total);

/// Compute effective size and volume count for `symbol_count` symbols.
ChunkPlan plan(size_t symbol_count, size_t max_chars);

/**
 * @brief Split `symbols` into Volume values.
 * @param type      Media type stamped on every volume.
 * @param symbols   Encoded stream.
 * @param max_chars Per-volume limit in code points (header included).
 * @param out       Cleared, then filled in index order. Empty when `symbols` is empty.
 */
ChunkStatus chunk_volumes(MediaType type, const SymbolString& symbols, size_t max_chars,
                          std::vector<Volume>& out);

/// As chunk_volumes(), rendered to wire text.
ChunkStatus chunk(MediaType type, const SymbolString& symbols, size_t max_chars,
                  std::vector<std::string>& out);

} // namespace ghostcomm

#endif // GHOSTCOMM_CHUNKER_HPP
