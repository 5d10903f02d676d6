/**
 * @file chunk_set.hpp
 * @brief GhostComm ChunkSet - bounded, receiver-side accumulator for one transmission.
 *
 * @details
 * ## Field Brief
 * Volumes arrive in any order, some twice, some damaged, some belonging to a
 * different transmission that happened to be pasted in the same message. The
 * ChunkSet keeps exactly one entry per index and refuses anything that does not
 * fit the transmission it locked onto.
 *
 * ---
 *
 * @par Locking
 * The first accepted volume fixes the set's `(type, total)`. From then on:
 * - same index again → overwrite (last valid write wins; duplicates are harmless),
 * - different `total` → `TotalMismatch`, counted as an inconsistency,
 * - different `type`  → `TypeMismatch`, counted as an inconsistency.
 *
 * Mismatching volumes are never merged. `clear()` unlocks the set.
 *
 * ---
 *
 * @par Bounded memory
 * Storage is an `etl::map` with room for GC_VOLUMES_MAX entries. A volume
 * claiming `total > GC_VOLUMES_MAX` is rejected before it is stored, and every
 * stored index is `< total`, so the set can never grow past its capacity.
 *
 * ---
 *
 * @par Completion
 * The set is complete when it holds `total` entries. Because each key is
 * unique and `< total`, that is the same as holding exactly `{0, ..., total-1}`.
 * `try_reassemble()` then concatenates payloads in index order and decodes.
 *
 * ---
 *
 * @par Threading
 * Single writer. Inserts for different indices commute, so the final
 * reassembly does not depend on arrival order. Guard externally if several
 * threads feed the same set.
 *
 * @par Example
 * @code
 * ghostcomm::ChunkSet set;
 * set.insert_all(extractor.extract(text));
 * ghostcomm::Reassembly r = set.try_reassemble(codec);
 * if (r.status == ghostcomm::ReassemblyStatus::Complete) use(r.bytes);
 * else printf("%zu/%zu\n", r.have, r.total);
 * @endcode
 */
#ifndef GHOSTCOMM_CHUNK_SET_HPP
#define GHOSTCOMM_CHUNK_SET_HPP

#include "etl/map.h"
#include "ghostcomm/bitpack.hpp"
#include "ghostcomm/volume.hpp"
#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace ghostcomm {

/// Outcome of inserting one volume.
enum class InsertStatus : uint8_t {
  Inserted = 0,      ///< new index
  Replaced,          ///< index already present; overwritten
  IndexOutOfRange,   ///< index >= total, or total == 0
  TotalTooLarge,     ///< total > GC_VOLUMES_MAX
  TotalMismatch,     ///< total differs from the locked transmission
  TypeMismatch,      ///< type differs from the locked transmission
  ChecksumMismatch,  ///< declared checksum does not match payload
};

/// Short reason string ("total_mismatch", ...).
const char* to_string(InsertStatus status);

/// True for Inserted and Replaced.
inline bool accepted(InsertStatus s) { return s == InsertStatus::Inserted || s == InsertStatus::Replaced; }

/// Counts from one insert_all() call.
struct InsertSummary {
  size_t inserted     = 0;
  size_t replaced     = 0;
  size_t rejected     = 0;   ///< range and checksum failures
  size_t inconsistent = 0;   ///< total/type mismatches

  bool has_inconsistency() const { return inconsistent != 0; }
};

enum class ReassemblyStatus : uint8_t {
  Incomplete = 0,   ///< still accumulating; see have/total
  Complete,         ///< bytes hold the payload
  Failed,           ///< all volumes present but the stream did not decode
};

const char* to_string(ReassemblyStatus status);

/// Result of try_reassemble().
struct Reassembly {
  ReassemblyStatus status = ReassemblyStatus::Incomplete;
  size_t           have   = 0;
  size_t           total  = 0;                  ///< 0 while nothing is locked
  DecodeStatus     decode = DecodeStatus::Ok;   ///< meaningful when Complete/Failed
  Bytes            bytes;
};

class ChunkSet {
public:
  /// Insert or overwrite one volume.
  InsertStatus insert(const Volume& v);

  /// Insert every volume, counting outcomes.
  InsertSummary insert_all(const std::vector<Volume>& volumes);

  /// All `total` indices present.
  bool complete() const { return locked_ && volumes_.size() == total_; }

  size_t have()  const { return volumes_.size(); }
  size_t total() const { return locked_ ? total_ : 0; }
  bool   empty() const { return volumes_.empty(); }

  /// Whether a transmission key has been fixed.
  bool locked() const { return locked_; }

  /// Locked key; meaningful only when locked().
  TransmissionKey key() const { return TransmissionKey{type_, total_}; }

  /// Total/type mismatches seen since the last clear().
  size_t inconsistencies() const { return inconsistencies_; }

  /// Indices in [0, total) not yet received.
  std::vector<uint16_t> missing() const;

  /// Stored volumes in ascending index order.
  std::vector<Volume> volumes() const;

  /// Payloads in ascending index order. Returns false unless complete().
  bool concatenate(SymbolString& out) const;

  /// Complete → decode; otherwise report progress.
  Reassembly try_reassemble(const BitPackCodec& codec) const;

  /// Drop everything and unlock.
  void clear();

private:
  using Store = etl::map<uint16_t, Volume, GC_VOLUMES_MAX>;

  Store     volumes_;
  bool      locked_ = false;
  MediaType type_   = MediaType::Image;
  uint16_t  total_  = 0;
  size_t    inconsistencies_ = 0;
};

} // namespace ghostcomm

#endif // GHOSTCOMM_CHUNK_SET_HPP
