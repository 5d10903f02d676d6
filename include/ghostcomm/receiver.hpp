/**
 * @file receiver.hpp
 * @brief GhostComm Receiver - the receiving flow's state machine around one ChunkSet.
 *
 * @details
 * ## Field Brief
 * The user pastes, and pastes again, and maybe pastes the same thing twice.
 * Each paste goes to `feed()`. The receiver pulls volumes out of the text, files
 * them in its ChunkSet, and the moment the set is complete it rebuilds the
 * payload. It never blocks, never allocates threads, never prints.
 *
 * ---
 *
 * @par State machine
 * ```
 *            feed(valid volume)             set complete, decode ok
 *   [Idle] ─────────────────────► [Accumulating] ──────────────────► [Complete]
 *      ▲                              │   ▲  │
 *      │                              │   └──┘ feed(valid volume)
 *      │                              │
 *      │                              └─ set complete, decode/filter fails ─► [Error]
 *      │
 *      └──────────────── reset() from any state ───────────────────────────────┘
 * ```
 * - A single bad volume never causes `Error`; it is dropped and reported.
 * - In `Complete` and `Error`, further input is ignored until `reset()`.
 *
 * ---
 *
 * @par Payload filter (decompression boundary)
 * Senders usually compress before encoding. The receiver does not know how; the
 * caller passes a `PayloadFilter` whose `apply()` undoes it. A filter failure is
 * an integrity failure of the transmission (`FailureReason::Filter`).
 *
 * ---
 *
 * @par Events
 * Every notable step is queued as a `ReceiverEvent` in a fixed-capacity deque
 * (EVENT_CAP). Callers drain it with `get_event()` and log or display it however
 * they like. When the queue is full the oldest event is dropped.
 *
 * @par Example
 * @code
 * ghostcomm::Alphabet alphabet;
 * ghostcomm::Receiver rx(alphabet);
 *
 * rx.feed(first_paste);
 * rx.feed(second_paste);
 *
 * ghostcomm::ReceiverEvent ev;
 * while (rx.get_event(ev)) { ... }
 *
 * if (rx.state() == ghostcomm::ReceiverState::Complete) save(rx.result());
 * @endcode
 */
#ifndef GHOSTCOMM_RECEIVER_HPP
#define GHOSTCOMM_RECEIVER_HPP

#include "etl/deque.h"
#include "etl/string.h"
#include "ghostcomm/alphabet.hpp"
#include "ghostcomm/bitpack.hpp"
#include "ghostcomm/chunk_set.hpp"
#include "ghostcomm/extractor.hpp"
#include "ghostcomm/volume.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

namespace ghostcomm {

enum class ReceiverState : uint8_t {
  Idle = 0,
  Accumulating,
  Complete,
  Error,
};

const char* to_string(ReceiverState state);

enum class FailureReason : uint8_t {
  None = 0,
  Decode,   ///< concatenated stream did not decode (see Reassembly::decode)
  Filter,   ///< PayloadFilter::apply() reported failure
};

const char* to_string(FailureReason reason);

/**
 * @brief Transform applied to decoded bytes before they become the result.
 *
 * Typically a decompressor. Implementations return false on corrupt input;
 * `out` is then ignored.
 */
class PayloadFilter {
public:
  virtual ~PayloadFilter() = default;
  virtual bool apply(const Bytes& in, Bytes& out) = 0;
};

enum class EventKind : uint8_t {
  Accepted = 0,   ///< new index stored
  Duplicate,      ///< index already stored; overwritten
  Rejected,       ///< segment or volume dropped (detail = reason)
  Inconsistent,   ///< volume of another transmission (detail = reason)
  Progress,       ///< have/total after a feed
  Complete,       ///< payload rebuilt
  Failed,         ///< integrity failure (detail = reason)
  Ignored,        ///< input arrived in Complete/Error state
};

const char* to_string(EventKind kind);

/// One diagnostic record.
struct ReceiverEvent {
  EventKind        kind  = EventKind::Progress;
  uint16_t         index = 0;
  uint16_t         total = 0;
  etl::string<24>  detail;
};

/// Summary of one feed() call.
struct FeedReport {
  size_t        accepted     = 0;   ///< new indices
  size_t        duplicates   = 0;   ///< overwritten indices
  size_t        rejected     = 0;   ///< bad segments or volumes
  size_t        inconsistent = 0;   ///< volumes of another transmission
  ReceiverState state        = ReceiverState::Idle;
  size_t        have         = 0;
  size_t        total        = 0;
};

class Receiver {
public:
  static constexpr size_t EVENT_CAP = 64;   ///< diagnostic queue depth

  /**
   * @param alphabet Table shared with the sender; must outlive the receiver.
   * @param filter   Optional post-decode transform; not owned, may be nullptr.
   */
  explicit Receiver(const Alphabet& alphabet, PayloadFilter* filter = nullptr);

  /// Extract volumes from pasted text and feed them.
  FeedReport feed(const std::string& text);

  /// Feed already-parsed volumes (e.g. a restored session).
  FeedReport feed(const std::vector<Volume>& volumes);

  /// Discard everything and return to Idle. Pending events are kept.
  void reset();

  ReceiverState state()  const { return state_; }
  FailureReason failure() const { return failure_; }
  DecodeStatus  decode_status() const { return decode_status_; }

  size_t have()  const { return set_.have(); }
  size_t total() const { return set_.total(); }

  /// Media type of the locked transmission; meaningful once not Idle.
  MediaType type() const { return set_.key().type; }

  /// Rebuilt payload; empty unless Complete.
  const Bytes& result() const { return result_; }

  /// Accepted volumes, ascending index.
  std::vector<Volume> volumes() const { return set_.volumes(); }

  /// Indices still missing.
  std::vector<uint16_t> missing() const { return set_.missing(); }

  /// Pop the oldest event. Returns false when the queue is empty.
  bool get_event(ReceiverEvent& out);

  /// Drop all pending events.
  void clear_events() { events_.clear(); }

private:
  void accept(const Volume& v, FeedReport& report);
  void finish(FeedReport& report);
  void push_event(EventKind kind, uint16_t index, uint16_t total, const char* detail);

  BitPackCodec     codec_;
  VolumeExtractor  extractor_;
  PayloadFilter*   filter_;

  ChunkSet         set_;
  ReceiverState    state_         = ReceiverState::Idle;
  FailureReason    failure_       = FailureReason::None;
  DecodeStatus     decode_status_ = DecodeStatus::Ok;
  Bytes            result_;

  etl::deque<ReceiverEvent, EVENT_CAP> events_;
};

} // namespace ghostcomm

#endif // GHOSTCOMM_RECEIVER_HPP
