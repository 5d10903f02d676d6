// -----------------------------------------------------------------------------
// receiver.cpp - Implementation of the GhostComm Receiver
//
// State machine and event semantics: see include/ghostcomm/receiver.hpp
// -----------------------------------------------------------------------------
#include "ghostcomm/receiver.hpp"
#include <utility>

namespace ghostcomm {

const char* to_string(ReceiverState state) {
  switch (state) {
    case ReceiverState::Idle:         return "idle";
    case ReceiverState::Accumulating: return "accumulating";
    case ReceiverState::Complete:     return "complete";
    case ReceiverState::Error:        return "error";
  }
  return "unknown";
}

const char* to_string(FailureReason reason) {
  switch (reason) {
    case FailureReason::None:   return "none";
    case FailureReason::Decode: return "decode";
    case FailureReason::Filter: return "filter";
  }
  return "unknown";
}

const char* to_string(EventKind kind) {
  switch (kind) {
    case EventKind::Accepted:     return "accepted";
    case EventKind::Duplicate:    return "duplicate";
    case EventKind::Rejected:     return "rejected";
    case EventKind::Inconsistent: return "inconsistent";
    case EventKind::Progress:     return "progress";
    case EventKind::Complete:     return "complete";
    case EventKind::Failed:       return "failed";
    case EventKind::Ignored:      return "ignored";
  }
  return "unknown";
}

Receiver::Receiver(const Alphabet& alphabet, PayloadFilter* filter)
  : codec_(alphabet),
    extractor_(alphabet),
    filter_(filter) {}

FeedReport Receiver::feed(const std::string& text) {
  FeedReport report;

  // GUARD: terminal states swallow input until reset()
  if (state_ == ReceiverState::Complete || state_ == ReceiverState::Error) {
    push_event(EventKind::Ignored, 0, 0, to_string(state_));
    report.state = state_;
    report.have  = have();
    report.total = total();
    return report;
  }

  // Step 1: scan; bad segments are reported, never fatal
  for (SegmentResult& r : extractor_.scan(text)) {
    if (!r.ok()) {
      ++report.rejected;
      push_event(EventKind::Rejected, r.volume.index, r.volume.total, to_string(r.status));
      continue;
    }
    accept(r.volume, report);
  }

  // Step 2: progress / completion
  finish(report);
  return report;
}

FeedReport Receiver::feed(const std::vector<Volume>& volumes) {
  FeedReport report;

  if (state_ == ReceiverState::Complete || state_ == ReceiverState::Error) {
    push_event(EventKind::Ignored, 0, 0, to_string(state_));
    report.state = state_;
    report.have  = have();
    report.total = total();
    return report;
  }

  for (const Volume& v : volumes) accept(v, report);
  finish(report);
  return report;
}

void Receiver::reset() {
  set_.clear();
  state_         = ReceiverState::Idle;
  failure_       = FailureReason::None;
  decode_status_ = DecodeStatus::Ok;
  result_.clear();
}

bool Receiver::get_event(ReceiverEvent& out) {
  if (events_.empty()) return false;
  out = events_.front();
  events_.pop_front();
  return true;
}

// ---------- private ----------

void Receiver::accept(const Volume& v, FeedReport& report) {
  const InsertStatus s = set_.insert(v);
  switch (s) {
    case InsertStatus::Inserted:
      ++report.accepted;
      push_event(EventKind::Accepted, v.index, v.total, "");
      break;
    case InsertStatus::Replaced:
      ++report.duplicates;
      push_event(EventKind::Duplicate, v.index, v.total, "");
      break;
    case InsertStatus::TotalMismatch:
    case InsertStatus::TypeMismatch:
      ++report.inconsistent;
      push_event(EventKind::Inconsistent, v.index, v.total, to_string(s));
      break;
    default:
      ++report.rejected;
      push_event(EventKind::Rejected, v.index, v.total, to_string(s));
      break;
  }
  if (set_.locked() && state_ == ReceiverState::Idle) state_ = ReceiverState::Accumulating;
}

void Receiver::finish(FeedReport& report) {
  if (state_ == ReceiverState::Accumulating) {
    const uint16_t t = static_cast<uint16_t>(set_.total());
    push_event(EventKind::Progress, static_cast<uint16_t>(set_.have()), t, "");

    if (set_.complete()) {
      Reassembly r = set_.try_reassemble(codec_);
      decode_status_ = r.decode;

      if (r.status != ReassemblyStatus::Complete) {
        state_   = ReceiverState::Error;
        failure_ = FailureReason::Decode;
        push_event(EventKind::Failed, 0, t, to_string(r.decode));
      } else if (filter_ != nullptr) {
        Bytes filtered;
        if (filter_->apply(r.bytes, filtered)) {
          result_ = std::move(filtered);
          state_  = ReceiverState::Complete;
          push_event(EventKind::Complete, 0, t, "");
        } else {
          state_   = ReceiverState::Error;
          failure_ = FailureReason::Filter;
          push_event(EventKind::Failed, 0, t, "filter");
        }
      } else {
        result_ = std::move(r.bytes);
        state_  = ReceiverState::Complete;
        push_event(EventKind::Complete, 0, t, "");
      }
    }
  }

  report.state = state_;
  report.have  = have();
  report.total = total();
}

void Receiver::push_event(EventKind kind, uint16_t index, uint16_t total, const char* detail) {
  // POLICY: drop oldest when full
  if (events_.full()) events_.pop_front();

  ReceiverEvent ev;
  ev.kind  = kind;
  ev.index = index;
  ev.total = total;
  ev.detail.assign(detail);   // etl::string truncates past capacity
  events_.push_back(ev);
}

} // namespace ghostcomm
