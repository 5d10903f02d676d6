// -----------------------------------------------------------------------------
// chunk_set.cpp - Implementation of the GhostComm ChunkSet
//
// API, locking rules and completion semantics:
//   see include/ghostcomm/chunk_set.hpp
//
// Guard order in insert() matters: structural range checks first (they protect
// the bounded store), then integrity, then the transmission lock. A damaged
// volume therefore never locks the set onto a bogus key.
// -----------------------------------------------------------------------------
#include "ghostcomm/chunk_set.hpp"

namespace ghostcomm {

const char* to_string(InsertStatus status) {
  switch (status) {
    case InsertStatus::Inserted:         return "inserted";
    case InsertStatus::Replaced:         return "replaced";
    case InsertStatus::IndexOutOfRange:  return "index_out_of_range";
    case InsertStatus::TotalTooLarge:    return "total_too_large";
    case InsertStatus::TotalMismatch:    return "total_mismatch";
    case InsertStatus::TypeMismatch:     return "type_mismatch";
    case InsertStatus::ChecksumMismatch: return "checksum_mismatch";
  }
  return "unknown";
}

const char* to_string(ReassemblyStatus status) {
  switch (status) {
    case ReassemblyStatus::Incomplete: return "incomplete";
    case ReassemblyStatus::Complete:   return "complete";
    case ReassemblyStatus::Failed:     return "failed";
  }
  return "unknown";
}

InsertStatus ChunkSet::insert(const Volume& v) {
  // GUARD: bounds before anything touches the store
  if (v.total > GC_VOLUMES_MAX)     return InsertStatus::TotalTooLarge;
  if (v.total == 0 || v.index >= v.total) return InsertStatus::IndexOutOfRange;

  // GUARD: integrity
  if (!v.verified()) return InsertStatus::ChecksumMismatch;

  // POLICY: one transmission per set
  if (locked_) {
    if (v.total != total_) { ++inconsistencies_; return InsertStatus::TotalMismatch; }
    if (v.type  != type_)  { ++inconsistencies_; return InsertStatus::TypeMismatch; }
  } else {
    locked_ = true;
    type_   = v.type;
    total_  = v.total;
  }

  // STORE: last valid write wins
  Store::iterator it = volumes_.find(v.index);
  if (it != volumes_.end()) {
    it->second = v;
    return InsertStatus::Replaced;
  }

  // index < total <= GC_VOLUMES_MAX, so there is always a free slot here
  volumes_.insert(Store::value_type(v.index, v));
  return InsertStatus::Inserted;
}

InsertSummary ChunkSet::insert_all(const std::vector<Volume>& volumes) {
  InsertSummary s;
  for (const Volume& v : volumes) {
    switch (insert(v)) {
      case InsertStatus::Inserted:      ++s.inserted;     break;
      case InsertStatus::Replaced:      ++s.replaced;     break;
      case InsertStatus::TotalMismatch:
      case InsertStatus::TypeMismatch:  ++s.inconsistent; break;
      default:                          ++s.rejected;     break;
    }
  }
  return s;
}

std::vector<uint16_t> ChunkSet::missing() const {
  std::vector<uint16_t> out;
  if (!locked_) return out;
  for (uint16_t i = 0; i < total_; ++i) {
    if (volumes_.find(i) == volumes_.end()) out.push_back(i);
  }
  return out;
}

std::vector<Volume> ChunkSet::volumes() const {
  std::vector<Volume> out;
  out.reserve(volumes_.size());
  for (Store::const_iterator it = volumes_.begin(); it != volumes_.end(); ++it) {
    out.push_back(it->second);
  }
  return out;
}

bool ChunkSet::concatenate(SymbolString& out) const {
  out.clear();
  if (!complete()) return false;

  size_t n = 0;
  for (Store::const_iterator it = volumes_.begin(); it != volumes_.end(); ++it) n += it->second.payload.size();
  out.reserve(n);

  // etl::map iterates in ascending key order
  for (Store::const_iterator it = volumes_.begin(); it != volumes_.end(); ++it) out += it->second.payload;
  return true;
}

Reassembly ChunkSet::try_reassemble(const BitPackCodec& codec) const {
  Reassembly r;
  r.have  = have();
  r.total = total();

  SymbolString stream;
  if (!concatenate(stream)) {
    r.status = ReassemblyStatus::Incomplete;
    return r;
  }

  r.decode = codec.decode(stream, r.bytes);
  r.status = (r.decode == DecodeStatus::Ok) ? ReassemblyStatus::Complete : ReassemblyStatus::Failed;
  return r;
}

void ChunkSet::clear() {
  volumes_.clear();
  locked_ = false;
  type_   = MediaType::Image;
  total_  = 0;
  inconsistencies_ = 0;
}

} // namespace ghostcomm
