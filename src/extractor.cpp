/**
 * @file extractor.cpp
 * @brief Volume extraction from noisy text.
 *
 * Refer to extractor.hpp for the status table. The parser works on UTF-8 bytes
 * for the header (pure ASCII, and no multi-byte UTF-8 sequence contains an ASCII
 * byte, so byte-wise `find` is safe) and switches to code points for the payload.
 */
#include "ghostcomm/extractor.hpp"
#include "ghostcomm/utf8.hpp"

namespace ghostcomm {

const char* to_string(SegmentStatus status) {
  switch (status) {
    case SegmentStatus::Ok:               return "ok";
    case SegmentStatus::Empty:            return "empty";
    case SegmentStatus::MissingFields:    return "missing_fields";
    case SegmentStatus::BadType:          return "bad_type";
    case SegmentStatus::BadTotal:         return "bad_total";
    case SegmentStatus::BadIndex:         return "bad_index";
    case SegmentStatus::IndexOutOfRange:  return "index_out_of_range";
    case SegmentStatus::TotalTooLarge:    return "total_too_large";
    case SegmentStatus::EmptyPayload:     return "empty_payload";
    case SegmentStatus::ChecksumMismatch: return "checksum_mismatch";
  }
  return "unknown";
}

// ---------- helpers ----------

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Trim ASCII whitespace from both ends of [begin, end) in `s`.
static std::string trimmed(const std::string& s, size_t begin, size_t end) {
  while (begin < end && is_space(s[begin])) ++begin;
  while (end > begin && is_space(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

// Plain decimal, 1..5 digits, value <= 65535. No sign, no inner spaces.
static bool parse_u16(const std::string& s, uint16_t& out) {
  if (s.empty() || s.size() > 5) return false;
  uint32_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<uint32_t>(c - '0');
  }
  if (v > 0xFFFF) return false;
  out = static_cast<uint16_t>(v);
  return true;
}

// ---------- public ----------

SegmentResult VolumeExtractor::parse_segment(const std::string& segment) const {
  SegmentResult r;

  // Step 1: whitespace-only segments (e.g. "GC:" at end of text)
  bool blank = true;
  for (char c : segment) {
    if (!is_space(c)) { blank = false; break; }
  }
  if (blank) {
    r.status = SegmentStatus::Empty;
    return r;
  }

  // Step 2: locate the four header delimiters
  size_t d[4];
  size_t from = 0;
  for (size_t k = 0; k < 4; ++k) {
    d[k] = segment.find(GC_FIELD_DELIMITER, from);
    if (d[k] == std::string::npos) {
      r.status = SegmentStatus::MissingFields;
      return r;
    }
    from = d[k] + 1;
  }

  // Step 3: header fields
  const std::string type_text  = trimmed(segment, 0, d[0]);
  const std::string total_text = trimmed(segment, d[0] + 1, d[1]);
  const std::string index_text = trimmed(segment, d[1] + 1, d[2]);
  const std::string crc_text   = trimmed(segment, d[2] + 1, d[3]);

  if (type_text.size() != 1 || !media_type_from_char(type_text[0], r.volume.type)) {
    r.status = SegmentStatus::BadType;
    return r;
  }
  if (!parse_u16(total_text, r.volume.total) || r.volume.total == 0) {
    r.status = SegmentStatus::BadTotal;
    return r;
  }
  if (!parse_u16(index_text, r.volume.index)) {
    r.status = SegmentStatus::BadIndex;
    return r;
  }
  if (r.volume.total > GC_VOLUMES_MAX) {
    r.status = SegmentStatus::TotalTooLarge;
    return r;
  }
  if (r.volume.index >= r.volume.total) {
    r.status = SegmentStatus::IndexOutOfRange;
    return r;
  }

  // A malformed checksum field cannot match anything; keep going so the
  // computed value is still reported.
  const bool crc_ok = is_checksum_text(crc_text.data(), crc_text.size());
  if (crc_ok) r.volume.checksum.assign(crc_text.data(), crc_text.size());

  // Step 4: payload = everything after the 4th delimiter, alphabet symbols only
  r.volume.payload = alphabet_.clean(utf8::decode(segment.data() + d[3] + 1, segment.size() - d[3] - 1));
  if (r.volume.payload.empty()) {
    r.status = SegmentStatus::EmptyPayload;
    return r;
  }

  // Step 5: integrity
  r.computed = checksum(r.volume.payload);
  r.status = (crc_ok && r.computed == r.volume.checksum) ? SegmentStatus::Ok
                                                         : SegmentStatus::ChecksumMismatch;
  return r;
}

std::vector<SegmentResult> VolumeExtractor::scan(const std::string& text) const {
  std::vector<SegmentResult> results;

  std::string marker = GC_PREFIX;
  marker += GC_FIELD_DELIMITER;

  size_t pos = text.find(marker);
  while (pos != std::string::npos) {
    const size_t start = pos + marker.size();
    const size_t next  = text.find(marker, start);
    const size_t end   = (next == std::string::npos) ? text.size() : next;

    results.push_back(parse_segment(text.substr(start, end - start)));
    pos = next;
  }
  return results;
}

std::vector<Volume> VolumeExtractor::extract(const std::string& text) const {
  std::vector<Volume> out;
  for (SegmentResult& r : scan(text)) {
    if (r.ok()) out.push_back(std::move(r.volume));
  }
  return out;
}

std::map<TransmissionKey, std::vector<Volume>> group_by_transmission(const std::vector<Volume>& volumes) {
  std::map<TransmissionKey, std::vector<Volume>> groups;
  for (const Volume& v : volumes) groups[key_of(v)].push_back(v);
  return groups;
}

} // namespace ghostcomm
