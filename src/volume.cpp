/**
 * @file volume.cpp
 * @brief Volume wire rendering and media-type helpers.
 *
 * Refer to `volume.hpp` for the wire grammar.
 */
#include "ghostcomm/volume.hpp"
#include "ghostcomm/utf8.hpp"

#include <cctype>

namespace ghostcomm {

bool media_type_from_char(char c, MediaType& out) {
  switch (c) {
    case 'I': out = MediaType::Image; return true;
    case 'A': out = MediaType::Audio; return true;
    case 'V': out = MediaType::Video; return true;
    default:  return false;
  }
}

bool media_type_from_name(const std::string& name, MediaType& out) {
  std::string lower;
  lower.reserve(name.size());
  for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  if (lower == "i" || lower == "image") { out = MediaType::Image; return true; }
  if (lower == "a" || lower == "audio") { out = MediaType::Audio; return true; }
  if (lower == "v" || lower == "video") { out = MediaType::Video; return true; }
  return false;
}

const char* mime_type(MediaType t) {
  switch (t) {
    case MediaType::Image: return "image/webp";
    case MediaType::Audio: return "audio/webm";
    case MediaType::Video: return "video/mp4";
  }
  return "application/octet-stream";
}

const char* to_string(MediaType t) {
  switch (t) {
    case MediaType::Image: return "image";
    case MediaType::Audio: return "audio";
    case MediaType::Video: return "video";
  }
  return "unknown";
}

size_t decimal_digits(size_t n) {
  size_t d = 1;
  while (n >= 10) { n /= 10; ++d; }
  return d;
}

// Header is pure ASCII, so its byte count equals its code point count.
static std::string wire_header(const Volume& v) {
  std::string h;
  h.reserve(GC_PREFIX_LEN + 16 + GC_CHECKSUM_LEN);
  h += GC_PREFIX;
  h += GC_FIELD_DELIMITER;
  h += to_char(v.type);
  h += GC_FIELD_DELIMITER;
  h += std::to_string(v.total);
  h += GC_FIELD_DELIMITER;
  h += std::to_string(v.index);
  h += GC_FIELD_DELIMITER;
  h.append(v.checksum.c_str(), v.checksum.size());
  h += GC_FIELD_DELIMITER;
  return h;
}

std::string to_wire(const Volume& v) {
  std::string out = wire_header(v);
  out += utf8::encode(v.payload);
  return out;
}

size_t wire_length(const Volume& v) {
  return wire_header(v).size() + v.payload.size();
}

} // namespace ghostcomm
