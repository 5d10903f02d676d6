#include "ghostcomm/profiles.hpp"

namespace ghostcomm {

const TransportProfile TRANSPORT_PROFILES[] = {
  { "safe",  "Safe (strict messengers)", 4000   },
  { "high",  "High (desktop chat)",      15000  },
  { "titan", "Titan (large messages)",   64000  },
  { "god",   "God (pastebin / e-mail)",  200000 },
};

const size_t TRANSPORT_PROFILE_COUNT = sizeof(TRANSPORT_PROFILES) / sizeof(TRANSPORT_PROFILES[0]);

static char lower(char c) { return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c; }

const TransportProfile* find_profile(const std::string& id) {
  for (size_t i = 0; i < TRANSPORT_PROFILE_COUNT; ++i) {
    const char* p = TRANSPORT_PROFILES[i].id;
    size_t k = 0;
    while (k < id.size() && p[k] != '\0' && lower(id[k]) == p[k]) ++k;
    if (k == id.size() && p[k] == '\0') return &TRANSPORT_PROFILES[i];
  }
  return nullptr;
}

} // namespace ghostcomm
