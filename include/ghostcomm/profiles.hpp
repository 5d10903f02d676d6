/**
 * @file profiles.hpp
 * @brief Named `max_chars` presets for common messenger classes.
 *
 * | id      | max_chars | typical transport                         |
 * |---------|-----------|-------------------------------------------|
 * | `safe`  | 4000      | strict messengers, SMS gateways           |
 * | `high`  | 15000     | most desktop chat clients                 |
 * | `titan` | 64000     | large-message clients (default)           |
 * | `god`   | 200000    | pastebins, e-mail bodies                  |
 */
#pragma once

#include <stddef.h>
#include <string>

namespace ghostcomm {

struct TransportProfile {
  const char* id;
  const char* name;
  size_t      max_chars;
};

static constexpr const char* GC_DEFAULT_PROFILE = "titan";

extern const TransportProfile TRANSPORT_PROFILES[];
extern const size_t           TRANSPORT_PROFILE_COUNT;

/// Lookup by id (case-insensitive). nullptr if unknown.
const TransportProfile* find_profile(const std::string& id);

} // namespace ghostcomm
