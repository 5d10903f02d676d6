// Internal: small JSON file helpers shared by config.cpp and session_store.cpp.
#pragma once

#include <filesystem>
#include "nlohmann/json.hpp"

namespace ghostcomm {

/// Parse a JSON file. Missing, unreadable or invalid files yield a discarded value.
nlohmann::json read_json_file(const std::filesystem::path& p);

/// Write `j` to `p` via `<p>.tmp` + rename. Reports failures on std::cerr.
bool atomic_write_json(const std::filesystem::path& p, const nlohmann::json& j);

} // namespace ghostcomm
