// ============================================================================
// session_store.hpp - persisted receiving flow between CLI invocations
//
// Each `ghostcomm decode` run is one paste event. Accepted volumes survive in
// <state dir>/session.json until the transmission completes or the user resets:
//
//   { "volumes": ["GC:I:3:0:...", "GC:I:3:2:..."], "last_time": 1739212345678 }
//
// Volumes are stored as wire text, so a restored session goes back through the
// extractor and every checksum is verified again.
// ============================================================================
#ifndef GHOSTCOMM_SESSION_STORE_HPP
#define GHOSTCOMM_SESSION_STORE_HPP

#include "ghostcomm/volume.hpp"
#include <filesystem>
#include <stdint.h>
#include <string>
#include <vector>

namespace ghostcomm {

struct Session {
  std::vector<std::string> volumes;     ///< wire text, one per volume
  uint64_t                 last_time = 0;   ///< ms since epoch of last save
};

/// Path of the session file inside `dir`.
std::filesystem::path session_path(const std::filesystem::path& dir);

/**
 * @brief Load <dir>/session.json.
 * @return false if the file exists but cannot be parsed; `out` is then empty.
 *         A missing file is not an error.
 */
bool load_session(const std::filesystem::path& dir, Session& out);

/// Write <dir>/session.json via temp file + rename.
bool save_session(const std::filesystem::path& dir, const Session& s);

/// Build a session from accepted volumes.
Session make_session(const std::vector<Volume>& volumes, uint64_t now_ms);

/// Remove <dir>/session.json. A missing file counts as success.
bool clear_session(const std::filesystem::path& dir);

} // namespace ghostcomm

#endif // GHOSTCOMM_SESSION_STORE_HPP
