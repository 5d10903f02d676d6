// ============================================================================
// config.hpp - user configuration for the ghostcomm CLI
//
// Lives in <state dir>/config.json:
//   { "profile": "titan", "format": "pretty" }
//
// State dir: --state-dir, else $XDG_CONFIG_HOME/ghostcomm, else
// $HOME/.config/ghostcomm. Missing or damaged files fall back to defaults;
// command-line flags always win over the file.
// ============================================================================
#ifndef GHOSTCOMM_CONFIG_HPP
#define GHOSTCOMM_CONFIG_HPP

#include <filesystem>
#include <string>

namespace ghostcomm {

struct Config {
  std::string profile = "titan";    ///< transport profile id
  std::string format  = "pretty";   ///< pretty | json | raw
};

/// $XDG_CONFIG_HOME/ghostcomm or $HOME/.config/ghostcomm.
std::filesystem::path default_state_dir();

/// Read <dir>/config.json. Unknown values are replaced by defaults.
Config load_config(const std::filesystem::path& dir);

/// Write <dir>/config.json atomically. Returns false on I/O failure.
bool save_config(const std::filesystem::path& dir, const Config& cfg);

/// True for "pretty", "json" and "raw".
bool valid_format(const std::string& format);

} // namespace ghostcomm

#endif // GHOSTCOMM_CONFIG_HPP
