// ============================================================================
// config.cpp - implementation for config.hpp
// ============================================================================

#include "ghostcomm/config.hpp"
#include "ghostcomm/profiles.hpp"
#include "json_file.hpp"

#include <cstdlib>            // getenv for XDG/HOME lookups

namespace fs = std::filesystem;
using nlohmann::json;

namespace ghostcomm {

static constexpr const char* CONFIG_FILE = "config.json";

fs::path default_state_dir() {
    if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
        return fs::path(x) / "ghostcomm";
    const char* home = std::getenv("HOME");
    return fs::path(home ? home : "") / ".config" / "ghostcomm";
}

bool valid_format(const std::string& format) {
    return format == "pretty" || format == "json" || format == "raw";
}

Config load_config(const fs::path& dir) {
    Config cfg;
    json j = read_json_file(dir / CONFIG_FILE);
    if (j.is_discarded() || !j.is_object()) return cfg;

    // Only take values that are of the right kind and actually known
    auto p = j.find("profile");
    if (p != j.end() && p->is_string()) {
        if (const TransportProfile* tp = find_profile(p->get<std::string>())) cfg.profile = tp->id;
    }

    auto f = j.find("format");
    if (f != j.end() && f->is_string() && valid_format(f->get<std::string>()))
        cfg.format = f->get<std::string>();

    return cfg;
}

bool save_config(const fs::path& dir, const Config& cfg) {
    json j;
    j["profile"] = cfg.profile;
    j["format"]  = cfg.format;
    return atomic_write_json(dir / CONFIG_FILE, j);
}

} // namespace ghostcomm
