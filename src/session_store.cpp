// ============================================================================
// session_store.cpp - implementation for session_store.hpp
// ============================================================================

#include "ghostcomm/session_store.hpp"
#include "json_file.hpp"

#include <iostream>           // std::cerr for error reporting
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace ghostcomm {

fs::path session_path(const fs::path& dir) {
    return dir / "session.json";
}

bool load_session(const fs::path& dir, Session& out) {
    out = Session{};

    std::error_code ec;
    const fs::path p = session_path(dir);
    if (!fs::exists(p, ec)) return true;   // nothing saved yet

    json j = read_json_file(p);
    if (j.is_discarded() || !j.is_object()) {
        std::cerr << "session file unreadable: " << p.string() << "\n";
        return false;
    }

    auto t = j.find("last_time");
    if (t != j.end() && t->is_number_unsigned()) out.last_time = t->get<uint64_t>();

    auto v = j.find("volumes");
    if (v != j.end() && v->is_array()) {
        for (const auto& e : *v) {
            if (e.is_string()) out.volumes.push_back(e.get<std::string>());   // non-strings skipped
        }
    }
    return true;
}

bool save_session(const fs::path& dir, const Session& s) {
    json j;
    j["volumes"]   = s.volumes;
    j["last_time"] = s.last_time;
    return atomic_write_json(session_path(dir), j);
}

Session make_session(const std::vector<Volume>& volumes, uint64_t now_ms) {
    Session s;
    s.last_time = now_ms;
    s.volumes.reserve(volumes.size());
    for (const Volume& v : volumes) s.volumes.push_back(to_wire(v));
    return s;
}

bool clear_session(const fs::path& dir) {
    std::error_code ec;
    fs::remove(session_path(dir), ec);   // false + no ec when missing
    if (ec) { std::cerr << "session clear failed: " << ec.message() << "\n"; return false; }
    return true;
}

} // namespace ghostcomm
