// ============================================================================
// json_file.cpp - read / atomically write small JSON state files
// ============================================================================

#include "json_file.hpp"

#include <fstream>            // std::ifstream / std::ofstream
#include <iostream>           // std::cerr for error reporting
#include <system_error>       // std::error_code for non-throwing filesystem ops

namespace fs = std::filesystem;
using nlohmann::json;

namespace ghostcomm {

json read_json_file(const fs::path& p) {
    std::error_code ec;
    if (!fs::exists(p, ec) || ec) return json(json::value_t::discarded);

    std::ifstream in(p);
    if (!in) return json(json::value_t::discarded);
    return json::parse(in, nullptr, /*allow_exceptions*/false);
}

/*
 * atomic_write_json()
 * -------------------
 * Phases:
 *   1) make sure the parent directory exists,
 *   2) write everything to <p>.tmp,
 *   3) rename over <p>; readers see the old or the new file, never half of one.
 */
bool atomic_write_json(const fs::path& p, const json& j) {
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) { std::cerr << "state dir error: " << ec.message() << "\n"; return false; }
    }

    fs::path tmp = p;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) { std::cerr << "open " << tmp.string() << " failed\n"; return false; }
        out << j.dump(2) << "\n";
        out.flush();
        if (!out) { std::cerr << "write " << tmp.string() << " failed\n"; return false; }
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        std::cerr << "rename " << p.string() << " failed: " << ec.message() << "\n";
        fs::remove(tmp, ec);   // best-effort cleanup
        return false;
    }
    return true;
}

} // namespace ghostcomm
