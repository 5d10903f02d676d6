/**
 * @file parser.cpp
 * @brief JSON views of GhostComm values for `--format json` and scripting.
 * @details
 *   Every function builds a flat nlohmann::json object and returns `dump()`.
 *   Nothing here throws: `get_type` parses with exceptions disabled and checks
 *   `is_discarded()`, so untrusted input just yields an empty string.
 *
 *   Payloads are never serialized. Volumes are described by their header and
 *   symbol count; the wire text itself is what `to_wire()` is for.
 */

#include "ghostcomm/parser.hpp"

#include "nlohmann/json.hpp"
using nlohmann::json;

namespace ghostcomm {
namespace parser {

std::string volume_to_json(const Volume& v) {
    json j;
    j["type"]     = "volume";
    j["media"]    = std::string(1, to_char(v.type));
    j["total"]    = v.total;
    j["index"]    = v.index;
    j["checksum"] = std::string(v.checksum.c_str());
    j["symbols"]  = v.payload.size();
    j["verified"] = v.verified();
    return j.dump();
}

std::string report_to_json(const FeedReport& r) {
    json j;
    j["type"]         = "report";
    j["state"]        = to_string(r.state);
    j["have"]         = r.have;
    j["total"]        = r.total;
    j["accepted"]     = r.accepted;
    j["duplicates"]   = r.duplicates;
    j["rejected"]     = r.rejected;
    j["inconsistent"] = r.inconsistent;
    return j.dump();
}

std::string receiver_event_to_json(const ReceiverEvent& ev) {
    json j;
    j["type"]   = "event";
    j["kind"]   = to_string(ev.kind);
    j["index"]  = ev.index;
    j["total"]  = ev.total;
    j["detail"] = std::string(ev.detail.c_str());
    return j.dump();
}

std::string event_json(const std::string& type, const std::string& detail) {
    json j;
    j["type"]   = type;
    j["detail"] = detail;
    return j.dump();
}

std::string get_type(const std::string& jsonStr) {
    json j = json::parse(jsonStr, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded() || !j.is_object()) return "";
    auto it = j.find("type");
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

} // namespace parser
} // namespace ghostcomm
