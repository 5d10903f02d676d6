#include <doctest/doctest.h>
#include "nlohmann/json.hpp"
#include "ghostcomm/parser.hpp"
#include "ghostcomm/profiles.hpp"

using namespace ghostcomm;
using nlohmann::json;

TEST_CASE("volume_to_json describes the header, not the payload") {
    Volume v;
    v.type     = MediaType::Audio;
    v.total    = 5;
    v.index    = 2;
    v.payload  = U"一丁";
    v.checksum = checksum(v.payload);

    json j = json::parse(parser::volume_to_json(v));
    CHECK(j["type"] == "volume");
    CHECK(j["media"] == "A");
    CHECK(j["total"] == 5);
    CHECK(j["index"] == 2);
    CHECK(j["checksum"] == std::string(v.checksum.c_str()));
    CHECK(j["symbols"] == 2);
    CHECK(j["verified"] == true);
    CHECK_FALSE(j.contains("payload"));
}

TEST_CASE("report_to_json carries the feed counters") {
    FeedReport r;
    r.accepted = 2;
    r.duplicates = 1;
    r.rejected = 3;
    r.state = ReceiverState::Accumulating;
    r.have = 2;
    r.total = 7;

    json j = json::parse(parser::report_to_json(r));
    CHECK(j["type"] == "report");
    CHECK(j["state"] == "accumulating");
    CHECK(j["have"] == 2);
    CHECK(j["total"] == 7);
    CHECK(j["rejected"] == 3);
    CHECK(j["inconsistent"] == 0);
}

TEST_CASE("receiver_event_to_json and event_json") {
    ReceiverEvent ev;
    ev.kind  = EventKind::Rejected;
    ev.index = 4;
    ev.total = 9;
    ev.detail.assign("checksum_mismatch");

    json j = json::parse(parser::receiver_event_to_json(ev));
    CHECK(j["kind"] == "rejected");
    CHECK(j["detail"] == "checksum_mismatch");
    CHECK(j["index"] == 4);

    CHECK(parser::get_type(parser::event_json("error", "read_failed")) == "error");
}

TEST_CASE("get_type is safe on bad input") {
    CHECK(parser::get_type("{\"type\":\"report\"}") == "report");
    CHECK(parser::get_type("{\"type\":5}") == "");
    CHECK(parser::get_type("[1,2]") == "");
    CHECK(parser::get_type("not json") == "");
    CHECK(parser::get_type("") == "");
}

TEST_CASE("Transport profiles") {
    REQUIRE(TRANSPORT_PROFILE_COUNT == 4);
    CHECK(find_profile("safe")->max_chars  == 4000);
    CHECK(find_profile("high")->max_chars  == 15000);
    CHECK(find_profile("TITAN")->max_chars == 64000);
    CHECK(find_profile("god")->max_chars   == 200000);
    CHECK(find_profile("titanic") == nullptr);
    CHECK(find_profile("tita")    == nullptr);
    CHECK(find_profile("")        == nullptr);
    CHECK(find_profile(GC_DEFAULT_PROFILE) != nullptr);
}
