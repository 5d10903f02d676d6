#include <doctest/doctest.h>
#include "ghostcomm/bitpack.hpp"
#include "ghostcomm/chunker.hpp"
#include "ghostcomm/receiver.hpp"

using namespace ghostcomm;

static Bytes sample(size_t n) {
    Bytes b(n);
    for (size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>(i * 5u + 2u);
    return b;
}

static std::vector<std::string> encode_wire(const Alphabet& a, MediaType t, const Bytes& b, size_t max_chars) {
    BitPackCodec codec(a);
    std::vector<std::string> wire;
    REQUIRE(chunk(t, codec.encode(b), max_chars, wire) == ChunkStatus::Ok);
    return wire;
}

// Reverses the byte order; fails on a payload that starts with 0xFF.
struct ReverseFilter : PayloadFilter {
    bool apply(const Bytes& in, Bytes& out) override {
        if (!in.empty() && in[0] == 0xFF) return false;
        out.assign(in.rbegin(), in.rend());
        return true;
    }
};

TEST_CASE("Receiver walks Idle -> Accumulating -> Complete across pastes") {
    Alphabet a;
    Bytes payload = sample(100);
    std::vector<std::string> wire = encode_wire(a, MediaType::Video, payload, 40);
    REQUIRE(wire.size() == 3);

    Receiver rx(a);
    CHECK(rx.state() == ReceiverState::Idle);

    FeedReport r1 = rx.feed("look: " + wire[2]);
    CHECK(r1.accepted == 1);
    CHECK(r1.state == ReceiverState::Accumulating);
    CHECK(r1.have == 1);
    CHECK(r1.total == 3);

    FeedReport r2 = rx.feed(wire[0] + "\n" + wire[2]);
    CHECK(r2.accepted == 1);
    CHECK(r2.duplicates == 1);
    CHECK(r2.state == ReceiverState::Accumulating);
    CHECK(rx.missing() == std::vector<uint16_t>{1});

    FeedReport r3 = rx.feed(wire[1]);
    CHECK(r3.state == ReceiverState::Complete);
    CHECK(rx.result() == payload);
    CHECK(rx.type() == MediaType::Video);
    CHECK(rx.failure() == FailureReason::None);
}

TEST_CASE("Noise and damaged volumes never move the receiver to Error") {
    Alphabet a;
    std::vector<std::string> wire = encode_wire(a, MediaType::Image, sample(100), 40);

    Receiver rx(a);
    FeedReport r = rx.feed("hello GC:I:3:0:ABCD:nothing here GC:Q:1:0:0:x");
    CHECK(r.rejected == 2);
    CHECK(r.state == ReceiverState::Idle);

    r = rx.feed(wire[0]);
    CHECK(r.state == ReceiverState::Accumulating);
    r = rx.feed("GC:I:3:1:ZZZZ:一丁");
    CHECK(r.rejected == 1);
    CHECK(r.state == ReceiverState::Accumulating);
    CHECK(rx.have() == 1);
}

TEST_CASE("Volumes of another transmission are counted as inconsistent") {
    Alphabet a;
    std::vector<std::string> first  = encode_wire(a, MediaType::Image, sample(100), 40);
    std::vector<std::string> second = encode_wire(a, MediaType::Image, sample(60), 40);
    REQUIRE(second.size() == 2);

    Receiver rx(a);
    rx.feed(first[0]);
    FeedReport r = rx.feed(second[0] + second[1]);
    CHECK(r.inconsistent == 2);
    CHECK(r.accepted == 0);
    CHECK(rx.total() == 3);
}

TEST_CASE("Terminal states ignore input until reset") {
    Alphabet a;
    Bytes payload = sample(20);
    std::vector<std::string> wire = encode_wire(a, MediaType::Audio, payload, 4000);
    REQUIRE(wire.size() == 1);

    Receiver rx(a);
    REQUIRE(rx.feed(wire[0]).state == ReceiverState::Complete);
    rx.clear_events();

    std::vector<std::string> other = encode_wire(a, MediaType::Image, sample(30), 4000);
    FeedReport r = rx.feed(other[0]);
    CHECK(r.state == ReceiverState::Complete);
    CHECK(r.accepted == 0);
    CHECK(rx.result() == payload);

    ReceiverEvent ev;
    REQUIRE(rx.get_event(ev));
    CHECK(ev.kind == EventKind::Ignored);

    rx.reset();
    CHECK(rx.state() == ReceiverState::Idle);
    CHECK(rx.result().empty());
    CHECK(rx.total() == 0);
    CHECK(rx.feed(other[0]).state == ReceiverState::Complete);
    CHECK(rx.type() == MediaType::Image);
}

TEST_CASE("Undecodable complete set moves to Error") {
    Alphabet a;
    Volume v;
    v.type     = MediaType::Image;
    v.total    = 1;
    v.index    = 0;
    v.payload  = SymbolString(4, a.symbol_of(GC_SYMBOL_MASK));
    v.checksum = checksum(v.payload);

    Receiver rx(a);
    FeedReport r = rx.feed(to_wire(v));
    CHECK(r.state == ReceiverState::Error);
    CHECK(rx.failure() == FailureReason::Decode);
    CHECK(rx.decode_status() == DecodeStatus::LengthOverrun);
    CHECK(rx.result().empty());

    CHECK(rx.feed(to_wire(v)).state == ReceiverState::Error);
    rx.reset();
    CHECK(rx.failure() == FailureReason::None);
}

TEST_CASE("Payload filter is applied to rebuilt bytes") {
    Alphabet a;
    ReverseFilter filter;

    SUBCASE("success") {
        Bytes payload{1, 2, 3, 4};
        Receiver rx(a, &filter);
        REQUIRE(rx.feed(encode_wire(a, MediaType::Image, payload, 4000)[0]).state == ReceiverState::Complete);
        CHECK(rx.result() == Bytes{4, 3, 2, 1});
    }
    SUBCASE("failure is an integrity error") {
        Bytes payload{0xFF, 0x00};
        Receiver rx(a, &filter);
        FeedReport r = rx.feed(encode_wire(a, MediaType::Image, payload, 4000)[0]);
        CHECK(r.state == ReceiverState::Error);
        CHECK(rx.failure() == FailureReason::Filter);
        CHECK(rx.result().empty());
    }
}

TEST_CASE("Events describe what happened, oldest first") {
    Alphabet a;
    std::vector<std::string> wire = encode_wire(a, MediaType::Image, sample(100), 40);

    Receiver rx(a);
    rx.feed("GC:I:1:0:0:" + wire[1] + wire[1]);

    ReceiverEvent ev;
    REQUIRE(rx.get_event(ev));
    CHECK(ev.kind == EventKind::Rejected);
    CHECK(std::string(ev.detail.c_str()) == "empty_payload");

    REQUIRE(rx.get_event(ev));
    CHECK(ev.kind == EventKind::Accepted);
    CHECK(ev.index == 1);
    CHECK(ev.total == 3);

    REQUIRE(rx.get_event(ev));
    CHECK(ev.kind == EventKind::Duplicate);

    REQUIRE(rx.get_event(ev));
    CHECK(ev.kind == EventKind::Progress);
    CHECK(ev.index == 1);   // have
    CHECK(ev.total == 3);

    CHECK_FALSE(rx.get_event(ev));
}

TEST_CASE("Event queue keeps only the newest EVENT_CAP entries") {
    Alphabet a;
    Receiver rx(a);

    std::string junk;
    for (size_t i = 0; i < Receiver::EVENT_CAP + 10; ++i) junk += "GC:X:1:0:0:x ";
    rx.feed(junk);

    size_t n = 0;
    ReceiverEvent ev;
    while (rx.get_event(ev)) ++n;
    CHECK(n == Receiver::EVENT_CAP);
}

TEST_CASE("Restored volumes feed the same flow") {
    Alphabet a;
    BitPackCodec codec(a);
    Bytes payload = sample(100);
    std::vector<Volume> volumes;
    REQUIRE(chunk_volumes(MediaType::Image, codec.encode(payload), 40, volumes) == ChunkStatus::Ok);

    Receiver rx(a);
    FeedReport r = rx.feed(std::vector<Volume>{volumes[0], volumes[2]});
    CHECK(r.accepted == 2);
    CHECK(r.state == ReceiverState::Accumulating);
    CHECK(rx.volumes().size() == 2);

    r = rx.feed(std::vector<Volume>{volumes[1]});
    CHECK(r.state == ReceiverState::Complete);
    CHECK(rx.result() == payload);
}
