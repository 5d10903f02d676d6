#include <doctest/doctest.h>
#include "ghostcomm/bitpack.hpp"
#include "ghostcomm/chunk_set.hpp"
#include "ghostcomm/chunker.hpp"
#include "ghostcomm/extractor.hpp"
#include "ghostcomm/utf8.hpp"

using namespace ghostcomm;

static Bytes sample_bytes(size_t n, uint8_t seed) {
    Bytes b(n);
    for (size_t i = 0; i < n; ++i) b[i] = static_cast<uint8_t>(i * 13u + seed);
    return b;
}

static std::vector<std::string> wire_for(const BitPackCodec& codec, MediaType t, const Bytes& payload, size_t max_chars) {
    std::vector<std::string> wire;
    REQUIRE(chunk(t, codec.encode(payload), max_chars, wire) == ChunkStatus::Ok);
    return wire;
}

TEST_CASE("Three volumes of 100 bytes at 40 characters rebuild the payload") {
    Alphabet a;
    BitPackCodec codec(a);
    VolumeExtractor extractor(a);

    Bytes payload = sample_bytes(100, 1);
    SymbolString s = codec.encode(payload);
    std::vector<std::string> wire;
    REQUIRE(chunk(MediaType::Image, s, 40, wire) == ChunkStatus::Ok);
    REQUIRE(wire.size() == 3);

    std::string text;
    for (const std::string& w : wire) text += w + "\n";

    ChunkSet set;
    InsertSummary sum = set.insert_all(extractor.extract(text));
    CHECK(sum.inserted == 3);

    SymbolString joined;
    REQUIRE(set.concatenate(joined));
    CHECK(joined == s);

    Reassembly r = set.try_reassemble(codec);
    REQUIRE(r.status == ReassemblyStatus::Complete);
    CHECK(r.bytes == payload);
}

TEST_CASE("Chat noise around and inside volumes is tolerated") {
    Alphabet a;
    BitPackCodec codec(a);
    VolumeExtractor extractor(a);

    Bytes payload = sample_bytes(60, 7);
    std::vector<std::string> wire = wire_for(codec, MediaType::Audio, payload, 40);
    REQUIRE(wire.size() >= 2);

    // Preamble, quoting, timestamps, and a line wrap inside a payload
    const SymbolString first = utf8::decode(wire[0]);
    const size_t half = first.size() / 2;   // past the 14-character header
    std::string text = "[12:01] alice: here it comes\n> ";
    text += utf8::encode(first.substr(0, half));
    text += " \r\n ";
    text += utf8::encode(first.substr(half));
    for (size_t i = 1; i < wire.size(); ++i) text += "\n\n" + wire[i] + "  ";

    std::vector<Volume> found = extractor.extract(text);
    REQUIRE(found.size() == wire.size());

    ChunkSet set;
    set.insert_all(found);
    Reassembly r = set.try_reassemble(codec);
    REQUIRE(r.status == ReassemblyStatus::Complete);
    CHECK(r.bytes == payload);
}

TEST_CASE("Damaged volumes are dropped without stopping the scan") {
    Alphabet a;
    BitPackCodec codec(a);
    VolumeExtractor extractor(a);

    std::vector<std::string> wire = wire_for(codec, MediaType::Image, sample_bytes(100, 3), 40);
    REQUIRE(wire.size() == 3);

    // Replace the first payload symbol of volume 1 with another alphabet symbol
    SymbolString v1 = utf8::decode(wire[1]);
    size_t colons = 0, pos = 0;
    while (colons < 5) { if (v1[pos] == U':') ++colons; ++pos; }
    v1[pos] = (v1[pos] == a.symbol_of(0)) ? a.symbol_of(1) : a.symbol_of(0);
    wire[1] = utf8::encode(v1);

    std::vector<SegmentResult> scanned = extractor.scan(wire[0] + wire[1] + wire[2]);
    REQUIRE(scanned.size() == 3);
    CHECK(scanned[0].ok());
    CHECK(scanned[1].status == SegmentStatus::ChecksumMismatch);
    CHECK(scanned[2].ok());
    CHECK(extractor.extract(wire[0] + wire[1] + wire[2]).size() == 2);
}

TEST_CASE("Segment parse failures are tagged") {
    Alphabet a;
    VolumeExtractor ex(a);
    const std::string sym = utf8::encode(U"一");   // checksum FEO

    CHECK(ex.parse_segment("I:1:0:FEO:" + sym).status == SegmentStatus::Ok);
    CHECK(ex.parse_segment(" I : 1 : 0 : FEO :" + sym).status == SegmentStatus::Ok);

    CHECK(ex.parse_segment("   ").status                  == SegmentStatus::Empty);
    CHECK(ex.parse_segment("I:1:0").status                == SegmentStatus::MissingFields);
    CHECK(ex.parse_segment("X:1:0:FEO:" + sym).status     == SegmentStatus::BadType);
    CHECK(ex.parse_segment("I:0:0:FEO:" + sym).status     == SegmentStatus::BadTotal);
    CHECK(ex.parse_segment("I:-1:0:FEO:" + sym).status    == SegmentStatus::BadTotal);
    CHECK(ex.parse_segment("I:99999:0:FEO:" + sym).status == SegmentStatus::BadTotal);
    CHECK(ex.parse_segment("I:2:x:FEO:" + sym).status     == SegmentStatus::BadIndex);
    CHECK(ex.parse_segment("I:2:2:FEO:" + sym).status     == SegmentStatus::IndexOutOfRange);
    CHECK(ex.parse_segment("I:257:0:FEO:" + sym).status   == SegmentStatus::TotalTooLarge);
    CHECK(ex.parse_segment("I:1:0:FEO:hello").status      == SegmentStatus::EmptyPayload);
    CHECK(ex.parse_segment("I:1:0:ABCD:" + sym).status    == SegmentStatus::ChecksumMismatch);
    CHECK(ex.parse_segment("I:1:0:feo:" + sym).status     == SegmentStatus::ChecksumMismatch);

    SegmentResult r = ex.parse_segment("V:4:3:FEO:" + sym);
    REQUIRE(r.ok());
    CHECK(r.volume.type  == MediaType::Video);
    CHECK(r.volume.total == 4);
    CHECK(r.volume.index == 3);
    CHECK(r.computed == ChecksumStr("FEO"));
}

TEST_CASE("Text without volumes yields nothing") {
    Alphabet a;
    VolumeExtractor ex(a);
    CHECK(ex.scan("").empty());
    CHECK(ex.scan("just chatting, no GC here").empty());
    CHECK(ex.extract("GC:").empty());
}

TEST_CASE("Interleaved transmissions separate into their own groups") {
    Alphabet a;
    BitPackCodec codec(a);
    VolumeExtractor extractor(a);

    Bytes image = sample_bytes(100, 5);
    Bytes audio = sample_bytes(60, 9);
    std::vector<std::string> wi = wire_for(codec, MediaType::Image, image, 40);
    std::vector<std::string> wa = wire_for(codec, MediaType::Audio, audio, 40);
    REQUIRE(wi.size() == 3);
    REQUIRE(wa.size() == 2);

    std::string text = wi[2] + "\n" + wa[1] + "\n" + wi[0] + "\n" + wa[0] + "\n" + wi[1];

    auto groups = group_by_transmission(extractor.extract(text));
    REQUIRE(groups.size() == 2);

    const TransmissionKey ki{MediaType::Image, 3};
    const TransmissionKey ka{MediaType::Audio, 2};
    REQUIRE(groups.count(ki) == 1);
    REQUIRE(groups.count(ka) == 1);
    CHECK(groups[ki].size() == 3);
    CHECK(groups[ka].size() == 2);

    ChunkSet si, sa;
    si.insert_all(groups[ki]);
    sa.insert_all(groups[ka]);
    CHECK(si.try_reassemble(codec).bytes == image);
    CHECK(sa.try_reassemble(codec).bytes == audio);
}
