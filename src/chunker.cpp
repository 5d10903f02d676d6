/**
 * @file chunker.cpp
 * @brief Volume chunker implementation.
 *
 * Refer to chunker.hpp for the sizing rule and failure modes.
 */
#include "ghostcomm/chunker.hpp"
#include "ghostcomm/checksum.hpp"

namespace ghostcomm {

const char* to_string(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Ok:             return "ok";
        case ChunkStatus::LimitTooLow:    return "limit_too_low";
        case ChunkStatus::TooManyVolumes: return "too_many_volumes";
    }
    return "unknown";
}

// "GC" ':' type ':' total ':' index ':' checksum ':'
size_t header_overhead(size_t total) {
    const size_t t = total == 0 ? 1 : total;
    return GC_PREFIX_LEN + 1
         + 1 + 1
         + decimal_digits(t) + 1
         + decimal_digits(t - 1) + 1
         + GC_CHECKSUM_LEN + 1;
}

ChunkPlan plan(size_t symbol_count, size_t max_chars) {
    ChunkPlan p;

    // Fixed point: the guess only grows, and the overhead only grows with it,
    // so this ends after at most a handful of rounds (one per extra digit).
    size_t guess = 1;
    for (;;) {
        const size_t overhead = header_overhead(guess);
        if (max_chars <= overhead) {
            p.status = ChunkStatus::LimitTooLow;
            return p;
        }

        const size_t size  = max_chars - overhead;
        const size_t total = (symbol_count + size - 1) / size;

        if (header_overhead(total) <= overhead) {
            p.effective_size = size;
            p.total          = total;
            break;
        }
        guess = total;
    }

    if (p.total > GC_VOLUMES_MAX) p.status = ChunkStatus::TooManyVolumes;
    return p;
}

ChunkStatus chunk_volumes(MediaType type, const SymbolString& symbols, size_t max_chars,
                          std::vector<Volume>& out) {
    out.clear();

    // Step 1: size the slices
    const ChunkPlan p = plan(symbols.size(), max_chars);
    if (p.status != ChunkStatus::Ok) return p.status;

    // Step 2: cut, fingerprint, stamp
    out.reserve(p.total);
    for (size_t i = 0; i < p.total; ++i) {
        const size_t start = i * p.effective_size;
        const size_t len   = (symbols.size() - start < p.effective_size) ? (symbols.size() - start)
                                                                         : p.effective_size;
        Volume v;
        v.type     = type;
        v.total    = static_cast<uint16_t>(p.total);
        v.index    = static_cast<uint16_t>(i);
        v.payload  = symbols.substr(start, len);
        v.checksum = checksum(v.payload);
        out.push_back(std::move(v));
    }
    return ChunkStatus::Ok;
}

ChunkStatus chunk(MediaType type, const SymbolString& symbols, size_t max_chars,
                  std::vector<std::string>& out) {
    out.clear();

    std::vector<Volume> volumes;
    const ChunkStatus status = chunk_volumes(type, symbols, max_chars, volumes);
    if (status != ChunkStatus::Ok) return status;

    out.reserve(volumes.size());
    for (const Volume& v : volumes) out.push_back(to_wire(v));
    return ChunkStatus::Ok;
}

} // namespace ghostcomm
