// checksum.cpp - base-36 rolling hash. See checksum.hpp for the algorithm.
#include "ghostcomm/checksum.hpp"

namespace ghostcomm {

ChecksumStr checksum(const Symbol* data, size_t len) {
    // Unsigned arithmetic gives the two's-complement wrap without UB
    uint32_t h = 0;
    for (size_t i = 0; i < len; ++i) {
        h = h * 31u + static_cast<uint32_t>(data[i]);
    }
    const int32_t  hash      = static_cast<int32_t>(h);
    const uint64_t magnitude = hash < 0 ? static_cast<uint64_t>(-static_cast<int64_t>(hash))
                                        : static_cast<uint64_t>(hash);

    // Base-36 digits, least significant first
    static const char DIGITS[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    char tmp[16];
    size_t n = 0;
    uint64_t v = magnitude;
    do {
        tmp[n++] = DIGITS[v % 36];
        v /= 36;
    } while (v != 0);

    // Most significant first, truncated to the fingerprint length
    ChecksumStr out;
    for (size_t i = 0; i < n && out.size() < GC_CHECKSUM_LEN; ++i) {
        out.push_back(tmp[n - 1 - i]);
    }
    return out;
}

bool is_checksum_text(const char* text, size_t len) {
    if (len == 0 || len > GC_CHECKSUM_LEN) return false;
    for (size_t i = 0; i < len; ++i) {
        const char c = text[i];
        if (!((c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z'))) return false;
    }
    return true;
}

} // namespace ghostcomm
