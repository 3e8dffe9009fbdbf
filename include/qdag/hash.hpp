#pragma once

#include <cstdint>
#include <cstring>
#include <string>

namespace qdag {

// FNV-1a streaming hash
constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
constexpr uint64_t FNV_PRIME = 1099511628211ULL;

inline uint64_t fnv_hash_byte(uint64_t h, uint8_t b) {
    h ^= b;
    h *= FNV_PRIME;
    return h;
}

inline uint64_t fnv_hash_u64(uint64_t h, uint64_t val) {
    for (int i = 0; i < 8; ++i) {
        h = fnv_hash_byte(h, static_cast<uint8_t>(val & 0xFF));
        val >>= 8;
    }
    return h;
}

inline uint64_t fnv_hash_i64(uint64_t h, int64_t val) {
    uint64_t u;
    std::memcpy(&u, &val, 8);
    return fnv_hash_u64(h, u);
}

inline uint64_t fnv_hash_double(uint64_t h, double val) {
    // +0.0 and -0.0 compare equal, so they must hash equal
    if (val == 0.0)
        val = 0.0;
    uint64_t u;
    std::memcpy(&u, &val, 8);
    return fnv_hash_u64(h, u);
}

inline uint64_t fnv_hash_string(uint64_t h, const std::string &s) {
    for (unsigned char c : s) {
        h = fnv_hash_byte(h, c);
    }
    return h;
}

} // namespace qdag
