#pragma once
/*
 Deterministic content hashing for seeds and artifact identity.

 FNV-1a 64 over raw bytes. Not cryptographic: the digest only has to be
 stable across runs, builds and platforms so that identical photos and
 coordinates always seed identical random streams.
*/
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ef {

struct Digest64 {
    uint64_t value = 0;

    // 16 lowercase hex digits, most significant nibble first.
    std::string hex() const;
    // Value of the leading 8 hex digits.
    uint32_t leading32() const { return static_cast<uint32_t>(value >> 32); }

    bool operator==(const Digest64& o) const { return value == o.value; }
    bool operator!=(const Digest64& o) const { return value != o.value; }
};

class Fnv1a64 {
public:
    static constexpr uint64_t kOffsetBasis = 14695981039346656037ull;
    static constexpr uint64_t kPrime       = 1099511628211ull;

    Fnv1a64() = default;

    void update(const void* data, size_t n);
    void update(std::string_view s) { update(s.data(), s.size()); }

    Digest64 digest() const { return Digest64{h_}; }

private:
    uint64_t h_ = kOffsetBasis;
};

Digest64 hash_bytes(const void* data, size_t n);
Digest64 hash_bytes(const std::vector<uint8_t>& bytes);
Digest64 hash_string(std::string_view s);

// 64-bit finalizer (Murmur3 fmix64); used to derive salted sub-seeds.
inline uint64_t mix64(uint64_t x) {
    x ^= x >> 33; x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33; x *= 0xc4ceb9fe1a85ec53ULL;
    return x ^ (x >> 33);
}

std::string to_hex(uint64_t v);

} // namespace ef
