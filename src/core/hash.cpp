#include "evidenceforge/hash.hpp"

namespace ef {

void Fnv1a64::update(const void* data, size_t n) {
    const auto* p = static_cast<const uint8_t*>(data);
    if (p == nullptr || n == 0) return;
    for (size_t i = 0; i < n; ++i) {
        h_ ^= static_cast<uint64_t>(p[i]);
        h_ *= kPrime;
    }
}

Digest64 hash_bytes(const void* data, size_t n) {
    Fnv1a64 h;
    h.update(data, n);
    return h.digest();
}

Digest64 hash_bytes(const std::vector<uint8_t>& bytes) {
    return hash_bytes(bytes.data(), bytes.size());
}

Digest64 hash_string(std::string_view s) {
    return hash_bytes(s.data(), s.size());
}

std::string to_hex(uint64_t v) {
    static const char* digits = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<size_t>(i)] = digits[v & 0xFu];
        v >>= 4;
    }
    return out;
}

std::string Digest64::hex() const { return to_hex(value); }

} // namespace ef
