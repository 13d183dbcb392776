#include "hex.h"
#include <cctype>
#include <cstdint>
#include <string>

namespace cchain {

// -1 on invalid character
static inline int unhex_nibble(char c) {
    if (c >= '0' && c <= '9') return static_cast<int>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<int>(10 + (c - 'a'));
    if (c >= 'A' && c <= 'F') return static_cast<int>(10 + (c - 'A'));
    return -1;
}

static bool decode_into(const std::string& h, uint8_t* out) {
    for (size_t i = 0, j = 0; i < h.size(); i += 2, ++j) {
        const int hi = unhex_nibble(h[i]);
        const int lo = unhex_nibble(h[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[j] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

bool from_hex(const std::string& h, std::vector<uint8_t>& out) {
    if (h.size() % 2 != 0) return false;
    std::vector<uint8_t> tmp(h.size() / 2);
    if (!decode_into(h, tmp.data())) return false;
    out.swap(tmp);
    return true;
}

bool hex_to_hash(const std::string& h, Hash256& out) {
    if (h.size() != 64) return false;
    Hash256 tmp{};
    if (!decode_into(h, tmp.data())) return false;
    out = tmp;
    return true;
}

std::string to_hex(const uint8_t* data, size_t n) {
    static constexpr char LUT[] = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; ++i) {
        const uint8_t b = data[i];
        out[2 * i]     = LUT[b >> 4];
        out[2 * i + 1] = LUT[b & 0x0F];
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& v) {
    return to_hex(v.data(), v.size());
}

std::string to_hex(const Hash256& h) {
    return to_hex(h.data(), h.size());
}

bool is_hex32(const std::string& s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        if (unhex_nibble(c) < 0) return false;
    }
    return true;
}

std::string to_lower_ascii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace cchain
