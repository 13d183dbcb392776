#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace cchain {

using Hash256 = std::array<uint8_t, 32>;

// Streaming SHA-256. Used for content digests (over canonical bytes only)
// and for the domain-separated MMR leaf/node hashes.
class Sha256 {
public:
    Sha256();

    Sha256& write(const uint8_t* data, size_t len);
    Sha256& write(const std::string& s);
    Sha256& write_byte(uint8_t b);
    Sha256& write(const Hash256& h) { return write(h.data(), h.size()); }

    // Finalizes the stream. The object must be reset() before reuse.
    Hash256 finalize();
    void reset();

private:
    uint32_t h_[8];
    uint64_t bits_;     // total message length in bits
    uint8_t  buf_[64];  // partial block buffer
    size_t   idx_;      // number of bytes currently in buf_
};

Hash256 sha256(const uint8_t* data, size_t len);

} // namespace cchain
