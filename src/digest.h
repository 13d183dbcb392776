#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "canonical.h"
#include "sha256.h"

namespace cchain {

enum class DigestAlgorithm : uint8_t {
    SHA256 = 0,
};

const char* digest_algorithm_name(DigestAlgorithm a);

class ContentDigest;

// The only general-purpose way to obtain a ContentDigest.
ContentDigest digest(const CanonicalBytes& bytes);

// Content identifier: algorithm tag plus 32-byte hash.
class ContentDigest {
public:
    DigestAlgorithm algorithm() const { return algo_; }
    const Hash256& bytes() const { return hash_; }

    // 64 lowercase hex characters (storage key form)
    std::string hex() const;
    // "sha256:<hex>"
    std::string to_string() const;

    // Reloads a persisted identifier. Accepts exactly 64 hex characters or
    // the "sha256:<hex>" display form.
    static std::optional<ContentDigest> from_hex(const std::string& s);

    bool operator==(const ContentDigest& o) const { return algo_ == o.algo_ && hash_ == o.hash_; }
    bool operator!=(const ContentDigest& o) const { return !(*this == o); }
    // Byte-wise lexicographic order of the hash.
    bool operator<(const ContentDigest& o) const { return hash_ < o.hash_; }

private:
    ContentDigest(DigestAlgorithm a, const Hash256& h) : algo_(a), hash_(h) {}
    friend ContentDigest digest(const CanonicalBytes& bytes);

    DigestAlgorithm algo_;
    Hash256 hash_;
};

// canonicalize() followed by digest(); nullopt when canonicalization fails.
std::optional<ContentDigest> digest_value(const JNode& value,
                                          std::string* err = nullptr,
                                          CanonError* code = nullptr);

} // namespace cchain

namespace std {
template<> struct hash<cchain::ContentDigest> {
    size_t operator()(const cchain::ContentDigest& d) const noexcept {
        size_t h = 0;
        for(size_t i = 0; i < sizeof(size_t); ++i) h = (h << 8) | d.bytes()[i];
        return h;
    }
};
}
