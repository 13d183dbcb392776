#include "digest.h"
#include "hex.h"

namespace cchain {

const char* digest_algorithm_name(DigestAlgorithm a){
    switch(a){
        case DigestAlgorithm::SHA256: return "sha256";
    }
    return "unknown";
}

ContentDigest digest(const CanonicalBytes& bytes){
    return ContentDigest(DigestAlgorithm::SHA256, sha256(bytes.data(), bytes.size()));
}

std::string ContentDigest::hex() const {
    return to_hex(hash_);
}

std::string ContentDigest::to_string() const {
    return std::string(digest_algorithm_name(algo_)) + ":" + hex();
}

std::optional<ContentDigest> ContentDigest::from_hex(const std::string& s){
    static const std::string prefix = "sha256:";
    std::string h = s;
    if(h.size() == prefix.size() + 64 && h.compare(0, prefix.size(), prefix) == 0){
        h = h.substr(prefix.size());
    }
    Hash256 raw{};
    if(!hex_to_hash(h, raw)) return std::nullopt;
    return ContentDigest(DigestAlgorithm::SHA256, raw);
}

std::optional<ContentDigest> digest_value(const JNode& value, std::string* err, CanonError* code){
    auto cb = canonicalize(value, err, code);
    if(!cb) return std::nullopt;
    return digest(*cb);
}

} // namespace cchain
