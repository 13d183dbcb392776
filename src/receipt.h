#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "canonical.h"
#include "corridor_id.h"
#include "digest.h"
#include "json.h"

namespace cchain {

// One entry of a lawpack/ruleset digest set: either a bare digest string or
// an artifact reference.
struct DigestEntry {
    std::string digest_sha256;
    // Set for artifact references only.
    std::optional<std::string> artifact_type;
    std::optional<std::string> uri;

    static DigestEntry digest(std::string d) { return DigestEntry{std::move(d), std::nullopt, std::nullopt}; }
    static DigestEntry artifact(std::string d, std::string type, std::optional<std::string> uri = std::nullopt) {
        return DigestEntry{std::move(d), std::move(type), std::move(uri)};
    }
    bool is_artifact() const { return artifact_type.has_value(); }

    JNode to_json() const;
    static bool from_json(const JNode& n, DigestEntry& out, std::string* err = nullptr);

    bool operator==(const DigestEntry& o) const {
        return digest_sha256 == o.digest_sha256 && artifact_type == o.artifact_type && uri == o.uri;
    }
};

struct Receipt {
    std::string              type;
    CorridorId               corridor_id;
    uint64_t                 sequence{0};
    int64_t                  timestamp{0};   // unix seconds, rendered as RFC 3339 UTC
    std::string              prev_root;
    std::string              next_root;
    std::vector<DigestEntry> lawpack_digest_set;   // caller order is kept
    std::vector<DigestEntry> ruleset_digest_set;

    std::optional<JNode>       transition;
    std::optional<std::string> transition_type_registry_digest_sha256;
    // Signatures over the sealed content; never part of it.
    std::optional<JNode>       proof;

    explicit Receipt(CorridorId id) : corridor_id(std::move(id)) {}

    // Full serialized form, including next_root and proof.
    JNode to_json() const;
    // Canonical content: everything except next_root and proof.
    JNode content_json() const;

    // hex(SHA256(canonical(content_json()))). This is both the seal and the
    // MMR leaf for the receipt.
    std::optional<std::string> compute_next_root(std::string* err = nullptr, CanonError* code = nullptr) const;
    std::optional<ContentDigest> content_digest(std::string* err = nullptr, CanonError* code = nullptr) const;
    // Sets next_root from compute_next_root().
    bool seal_next_root(std::string* err = nullptr, CanonError* code = nullptr);

    static std::optional<Receipt> from_json(const JNode& n, std::string* err = nullptr);
};

} // namespace cchain
