#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "corridor_id.h"
#include "digest.h"
#include "json.h"
#include "mmr.h"

namespace cchain {

// Snapshot of (height, MMR root). Only those two values are digested; the
// rest is context for verifiers and operators.
struct Checkpoint {
    uint64_t             height{0};
    std::string          mmr_root;           // "" for an empty chain
    ContentDigest        checkpoint_digest;

    CorridorId           corridor_id;
    std::string          genesis_root;
    std::string          final_state_root;
    std::vector<MmrPeak> peaks;
    int64_t              timestamp{0};       // creation time, unix seconds

    // Digest of the canonical object {"height":H,"mmr_root":R}.
    static std::optional<ContentDigest> compute_digest(uint64_t height, const std::string& mmr_root,
                                                       std::string* err = nullptr);
    // Recomputes the digest from (height, mmr_root) and compares.
    bool verify_digest() const;

    JNode to_json() const;
    // Rejects a checkpoint whose stored digest does not match its content.
    static std::optional<Checkpoint> from_json(const JNode& n, std::string* err = nullptr);
};

} // namespace cchain
