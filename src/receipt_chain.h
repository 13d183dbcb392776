#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "checkpoint.h"
#include "corridor_id.h"
#include "digest.h"
#include "json.h"
#include "mmr.h"
#include "receipt.h"

namespace cchain {

enum class ChainError {
    NONE = 0,
    SEQUENCE_MISMATCH,    // receipt.sequence != height()
    PREV_ROOT_MISMATCH,   // receipt.prev_root != final_state_root_hex()
    INVALID_TIMESTAMP,    // timestamp not representable as RFC 3339
    NEXT_ROOT_MISMATCH,   // receipt.next_root != recomputed seal
    CANONICALIZATION,
    MMR,
    EMPTY_CHAIN,
    PROOF_FAILED,
    CORRIDOR_NOT_ACTIVE,  // registry: corridor lifecycle is not ACTIVE
    CHECKPOINT_MISMATCH,  // persisted checkpoint disagrees with the replayed chain
};

const char* chain_error_name(ChainError e);

struct ChainOptions {
    // Create a checkpoint automatically every N appended receipts; 0 disables.
    uint64_t checkpoint_interval{0};
};

// Append-only receipt chain of one corridor.
//
// Invariants:
//   height() == receipts().size() == mmr().size()
//   mmr leaf i == receipts()[i].next_root (the receipt content digest)
//   final_state_root() == genesis root, or the last receipt's next_root
//
// A rejected append leaves every observable value unchanged. The chain does
// no locking of its own; callers serialize writers per corridor (see
// CorridorRegistry).
class ReceiptChain {
public:
    ReceiptChain(CorridorId corridor_id, ContentDigest genesis_root, ChainOptions opts = {});

    const CorridorId& corridor_id() const { return corridor_id_; }
    const ContentDigest& genesis_root() const { return genesis_root_; }
    const ContentDigest& final_state_root() const { return final_state_root_; }
    std::string final_state_root_hex() const { return final_state_root_.hex(); }
    const ChainOptions& options() const { return opts_; }

    uint64_t height() const { return (uint64_t)receipts_.size(); }
    std::string mmr_root() const { return mmr_.root(); }
    const MerkleMountainRange& mmr() const { return mmr_; }
    const std::vector<Receipt>& receipts() const { return receipts_; }
    const std::vector<Checkpoint>& checkpoints() const { return checkpoints_; }

    // Validation order: sequence, prev_root, timestamp range, next_root seal.
    // Nothing is mutated until all of them pass.
    bool append(const Receipt& r, std::string* err = nullptr, ChainError* code = nullptr);

    // Snapshot of the current (height, mmr_root); kept in checkpoints().
    // An empty chain checkpoints as (0, "").
    std::optional<Checkpoint> create_checkpoint(std::string* err = nullptr, ChainError* code = nullptr);

    bool build_inclusion_proof(uint64_t sequence, MmrInclusionProof& out,
                               std::string* err = nullptr, ChainError* code = nullptr) const;
    // False unless proof.root is the current MMR root and the proof folds to it.
    bool verify_inclusion_proof(const MmrInclusionProof& proof) const;

    // Rebuilds a chain by replaying full append validation over persisted
    // receipts. The first rejected receipt aborts the restore.
    static std::optional<ReceiptChain> restore(const CorridorId& corridor_id,
                                               const ContentDigest& genesis_root,
                                               const std::vector<Receipt>& receipts,
                                               ChainOptions opts = {},
                                               std::string* err = nullptr,
                                               ChainError* code = nullptr);

    // {corridor_id, genesis_root, receipts[], checkpoints[]}
    JNode to_json() const;
    // Replays the receipts and checks each checkpoint against the MMR root of
    // the leaf prefix it claims.
    static std::optional<ReceiptChain> from_json(const JNode& n, ChainOptions opts = {},
                                                 std::string* err = nullptr,
                                                 ChainError* code = nullptr);

private:
    bool reject(ChainError c, const std::string& msg, std::string* err, ChainError* code) const;

    CorridorId              corridor_id_;
    ContentDigest           genesis_root_;
    ContentDigest           final_state_root_;
    ChainOptions            opts_;
    std::vector<Receipt>    receipts_;
    MerkleMountainRange     mmr_;
    std::vector<Checkpoint> checkpoints_;
};

} // namespace cchain
