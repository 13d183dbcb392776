#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "corridor.h"
#include "receipt_chain.h"

namespace cchain {

// Owns one ReceiptChain per corridor, together with the corridor's lifecycle.
// Receipts are accepted only while the corridor is ACTIVE. Each corridor has
// its own reader/writer lock: append, checkpoint and transitions take it
// exclusively, everything else shared. The corridor map has a separate mutex
// that is never held while a corridor lock is taken, so corridors never
// contend with each other.
class CorridorRegistry {
public:
    explicit CorridorRegistry(ChainOptions opts = {});

    // Returns false if the corridor already exists.
    bool open_corridor(DynCorridor corridor, const ContentDigest& genesis_root, std::string* err = nullptr);
    // Generates a fresh id and opens it as a DRAFT corridor.
    std::optional<CorridorId> establish(const std::string& jurisdiction_a, const std::string& jurisdiction_b,
                                        const ContentDigest& genesis_root, std::string* err = nullptr);
    // Adopts an already restored chain (e.g. ReceiptChain::from_json) with
    // its lifecycle. Both must name the same corridor.
    bool adopt(DynCorridor corridor, ReceiptChain chain, std::string* err = nullptr);

    // Moves a corridor along its lifecycle; see corridor_transition_allowed().
    bool transition(const CorridorId& id, CorridorState to,
                    std::optional<ContentDigest> evidence = std::nullopt,
                    std::optional<std::string> reason = std::nullopt,
                    std::string* err = nullptr, CorridorError* code = nullptr);
    std::optional<CorridorState> state(const CorridorId& id) const;
    std::optional<DynCorridor> lifecycle(const CorridorId& id) const;

    bool contains(const CorridorId& id) const;
    size_t size() const;
    std::vector<CorridorId> corridors() const;

    // CORRIDOR_NOT_ACTIVE unless the corridor is ACTIVE.
    bool append(const CorridorId& id, const Receipt& r,
                std::string* err = nullptr, ChainError* code = nullptr);
    // Builds the next receipt from the chain state and appends it under one
    // exclusive lock, so sequence and prev_root cannot go stale in between.
    // `build` fills the receipt (including the seal); returning false aborts.
    bool append_next(const CorridorId& id,
                     const std::function<bool(const ReceiptChain&, Receipt&)>& build,
                     std::string* err = nullptr, ChainError* code = nullptr);
    std::optional<Checkpoint> create_checkpoint(const CorridorId& id,
                                                std::string* err = nullptr, ChainError* code = nullptr);

    // Runs `fn` under the corridor's shared lock. False if unknown.
    bool read(const CorridorId& id, const std::function<void(const ReceiptChain&)>& fn) const;

    std::optional<uint64_t> height(const CorridorId& id) const;
    std::optional<std::string> mmr_root(const CorridorId& id) const;
    std::optional<std::string> final_state_root_hex(const CorridorId& id) const;
    bool build_inclusion_proof(const CorridorId& id, uint64_t sequence, MmrInclusionProof& out,
                               std::string* err = nullptr, ChainError* code = nullptr) const;
    bool verify_inclusion_proof(const CorridorId& id, const MmrInclusionProof& proof) const;

private:
    struct Slot {
        Slot(DynCorridor l, ReceiptChain c) : lifecycle(std::move(l)), chain(std::move(c)) {}
        mutable std::shared_mutex mtx;
        DynCorridor  lifecycle;
        ReceiptChain chain;
    };

    std::shared_ptr<Slot> find(const CorridorId& id) const;
    bool insert(DynCorridor corridor, ReceiptChain chain, std::string* err);

    ChainOptions opts_;
    mutable std::mutex mtx_;
    std::map<CorridorId, std::shared_ptr<Slot>> slots_;
};

} // namespace cchain
