#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "checkpoint.h"
#include "constants.h"

namespace cchain {

enum class AnchorStatus {
    PENDING,      // submitted, not yet in a block
    CONFIRMED,    // in a block, short of the finality depth
    FINALIZED,
    FAILED,
};

const char* anchor_status_name(AnchorStatus s);

enum class AnchorError {
    NONE = 0,
    REJECTED,             // malformed commitment or wrong chain id
    CHAIN_UNAVAILABLE,
    TRANSACTION_FAILED,
    UNKNOWN_TRANSACTION,
};

const char* anchor_error_name(AnchorError e);

struct AnchorCommitment {
    std::string                checkpoint_digest;   // "sha256:<hex>" or bare hex
    std::optional<std::string> chain_id;            // unset: target's own chain
    uint64_t                   height{0};

    static AnchorCommitment from_checkpoint(const Checkpoint& cp,
                                            std::optional<std::string> chain_id = std::nullopt);
};

struct AnchorReceipt {
    AnchorCommitment commitment;
    std::string      chain_id;
    std::string      tx_id;
    uint64_t         block_number{0};
    AnchorStatus     status{AnchorStatus::PENDING};
};

// External ledger a checkpoint digest can be committed to. Anchoring is
// optional and never feeds back into chain validity.
//
// The set of targets is closed: the constructor is private and only the
// implementations named as friends below can derive from it.
class AnchorTarget {
public:
    virtual ~AnchorTarget() = default;
    AnchorTarget(const AnchorTarget&) = delete;
    AnchorTarget& operator=(const AnchorTarget&) = delete;

    virtual std::string chain_id() const = 0;
    virtual std::optional<AnchorReceipt> anchor(const AnchorCommitment& c,
                                                std::string* err = nullptr,
                                                AnchorError* code = nullptr) = 0;
    virtual std::optional<AnchorStatus> check_status(const std::string& tx_id,
                                                     std::string* err = nullptr,
                                                     AnchorError* code = nullptr) = 0;

private:
    AnchorTarget() = default;
    friend class MockAnchorTarget;
};

// In-process ledger. Block numbers start at 1 and increase by one per
// anchored commitment. Each check_status call adds one confirmation: a new
// transaction is pending, confirmed after the first poll, and finalized once
// it has been polled `confirmations` times.
class MockAnchorTarget final : public AnchorTarget {
public:
    explicit MockAnchorTarget(std::string chain_id = DEFAULT_ANCHOR_CHAIN_ID,
                              uint32_t confirmations = DEFAULT_ANCHOR_CONFIRMATIONS);

    std::string chain_id() const override { return chain_id_; }
    std::optional<AnchorReceipt> anchor(const AnchorCommitment& c,
                                        std::string* err = nullptr,
                                        AnchorError* code = nullptr) override;
    std::optional<AnchorStatus> check_status(const std::string& tx_id,
                                             std::string* err = nullptr,
                                             AnchorError* code = nullptr) override;

    // Simulated outages and reverted transactions.
    void set_available(bool on);
    // The next anchor() call fails with TRANSACTION_FAILED.
    void fail_next_submission();
    // Marks an existing transaction as failed (reverted after inclusion).
    bool fail_transaction(const std::string& tx_id);

    size_t transaction_count() const;

private:
    struct Entry {
        AnchorReceipt receipt;
        uint32_t      polls{0};
    };

    mutable std::mutex           mtx_;
    std::string                  chain_id_;
    uint32_t                     confirmations_;
    bool                         available_{true};
    bool                         fail_next_{false};
    uint64_t                     next_block_{1};
    std::map<std::string, Entry> ledger_;
};

} // namespace cchain
