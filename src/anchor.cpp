#include "anchor.h"
#include "log.h"

namespace cchain {

const char* anchor_status_name(AnchorStatus s){
    switch(s){
        case AnchorStatus::PENDING: return "pending";
        case AnchorStatus::CONFIRMED: return "confirmed";
        case AnchorStatus::FINALIZED: return "finalized";
        case AnchorStatus::FAILED: return "failed";
    }
    return "unknown";
}

const char* anchor_error_name(AnchorError e){
    switch(e){
        case AnchorError::NONE: return "none";
        case AnchorError::REJECTED: return "rejected";
        case AnchorError::CHAIN_UNAVAILABLE: return "chain_unavailable";
        case AnchorError::TRANSACTION_FAILED: return "transaction_failed";
        case AnchorError::UNKNOWN_TRANSACTION: return "unknown_transaction";
    }
    return "unknown";
}

AnchorCommitment AnchorCommitment::from_checkpoint(const Checkpoint& cp, std::optional<std::string> chain_id){
    return AnchorCommitment{cp.checkpoint_digest.to_string(), std::move(chain_id), cp.height};
}

static bool anchor_fail(AnchorError c, const std::string& m, std::string* err, AnchorError* code){
    CCHAIN_LOG_WARN(LogCategory::ANCHOR, std::string("anchor ") + anchor_error_name(c) + ": " + m);
    if(err) *err = m;
    if(code) *code = c;
    return false;
}

MockAnchorTarget::MockAnchorTarget(std::string chain_id, uint32_t confirmations)
    : chain_id_(std::move(chain_id)), confirmations_(confirmations) {}

std::optional<AnchorReceipt> MockAnchorTarget::anchor(const AnchorCommitment& c, std::string* err, AnchorError* code){
    std::lock_guard<std::mutex> lk(mtx_);
    if(!available_){
        anchor_fail(AnchorError::CHAIN_UNAVAILABLE, "chain " + chain_id_ + " unavailable", err, code);
        return std::nullopt;
    }
    if(c.chain_id && *c.chain_id != chain_id_){
        anchor_fail(AnchorError::REJECTED, "commitment for chain " + *c.chain_id + " sent to " + chain_id_, err, code);
        return std::nullopt;
    }
    auto d = ContentDigest::from_hex(c.checkpoint_digest);
    if(!d){
        anchor_fail(AnchorError::REJECTED, "invalid checkpoint digest '" + c.checkpoint_digest + "'", err, code);
        return std::nullopt;
    }
    if(fail_next_){
        fail_next_ = false;
        anchor_fail(AnchorError::TRANSACTION_FAILED, "submission of " + d->to_string() + " reverted", err, code);
        return std::nullopt;
    }

    const uint64_t block = next_block_++;
    AnchorReceipt r;
    r.commitment = c;
    r.chain_id = chain_id_;
    r.tx_id = "mock-tx-" + d->hex().substr(0, 16) + "-" + std::to_string(block);
    r.block_number = block;
    r.status = confirmations_ == 0 ? AnchorStatus::FINALIZED : AnchorStatus::PENDING;
    ledger_[r.tx_id] = Entry{r, 0};

    CCHAIN_LOG_INFO(LogCategory::ANCHOR, "anchored " + d->to_string() + " height " + std::to_string(c.height)
                    + " as " + r.tx_id + " in block " + std::to_string(block));
    return r;
}

std::optional<AnchorStatus> MockAnchorTarget::check_status(const std::string& tx_id, std::string* err, AnchorError* code){
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = ledger_.find(tx_id);
    if(it == ledger_.end()){
        anchor_fail(AnchorError::UNKNOWN_TRANSACTION, "unknown transaction " + tx_id, err, code);
        return std::nullopt;
    }
    Entry& e = it->second;
    if(e.receipt.status == AnchorStatus::PENDING || e.receipt.status == AnchorStatus::CONFIRMED){
        e.receipt.status = (++e.polls >= confirmations_) ? AnchorStatus::FINALIZED : AnchorStatus::CONFIRMED;
    }
    return e.receipt.status;
}

void MockAnchorTarget::set_available(bool on){
    std::lock_guard<std::mutex> lk(mtx_);
    available_ = on;
}

void MockAnchorTarget::fail_next_submission(){
    std::lock_guard<std::mutex> lk(mtx_);
    fail_next_ = true;
}

bool MockAnchorTarget::fail_transaction(const std::string& tx_id){
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = ledger_.find(tx_id);
    if(it == ledger_.end()) return false;
    it->second.receipt.status = AnchorStatus::FAILED;
    return true;
}

size_t MockAnchorTarget::transaction_count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ledger_.size();
}

} // namespace cchain
