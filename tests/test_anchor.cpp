// Mock anchor target: commitments, status polling, failures
#include "anchor.h"
#include "receipt_chain.h"
#include "log.h"
#include <cstdio>
#include <memory>
#include <string>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (line %d)\n", msg, __LINE__); \
        return 1; \
    } \
} while(0)

using namespace cchain;

static Checkpoint make_checkpoint(uint64_t receipts){
    const CorridorId id = *CorridorId::parse("6ba7b810-9dad-41d1-80b4-00c04fd430c8");
    ReceiptChain chain(id, *ContentDigest::from_hex(std::string(64, '0')));
    for(uint64_t i = 0; i < receipts; ++i){
        Receipt r(id);
        r.type = RECEIPT_TYPE;
        r.sequence = chain.height();
        r.timestamp = 1718000000 + (int64_t)i;
        r.prev_root = chain.final_state_root_hex();
        r.seal_next_root();
        chain.append(r);
    }
    return *chain.create_checkpoint();
}

int main(){
    log_init(LogLevel::FATAL);
    printf("Testing anchoring...\n");

    // Anchor then poll to finality, through the abstract interface
    {
        std::unique_ptr<AnchorTarget> target(new MockAnchorTarget("testnet", 2));
        TEST_CHECK(target->chain_id() == "testnet", "chain id");

        Checkpoint cp = make_checkpoint(3);
        AnchorCommitment c = AnchorCommitment::from_checkpoint(cp);
        TEST_CHECK(c.height == 3 && c.checkpoint_digest == cp.checkpoint_digest.to_string(), "commitment from checkpoint");

        auto rc = target->anchor(c);
        TEST_CHECK(rc, "anchored");
        TEST_CHECK(rc->chain_id == "testnet", "receipt chain id");
        TEST_CHECK(rc->block_number == 1, "first block is 1");
        TEST_CHECK(rc->status == AnchorStatus::PENDING, "starts pending");
        TEST_CHECK(rc->tx_id.rfind("mock-tx-" + cp.checkpoint_digest.hex().substr(0, 16), 0) == 0,
                   "tx id derived from digest");
        TEST_CHECK(rc->commitment.height == 3, "commitment echoed");

        TEST_CHECK(*target->check_status(rc->tx_id) == AnchorStatus::CONFIRMED, "poll 1 confirmed");
        TEST_CHECK(*target->check_status(rc->tx_id) == AnchorStatus::FINALIZED, "poll 2 finalized");
        TEST_CHECK(*target->check_status(rc->tx_id) == AnchorStatus::FINALIZED, "stays finalized");

        auto rc2 = target->anchor(AnchorCommitment::from_checkpoint(make_checkpoint(4), std::string("testnet")));
        TEST_CHECK(rc2 && rc2->block_number == 2, "block numbers increase");
        TEST_CHECK(rc2->tx_id != rc->tx_id, "distinct tx ids");
        printf("  [PASS] Anchor and finalize\n");
    }

    // Confirmations accumulate one per poll
    {
        MockAnchorTarget t("deep", 4);
        auto rc = t.anchor(AnchorCommitment::from_checkpoint(make_checkpoint(2)));
        TEST_CHECK(rc && rc->status == AnchorStatus::PENDING, "pending before any poll");
        for(int i = 1; i < 4; ++i){
            TEST_CHECK(*t.check_status(rc->tx_id) == AnchorStatus::CONFIRMED, "confirmed below depth");
        }
        TEST_CHECK(*t.check_status(rc->tx_id) == AnchorStatus::FINALIZED, "finalized at depth");
        TEST_CHECK(std::string(anchor_status_name(AnchorStatus::CONFIRMED)) == "confirmed", "confirmed name");

        auto rc2 = t.anchor(AnchorCommitment::from_checkpoint(make_checkpoint(3)));
        TEST_CHECK(*t.check_status(rc2->tx_id) == AnchorStatus::CONFIRMED, "second tx confirmed");
        TEST_CHECK(t.fail_transaction(rc2->tx_id), "revert confirmed tx");
        TEST_CHECK(*t.check_status(rc2->tx_id) == AnchorStatus::FAILED, "reverted stays failed");
        printf("  [PASS] Confirmation depth\n");
    }

    // Zero confirmations finalize immediately
    {
        MockAnchorTarget t("instant", 0);
        auto rc = t.anchor(AnchorCommitment::from_checkpoint(make_checkpoint(1)));
        TEST_CHECK(rc && rc->status == AnchorStatus::FINALIZED, "finalized at once");
        printf("  [PASS] Zero confirmations\n");
    }

    // Typed failures
    {
        MockAnchorTarget t("testnet", 1);
        AnchorError code = AnchorError::NONE;
        std::string err;

        TEST_CHECK(!t.check_status("mock-tx-nope", &err, &code), "unknown tx");
        TEST_CHECK(code == AnchorError::UNKNOWN_TRANSACTION, "code UNKNOWN_TRANSACTION");

        AnchorCommitment empty;
        TEST_CHECK(!t.anchor(empty, &err, &code), "empty digest");
        TEST_CHECK(code == AnchorError::REJECTED, "code REJECTED for empty digest");

        AnchorCommitment c = AnchorCommitment::from_checkpoint(make_checkpoint(2), std::string("mainnet"));
        TEST_CHECK(!t.anchor(c, &err, &code), "chain id mismatch");
        TEST_CHECK(code == AnchorError::REJECTED, "code REJECTED for chain mismatch");

        c.chain_id.reset();
        t.set_available(false);
        TEST_CHECK(!t.anchor(c, &err, &code), "unavailable");
        TEST_CHECK(code == AnchorError::CHAIN_UNAVAILABLE, "code CHAIN_UNAVAILABLE");
        t.set_available(true);

        t.fail_next_submission();
        TEST_CHECK(!t.anchor(c, &err, &code), "reverted submission");
        TEST_CHECK(code == AnchorError::TRANSACTION_FAILED, "code TRANSACTION_FAILED");
        TEST_CHECK(t.transaction_count() == 0, "nothing recorded by failures");

        // The same checkpoint can be anchored again after a failure
        auto rc = t.anchor(c);
        TEST_CHECK(rc && rc->block_number == 1, "retry succeeds");
        TEST_CHECK(t.fail_transaction(rc->tx_id), "mark failed");
        TEST_CHECK(*t.check_status(rc->tx_id) == AnchorStatus::FAILED, "failed status reported");
        TEST_CHECK(std::string(anchor_status_name(AnchorStatus::FAILED)) == "failed", "status name");
        printf("  [PASS] Typed failures\n");
    }

    printf("All anchor tests passed!\n");
    return 0;
}
