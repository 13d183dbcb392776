// key=value config loading and logger configuration
#include "config.h"
#include "log.h"
#include <cstdio>
#include <fstream>
#include <string>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (line %d)\n", msg, __LINE__); \
        return 1; \
    } \
} while(0)

using namespace cchain;

int main(){
    log_init(LogLevel::FATAL);
    printf("Testing config...\n");

    // Defaults
    {
        Config c;
        TEST_CHECK(c.log_level == "info", "default level");
        TEST_CHECK(c.checkpoint_interval == DEFAULT_CHECKPOINT_INTERVAL, "default interval");
        TEST_CHECK(c.anchor_confirmations == DEFAULT_ANCHOR_CONFIRMATIONS, "default confirmations");
        printf("  [PASS] Defaults\n");
    }

    // Parsing
    {
        Config c;
        parse_config(
            "# corridor node\n"
            "// also a comment\n"
            "\n"
            "  LOG_LEVEL = Debug  \n"
            "log_categories=chain, mmr,fork\n"
            "log_timestamps=off\n"
            "checkpoint_interval=100\n"
            "anchor_chain_id = sepolia\n"
            "anchor_confirmations=12\n"
            "unknown_key=1\n"
            "no equals sign here\n", c);
        TEST_CHECK(c.log_level == "debug", "keys case-insensitive, values trimmed");
        TEST_CHECK(c.log_categories == "chain, mmr,fork", "category list");
        TEST_CHECK(!c.log_timestamps, "bool off");
        TEST_CHECK(c.checkpoint_interval == 100, "interval");
        TEST_CHECK(c.anchor_chain_id == "sepolia", "chain id");
        TEST_CHECK(c.anchor_confirmations == 12, "confirmations");
        printf("  [PASS] Parsing\n");
    }

    // Bad values keep defaults
    {
        Config c;
        parse_config("checkpoint_interval=-5\n"
                     "anchor_confirmations=99999999999\n"
                     "log_async=maybe\n"
                     "checkpoint_interval=12abc\n"
                     "anchor_chain_id=\n", c);
        TEST_CHECK(c.checkpoint_interval == DEFAULT_CHECKPOINT_INTERVAL, "negative interval ignored");
        TEST_CHECK(c.anchor_confirmations == DEFAULT_ANCHOR_CONFIRMATIONS, "overflow ignored");
        TEST_CHECK(!c.log_async, "bad bool ignored");
        TEST_CHECK(c.anchor_chain_id == DEFAULT_ANCHOR_CHAIN_ID, "empty chain id ignored");
        printf("  [PASS] Bad values\n");
    }

    // Chain and anchor settings come from the same file
    {
        Config c;
        parse_config("checkpoint_interval=2\nanchor_chain_id=sepolia\nanchor_confirmations=1\n", c);
        ChainOptions opts = chain_options_from_config(c);
        TEST_CHECK(opts.checkpoint_interval == 2, "interval reaches chain options");

        const CorridorId id = *CorridorId::parse("3f2504e0-4f89-41d3-9a0c-0305e82c3301");
        const ContentDigest genesis = *ContentDigest::from_hex(std::string(64, '0'));
        ReceiptChain chain(id, genesis, opts);
        for(int i = 0; i < 4; ++i){
            Receipt r(id);
            r.type = RECEIPT_TYPE;
            r.sequence = chain.height();
            r.timestamp = 1718000000 + i;
            r.prev_root = chain.final_state_root_hex();
            TEST_CHECK(r.seal_next_root() && chain.append(r), "append");
        }
        TEST_CHECK(chain.checkpoints().size() == 2, "configured interval checkpoints");

        auto target = anchor_target_from_config(c);
        TEST_CHECK(target && target->chain_id() == "sepolia", "configured chain id");
        auto rc = target->anchor(AnchorCommitment::from_checkpoint(chain.checkpoints().back()));
        TEST_CHECK(rc && rc->chain_id == "sepolia", "anchored on configured chain");
        TEST_CHECK(*target->check_status(rc->tx_id) == AnchorStatus::FINALIZED, "configured depth of one");

        Config d;
        TEST_CHECK(chain_options_from_config(d).checkpoint_interval == DEFAULT_CHECKPOINT_INTERVAL, "default interval");
        TEST_CHECK(anchor_target_from_config(d)->chain_id() == DEFAULT_ANCHOR_CHAIN_ID, "default chain id");
        printf("  [PASS] Chain and anchor settings\n");
    }

    // Loading from a file
    {
        const std::string path = "cchain_test_config.conf";
        {
            std::ofstream f(path);
            f << "checkpoint_interval=7\nlog_level=warn\n";
        }
        Config c;
        TEST_CHECK(load_config(path, c), "file loads");
        TEST_CHECK(c.checkpoint_interval == 7 && c.log_level == "warn", "file values");
        std::remove(path.c_str());
        TEST_CHECK(!load_config("/nonexistent/cchain.conf", c), "missing file reported");
        printf("  [PASS] File loading\n");
    }

    // Applying log settings
    {
        Config c;
        c.log_level = "warn";
        c.log_categories = "chain,fork";
        c.log_timestamps = false;
        std::string err;
        TEST_CHECK(apply_log_config(c, &err), "apply");
        TEST_CHECK(log_get_level() == LogLevel::WARN, "level applied");
        TEST_CHECK(log_get_categories() == ((uint32_t)LogCategory::CHAIN | (uint32_t)LogCategory::FORK), "categories applied");

        Config bad = c;
        bad.log_level = "loud";
        TEST_CHECK(!apply_log_config(bad, &err) && !err.empty(), "unknown level rejected");
        TEST_CHECK(log_get_level() == LogLevel::WARN, "logger untouched on error");
        bad = c;
        bad.log_categories = "chain,disk";
        TEST_CHECK(!apply_log_config(bad, &err), "unknown category rejected");

        c.log_categories = "all";
        c.log_async = true;
        TEST_CHECK(apply_log_config(c), "async on");
        log_warn(LogCategory::CONFIG, "async logging smoke test");
        log_flush();
        log_shutdown();
        printf("  [PASS] Log settings\n");
    }

    printf("All config tests passed!\n");
    return 0;
}
