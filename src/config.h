#pragma once
#include <string>
#include <cstdint>
#include <memory>
#include "anchor.h"
#include "constants.h"
#include "receipt_chain.h"

namespace cchain {

struct Config {
    // Logging
    std::string log_level = "info";          // trace|debug|info|warn|error|fatal|none
    std::string log_categories = "all";      // comma list: chain,mmr,fork,...
    bool        log_timestamps = true;
    bool        log_async = false;           // background writer thread

    // Receipt chain
    uint64_t    checkpoint_interval = DEFAULT_CHECKPOINT_INTERVAL;   // 0 = manual checkpoints only

    // Anchoring (mock target)
    std::string anchor_chain_id = DEFAULT_ANCHOR_CHAIN_ID;
    uint32_t    anchor_confirmations = DEFAULT_ANCHOR_CONFIRMATIONS;
};

// Simple key=value loader. Unknown keys are warned about and ignored; bad
// values are reported and leave the default in place. Returns false if the
// file cannot be opened.
bool load_config(const std::string& path, Config& out);
// Same rules, reading from a string.
void parse_config(const std::string& text, Config& out);

// Pushes the logging keys into the logger. Returns false (and leaves the
// logger untouched) if the level or a category name is not recognized.
bool apply_log_config(const Config& cfg, std::string* err = nullptr);

// Chain settings for ReceiptChain and CorridorRegistry.
ChainOptions chain_options_from_config(const Config& cfg);
// Anchor target described by the anchor_* keys.
std::unique_ptr<AnchorTarget> anchor_target_from_config(const Config& cfg);

}
