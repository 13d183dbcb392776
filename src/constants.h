#pragma once
#include <cstdint>

namespace cchain {

// Receipt/checkpoint type tags
static constexpr const char* RECEIPT_TYPE    = "CorridorStateReceipt";
static constexpr const char* CHECKPOINT_TYPE = "CorridorStateCheckpoint";

// Fork resolution
static constexpr int64_t MAX_CLOCK_SKEW_SECS   = 300;  // 5 minutes
static constexpr int64_t MAX_FUTURE_DRIFT_SECS = 60;

// Defaults (overridable from config)
static constexpr uint64_t DEFAULT_CHECKPOINT_INTERVAL  = 0;   // 0 = manual only
static constexpr uint32_t DEFAULT_ANCHOR_CONFIRMATIONS = 2;
static constexpr const char* DEFAULT_ANCHOR_CHAIN_ID   = "mock";

}
