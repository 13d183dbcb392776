#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "digest.h"

namespace cchain {

// One observed head for a given sequence number.
struct ForkBranch {
    ContentDigest receipt_digest;
    int64_t       timestamp{0};          // unix seconds
    uint32_t      attestation_count{0};  // independent watchers vouching for it
    std::string   next_root;             // claimed, informational
};

enum class ResolutionReason {
    EARLIER_TIMESTAMP,       // timestamps differ by more than MAX_CLOCK_SKEW_SECS
    MORE_ATTESTATIONS,
    LEXICOGRAPHIC_TIEBREAK,  // smaller receipt digest bytes
};

const char* resolution_reason_name(ResolutionReason r);

struct ForkResolution {
    ContentDigest    winning_digest;
    ContentDigest    losing_digest;
    ResolutionReason reason;
};

enum class ForkError {
    NONE = 0,
    NOT_A_FORK,         // identical receipt digests
    FUTURE_TIMESTAMP,   // a branch is more than MAX_FUTURE_DRIFT_SECS ahead of `now`
};

const char* fork_error_name(ForkError e);

// Two branches fork iff their receipt digests differ.
bool is_fork(const ForkBranch& a, const ForkBranch& b);

// Deterministic, symmetric resolution. `now` is only used for the future
// drift bound; it is a parameter so that every node evaluating the same pair
// at the same instant agrees.
std::optional<ForkResolution> resolve_fork(const ForkBranch& a, const ForkBranch& b, int64_t now,
                                           std::string* err = nullptr, ForkError* code = nullptr);

// Result of one queued pair.
struct ForkOutcome {
    ForkBranch                    a;
    ForkBranch                    b;
    std::optional<ForkResolution> resolution;
    ForkError                     error{ForkError::NONE};
    std::string                   message;
};

// Queue of fork pairs awaiting resolution. Safe to feed from several threads.
class ForkDetector {
public:
    // Ignores (and reports) pairs that are not forks.
    bool register_fork(const ForkBranch& a, const ForkBranch& b, std::string* err = nullptr);

    size_t pending() const;

    // Drains the queue; one outcome per pair, in registration order.
    std::vector<ForkOutcome> resolve_all(int64_t now);

private:
    mutable std::mutex mtx_;
    std::vector<std::pair<ForkBranch, ForkBranch>> queue_;
};

} // namespace cchain
