#include "fork.h"
#include "constants.h"
#include "log.h"

namespace cchain {

const char* resolution_reason_name(ResolutionReason r){
    switch(r){
        case ResolutionReason::EARLIER_TIMESTAMP: return "earlier_timestamp";
        case ResolutionReason::MORE_ATTESTATIONS: return "more_attestations";
        case ResolutionReason::LEXICOGRAPHIC_TIEBREAK: return "lexicographic_tiebreak";
    }
    return "unknown";
}

const char* fork_error_name(ForkError e){
    switch(e){
        case ForkError::NONE: return "none";
        case ForkError::NOT_A_FORK: return "not_a_fork";
        case ForkError::FUTURE_TIMESTAMP: return "future_timestamp";
    }
    return "unknown";
}

bool is_fork(const ForkBranch& a, const ForkBranch& b){
    return a.receipt_digest != b.receipt_digest;
}

// |x - y| without signed overflow; exact for every pair of int64 values.
static uint64_t abs_diff(int64_t x, int64_t y){
    return x < y ? (uint64_t)y - (uint64_t)x : (uint64_t)x - (uint64_t)y;
}

static ForkResolution decide(const ForkBranch& win, const ForkBranch& lose, ResolutionReason why){
    return ForkResolution{win.receipt_digest, lose.receipt_digest, why};
}

std::optional<ForkResolution> resolve_fork(const ForkBranch& a, const ForkBranch& b, int64_t now,
                                           std::string* err, ForkError* code){
    auto fail = [&](ForkError c, const std::string& m) -> std::optional<ForkResolution> {
        CCHAIN_LOG_WARN(LogCategory::FORK, std::string("fork rejected (") + fork_error_name(c) + "): " + m);
        if(err) *err = m;
        if(code) *code = c;
        return std::nullopt;
    };

    if(!is_fork(a, b)) return fail(ForkError::NOT_A_FORK, "identical receipt digest " + a.receipt_digest.hex());

    // Check both branches in digest order so the reported branch does not
    // depend on argument order.
    const ForkBranch& lo = (a.receipt_digest < b.receipt_digest) ? a : b;
    const ForkBranch& hi = (&lo == &a) ? b : a;
    for(const ForkBranch* br : {&lo, &hi}){
        if(br->timestamp > now && abs_diff(br->timestamp, now) > (uint64_t)MAX_FUTURE_DRIFT_SECS){
            return fail(ForkError::FUTURE_TIMESTAMP,
                        "branch " + br->receipt_digest.hex() + " timestamp " + std::to_string(br->timestamp)
                        + " exceeds now " + std::to_string(now) + " + " + std::to_string(MAX_FUTURE_DRIFT_SECS) + "s");
        }
    }

    std::optional<ForkResolution> r;
    if(abs_diff(a.timestamp, b.timestamp) > (uint64_t)MAX_CLOCK_SKEW_SECS){
        r = (a.timestamp < b.timestamp) ? decide(a, b, ResolutionReason::EARLIER_TIMESTAMP)
                                        : decide(b, a, ResolutionReason::EARLIER_TIMESTAMP);
    } else if(a.attestation_count != b.attestation_count){
        r = (a.attestation_count > b.attestation_count) ? decide(a, b, ResolutionReason::MORE_ATTESTATIONS)
                                                        : decide(b, a, ResolutionReason::MORE_ATTESTATIONS);
    } else {
        r = decide(lo, hi, ResolutionReason::LEXICOGRAPHIC_TIEBREAK);
    }

    CCHAIN_LOG_INFO(LogCategory::FORK, "fork resolved: winner " + r->winning_digest.hex()
                    + " loser " + r->losing_digest.hex() + " (" + resolution_reason_name(r->reason) + ")");
    return r;
}

bool ForkDetector::register_fork(const ForkBranch& a, const ForkBranch& b, std::string* err){
    if(!is_fork(a, b)){
        // Duplicate observations of the same head arrive in bursts
        CCHAIN_LOG_RATE_LIMITED(debug, LogCategory::FORK, "ignoring non-fork pair " + a.receipt_digest.hex());
        if(err) *err = "not a fork: identical receipt digest " + a.receipt_digest.hex();
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    queue_.emplace_back(a, b);
    return true;
}

size_t ForkDetector::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

std::vector<ForkOutcome> ForkDetector::resolve_all(int64_t now){
    std::vector<std::pair<ForkBranch, ForkBranch>> work;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        work.swap(queue_);
    }

    std::vector<ForkOutcome> out;
    out.reserve(work.size());
    for(auto& p : work){
        ForkOutcome o{p.first, p.second, std::nullopt, ForkError::NONE, std::string()};
        o.resolution = resolve_fork(p.first, p.second, now, &o.message, &o.error);
        out.push_back(std::move(o));
    }
    return out;
}

} // namespace cchain
