#include "corridor.h"
#include "log.h"

namespace cchain {

const char* corridor_state_name(CorridorState s){
    switch(s){
        case CorridorState::DRAFT: return "DRAFT";
        case CorridorState::PENDING: return "PENDING";
        case CorridorState::ACTIVE: return "ACTIVE";
        case CorridorState::HALTED: return "HALTED";
        case CorridorState::SUSPENDED: return "SUSPENDED";
        case CorridorState::DEPRECATED: return "DEPRECATED";
    }
    return "UNKNOWN";
}

bool corridor_state_from_string(const std::string& s, CorridorState& out){
    static const CorridorState all[] = {
        CorridorState::DRAFT, CorridorState::PENDING, CorridorState::ACTIVE,
        CorridorState::HALTED, CorridorState::SUSPENDED, CorridorState::DEPRECATED,
    };
    for(CorridorState c : all){
        if(s == corridor_state_name(c)){ out = c; return true; }
    }
    return false;
}

bool corridor_state_is_terminal(CorridorState s){
    return s == CorridorState::DEPRECATED;
}

bool corridor_transition_allowed(CorridorState from, CorridorState to){
    switch(from){
        case CorridorState::DRAFT:     return to == CorridorState::PENDING;
        case CorridorState::PENDING:   return to == CorridorState::ACTIVE;
        case CorridorState::ACTIVE:    return to == CorridorState::HALTED || to == CorridorState::SUSPENDED;
        case CorridorState::SUSPENDED: return to == CorridorState::ACTIVE;
        case CorridorState::HALTED:    return to == CorridorState::DEPRECATED;
        case CorridorState::DEPRECATED: return false;
    }
    return false;
}

const char* corridor_error_name(CorridorError e){
    switch(e){
        case CorridorError::NONE: return "none";
        case CorridorError::INVALID_TRANSITION: return "invalid_transition";
    }
    return "unknown";
}

JNode TransitionRecord::to_json() const {
    JObject o;
    o["from_state"] = jstr(corridor_state_name(from));
    o["to_state"] = jstr(corridor_state_name(to));
    o["timestamp"] = jstr(format_utc(timestamp));
    if(evidence_digest) o["evidence_digest"] = jstr(evidence_digest->to_string());
    if(reason) o["reason"] = jstr(*reason);
    return jobj(std::move(o));
}

Corridor<Draft> new_corridor(CorridorId id, std::string jurisdiction_a, std::string jurisdiction_b){
    return Corridor<Draft>(std::move(id), std::move(jurisdiction_a), std::move(jurisdiction_b), now(), {});
}

Corridor<Pending> submit(Corridor<Draft> c, const SubmissionEvidence& evidence){
    return c.move_to<Pending>(evidence.bilateral_agreement_digest, "Corridor submitted for regulatory review");
}

Corridor<Active> activate(Corridor<Pending> c, const ActivationEvidence& evidence){
    return c.move_to<Active>(evidence.regulatory_approval_a, "Corridor activated after regulatory approval");
}

Corridor<Halted> halt(Corridor<Active> c, const HaltReason& reason){
    return c.move_to<Halted>(reason.evidence, "Halted by " + reason.authority + ": " + reason.reason);
}

Corridor<Suspended> suspend(Corridor<Active> c, const SuspendReason& reason){
    return c.move_to<Suspended>(std::nullopt, "Suspended: " + reason.reason);
}

Corridor<Active> resume(Corridor<Suspended> c, const ResumeEvidence& evidence){
    return c.move_to<Active>(evidence.resolution_attestation, "Corridor resumed after suspension resolution");
}

Corridor<Deprecated> deprecate(Corridor<Halted> c, const DeprecationEvidence& evidence){
    return c.move_to<Deprecated>(evidence.migration_plan_digest, "Deprecated: " + evidence.reason);
}

bool DynCorridor::try_transition(CorridorState to,
                                 std::optional<ContentDigest> evidence,
                                 std::optional<std::string> reason,
                                 std::string* err,
                                 CorridorError* code){
    if(!corridor_transition_allowed(state_, to)){
        const std::string m = std::string("invalid corridor transition: ") + corridor_state_name(state_)
                              + " -> " + corridor_state_name(to);
        CCHAIN_LOG_WARN(LogCategory::REGISTRY, "corridor " + id_.str() + ": " + m);
        if(err) *err = m;
        if(code) *code = CorridorError::INVALID_TRANSITION;
        return false;
    }
    log_.push_back(TransitionRecord{state_, to, now(), std::move(evidence), std::move(reason)});
    CCHAIN_LOG_INFO(LogCategory::REGISTRY, "corridor " + id_.str() + ": " + corridor_state_name(state_)
                    + " -> " + corridor_state_name(to));
    state_ = to;
    return true;
}

JNode DynCorridor::to_json() const {
    JArray log;
    log.reserve(log_.size());
    for(const auto& t : log_) log.push_back(t.to_json());
    JObject o;
    o["id"] = jstr(id_.str());
    o["jurisdiction_a"] = jstr(jurisdiction_a_);
    o["jurisdiction_b"] = jstr(jurisdiction_b_);
    o["created_at"] = jstr(format_utc(created_at_));
    o["state"] = jstr(corridor_state_name(state_));
    o["transition_log"] = jarr(std::move(log));
    return jobj(std::move(o));
}

} // namespace cchain
