#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "corridor_id.h"
#include "digest.h"
#include "json.h"
#include "util.h"

namespace cchain {

// Corridor lifecycle:
//
//   DRAFT -> PENDING -> ACTIVE <-> SUSPENDED
//                         |
//                         v
//                       HALTED -> DEPRECATED
//
// Receipts are only accepted while a corridor is ACTIVE. DEPRECATED is
// terminal.
enum class CorridorState {
    DRAFT,
    PENDING,
    ACTIVE,
    HALTED,
    SUSPENDED,
    DEPRECATED,
};

const char* corridor_state_name(CorridorState s);
bool corridor_state_from_string(const std::string& s, CorridorState& out);
bool corridor_state_is_terminal(CorridorState s);
bool corridor_transition_allowed(CorridorState from, CorridorState to);

enum class CorridorError {
    NONE = 0,
    INVALID_TRANSITION,
};

const char* corridor_error_name(CorridorError e);

// State tags for Corridor<S>
struct Draft      { static constexpr CorridorState STATE = CorridorState::DRAFT; };
struct Pending    { static constexpr CorridorState STATE = CorridorState::PENDING; };
struct Active     { static constexpr CorridorState STATE = CorridorState::ACTIVE; };
struct Halted     { static constexpr CorridorState STATE = CorridorState::HALTED; };
struct Suspended  { static constexpr CorridorState STATE = CorridorState::SUSPENDED; };
struct Deprecated { static constexpr CorridorState STATE = CorridorState::DEPRECATED; };

struct SubmissionEvidence {
    ContentDigest        bilateral_agreement_digest;
    ContentDigest        pack_trilogy_digest;
    std::vector<uint8_t> submitter_attestation;
};

struct ActivationEvidence {
    ContentDigest        regulatory_approval_a;
    ContentDigest        regulatory_approval_b;
    std::vector<uint8_t> watcher_quorum_attestation;
};

struct HaltReason {
    std::string   reason;
    std::string   authority;      // jurisdiction ordering the halt
    ContentDigest evidence;
};

struct SuspendReason {
    std::string            reason;
    std::optional<int64_t> expected_resume;   // unix seconds
};

struct ResumeEvidence {
    ContentDigest resolution_attestation;
};

struct DeprecationEvidence {
    std::string                  reason;
    std::optional<ContentDigest> migration_plan_digest;
};

struct TransitionRecord {
    CorridorState                from;
    CorridorState                to;
    int64_t                      timestamp{0};   // unix seconds
    std::optional<ContentDigest> evidence_digest;
    std::optional<std::string>   reason;

    JNode to_json() const;
};

class DynCorridor;

// A corridor whose state is part of its type. Only the transitions drawn
// above exist as functions, so an invalid one does not compile. Transitions
// consume the corridor and return it in the new state.
template<class S>
class Corridor {
public:
    const CorridorId&  id() const { return id_; }
    const std::string& jurisdiction_a() const { return jurisdiction_a_; }
    const std::string& jurisdiction_b() const { return jurisdiction_b_; }
    int64_t            created_at() const { return created_at_; }

    static constexpr CorridorState state() { return S::STATE; }
    const char* state_name() const { return corridor_state_name(S::STATE); }
    bool is_terminal() const { return corridor_state_is_terminal(S::STATE); }

    const std::vector<TransitionRecord>& transition_log() const { return log_; }
    size_t transition_count() const { return log_.size(); }

private:
    Corridor(CorridorId id, std::string a, std::string b, int64_t created_at,
             std::vector<TransitionRecord> log)
        : id_(std::move(id)), jurisdiction_a_(std::move(a)), jurisdiction_b_(std::move(b)),
          created_at_(created_at), log_(std::move(log)) {}

    template<class T>
    Corridor<T> move_to(std::optional<ContentDigest> evidence, std::string reason){
        log_.push_back(TransitionRecord{S::STATE, T::STATE, now(), std::move(evidence), std::move(reason)});
        return Corridor<T>(std::move(id_), std::move(jurisdiction_a_), std::move(jurisdiction_b_),
                           created_at_, std::move(log_));
    }

    template<class> friend class Corridor;
    friend class DynCorridor;
    friend Corridor<Draft> new_corridor(CorridorId, std::string, std::string);
    friend Corridor<Pending> submit(Corridor<Draft>, const SubmissionEvidence&);
    friend Corridor<Active> activate(Corridor<Pending>, const ActivationEvidence&);
    friend Corridor<Halted> halt(Corridor<Active>, const HaltReason&);
    friend Corridor<Suspended> suspend(Corridor<Active>, const SuspendReason&);
    friend Corridor<Active> resume(Corridor<Suspended>, const ResumeEvidence&);
    friend Corridor<Deprecated> deprecate(Corridor<Halted>, const DeprecationEvidence&);

    CorridorId                    id_;
    std::string                   jurisdiction_a_;
    std::string                   jurisdiction_b_;
    int64_t                       created_at_;
    std::vector<TransitionRecord> log_;
};

Corridor<Draft> new_corridor(CorridorId id, std::string jurisdiction_a, std::string jurisdiction_b);
Corridor<Pending> submit(Corridor<Draft> c, const SubmissionEvidence& evidence);
Corridor<Active> activate(Corridor<Pending> c, const ActivationEvidence& evidence);
Corridor<Halted> halt(Corridor<Active> c, const HaltReason& reason);
Corridor<Suspended> suspend(Corridor<Active> c, const SuspendReason& reason);
Corridor<Active> resume(Corridor<Suspended> c, const ResumeEvidence& evidence);
Corridor<Deprecated> deprecate(Corridor<Halted> c, const DeprecationEvidence& evidence);

// Runtime form of a corridor, for code that holds corridors in mixed states
// (the registry, persistence). Every transition is checked against the same
// table the typed form encodes.
class DynCorridor {
public:
    template<class S>
    explicit DynCorridor(Corridor<S> c)
        : id_(std::move(c.id_)), jurisdiction_a_(std::move(c.jurisdiction_a_)),
          jurisdiction_b_(std::move(c.jurisdiction_b_)), created_at_(c.created_at_),
          state_(S::STATE), log_(std::move(c.log_)) {}

    const CorridorId&  id() const { return id_; }
    const std::string& jurisdiction_a() const { return jurisdiction_a_; }
    const std::string& jurisdiction_b() const { return jurisdiction_b_; }
    int64_t            created_at() const { return created_at_; }
    CorridorState      state() const { return state_; }
    const char*        state_name() const { return corridor_state_name(state_); }
    bool               is_terminal() const { return corridor_state_is_terminal(state_); }
    const std::vector<TransitionRecord>& transition_log() const { return log_; }

    // Leaves the corridor untouched when the transition is not allowed.
    bool try_transition(CorridorState to,
                        std::optional<ContentDigest> evidence = std::nullopt,
                        std::optional<std::string> reason = std::nullopt,
                        std::string* err = nullptr,
                        CorridorError* code = nullptr);

    // {id, jurisdiction_a, jurisdiction_b, created_at, state, transition_log[]}
    JNode to_json() const;

private:
    CorridorId                    id_;
    std::string                   jurisdiction_a_;
    std::string                   jurisdiction_b_;
    int64_t                       created_at_;
    CorridorState                 state_;
    std::vector<TransitionRecord> log_;
};

} // namespace cchain
