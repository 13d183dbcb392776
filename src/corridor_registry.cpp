#include "corridor_registry.h"
#include "log.h"

namespace cchain {

CorridorRegistry::CorridorRegistry(ChainOptions opts) : opts_(opts) {}

std::shared_ptr<CorridorRegistry::Slot> CorridorRegistry::find(const CorridorId& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = slots_.find(id);
    if(it == slots_.end()) return nullptr;
    return it->second;
}

bool CorridorRegistry::insert(DynCorridor corridor, ReceiptChain chain, std::string* err){
    const CorridorId id = chain.corridor_id();
    if(corridor.id() != id){
        if(err) *err = "lifecycle for " + corridor.id().str() + " does not match chain " + id.str();
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    if(slots_.count(id)){
        if(err) *err = "corridor " + id.str() + " already exists";
        CCHAIN_LOG_WARN(LogCategory::REGISTRY, "duplicate corridor " + id.str());
        return false;
    }
    CCHAIN_LOG_INFO(LogCategory::REGISTRY, "corridor " + id.str() + " opened (" + corridor.state_name() + ")");
    slots_.emplace(id, std::make_shared<Slot>(std::move(corridor), std::move(chain)));
    return true;
}

bool CorridorRegistry::open_corridor(DynCorridor corridor, const ContentDigest& genesis_root, std::string* err){
    ReceiptChain chain(corridor.id(), genesis_root, opts_);
    return insert(std::move(corridor), std::move(chain), err);
}

std::optional<CorridorId> CorridorRegistry::establish(const std::string& jurisdiction_a,
                                                      const std::string& jurisdiction_b,
                                                      const ContentDigest& genesis_root, std::string* err){
    auto id = CorridorId::generate(err);
    if(!id) return std::nullopt;
    if(!open_corridor(DynCorridor(new_corridor(*id, jurisdiction_a, jurisdiction_b)), genesis_root, err)){
        return std::nullopt;
    }
    return id;
}

bool CorridorRegistry::adopt(DynCorridor corridor, ReceiptChain chain, std::string* err){
    return insert(std::move(corridor), std::move(chain), err);
}

bool CorridorRegistry::contains(const CorridorId& id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slots_.count(id) != 0;
}

size_t CorridorRegistry::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slots_.size();
}

std::vector<CorridorId> CorridorRegistry::corridors() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<CorridorId> out;
    out.reserve(slots_.size());
    for(const auto& kv : slots_) out.push_back(kv.first);
    return out;
}

static bool unknown_corridor(const CorridorId& id, std::string* err){
    if(err) *err = "unknown corridor " + id.str();
    return false;
}

bool CorridorRegistry::transition(const CorridorId& id, CorridorState to,
                                  std::optional<ContentDigest> evidence, std::optional<std::string> reason,
                                  std::string* err, CorridorError* code){
    auto s = find(id);
    if(!s) return unknown_corridor(id, err);
    std::unique_lock lock(s->mtx);
    return s->lifecycle.try_transition(to, std::move(evidence), std::move(reason), err, code);
}

std::optional<CorridorState> CorridorRegistry::state(const CorridorId& id) const {
    auto s = find(id);
    if(!s) return std::nullopt;
    std::shared_lock lock(s->mtx);
    return s->lifecycle.state();
}

std::optional<DynCorridor> CorridorRegistry::lifecycle(const CorridorId& id) const {
    auto s = find(id);
    if(!s) return std::nullopt;
    std::shared_lock lock(s->mtx);
    return s->lifecycle;
}

// Caller holds the slot lock.
static bool require_active(const DynCorridor& lc, std::string* err, ChainError* code){
    if(lc.state() == CorridorState::ACTIVE) return true;
    const std::string m = "corridor " + lc.id().str() + " is " + lc.state_name() + ", not ACTIVE";
    CCHAIN_LOG_WARN(LogCategory::REGISTRY, "append rejected: " + m);
    if(err) *err = m;
    if(code) *code = ChainError::CORRIDOR_NOT_ACTIVE;
    return false;
}

bool CorridorRegistry::append(const CorridorId& id, const Receipt& r, std::string* err, ChainError* code){
    auto s = find(id);
    if(!s) return unknown_corridor(id, err);
    std::unique_lock lock(s->mtx);
    if(!require_active(s->lifecycle, err, code)) return false;
    return s->chain.append(r, err, code);
}

bool CorridorRegistry::append_next(const CorridorId& id,
                                   const std::function<bool(const ReceiptChain&, Receipt&)>& build,
                                   std::string* err, ChainError* code){
    auto s = find(id);
    if(!s) return unknown_corridor(id, err);
    std::unique_lock lock(s->mtx);
    if(!require_active(s->lifecycle, err, code)) return false;
    Receipt r(id);
    if(!build(s->chain, r)){
        if(err) *err = "receipt builder aborted";
        return false;
    }
    return s->chain.append(r, err, code);
}

std::optional<Checkpoint> CorridorRegistry::create_checkpoint(const CorridorId& id, std::string* err, ChainError* code){
    auto s = find(id);
    if(!s){
        unknown_corridor(id, err);
        return std::nullopt;
    }
    std::unique_lock lock(s->mtx);
    return s->chain.create_checkpoint(err, code);
}

bool CorridorRegistry::read(const CorridorId& id, const std::function<void(const ReceiptChain&)>& fn) const {
    auto s = find(id);
    if(!s) return false;
    std::shared_lock lock(s->mtx);
    fn(s->chain);
    return true;
}

std::optional<uint64_t> CorridorRegistry::height(const CorridorId& id) const {
    std::optional<uint64_t> out;
    read(id, [&](const ReceiptChain& c){ out = c.height(); });
    return out;
}

std::optional<std::string> CorridorRegistry::mmr_root(const CorridorId& id) const {
    std::optional<std::string> out;
    read(id, [&](const ReceiptChain& c){ out = c.mmr_root(); });
    return out;
}

std::optional<std::string> CorridorRegistry::final_state_root_hex(const CorridorId& id) const {
    std::optional<std::string> out;
    read(id, [&](const ReceiptChain& c){ out = c.final_state_root_hex(); });
    return out;
}

bool CorridorRegistry::build_inclusion_proof(const CorridorId& id, uint64_t sequence, MmrInclusionProof& out,
                                             std::string* err, ChainError* code) const {
    bool ok = false;
    if(!read(id, [&](const ReceiptChain& c){ ok = c.build_inclusion_proof(sequence, out, err, code); })){
        return unknown_corridor(id, err);
    }
    return ok;
}

bool CorridorRegistry::verify_inclusion_proof(const CorridorId& id, const MmrInclusionProof& proof) const {
    bool ok = false;
    read(id, [&](const ReceiptChain& c){ ok = c.verify_inclusion_proof(proof); });
    return ok;
}

} // namespace cchain
