#include "receipt_chain.h"
#include "log.h"
#include "util.h"

namespace cchain {

const char* chain_error_name(ChainError e){
    switch(e){
        case ChainError::NONE: return "none";
        case ChainError::SEQUENCE_MISMATCH: return "sequence_mismatch";
        case ChainError::PREV_ROOT_MISMATCH: return "prev_root_mismatch";
        case ChainError::INVALID_TIMESTAMP: return "invalid_timestamp";
        case ChainError::NEXT_ROOT_MISMATCH: return "next_root_mismatch";
        case ChainError::CANONICALIZATION: return "canonicalization";
        case ChainError::MMR: return "mmr";
        case ChainError::EMPTY_CHAIN: return "empty_chain";
        case ChainError::PROOF_FAILED: return "proof_failed";
        case ChainError::CORRIDOR_NOT_ACTIVE: return "corridor_not_active";
        case ChainError::CHECKPOINT_MISMATCH: return "checkpoint_mismatch";
    }
    return "unknown";
}

ReceiptChain::ReceiptChain(CorridorId corridor_id, ContentDigest genesis_root, ChainOptions opts)
    : corridor_id_(std::move(corridor_id)),
      genesis_root_(genesis_root),
      final_state_root_(genesis_root),
      opts_(opts) {}

bool ReceiptChain::reject(ChainError c, const std::string& msg, std::string* err, ChainError* code) const {
    CCHAIN_LOG_WARN(LogCategory::CHAIN, "corridor " + corridor_id_.str() + ": append rejected ("
                    + chain_error_name(c) + "): " + msg);
    if(err) *err = msg;
    if(code) *code = c;
    return false;
}

bool ReceiptChain::append(const Receipt& r, std::string* err, ChainError* code){
    const uint64_t h = height();
    if(r.sequence != h){
        return reject(ChainError::SEQUENCE_MISMATCH,
                      "sequence mismatch: expected " + std::to_string(h) + ", got " + std::to_string(r.sequence),
                      err, code);
    }

    const std::string cur = final_state_root_hex();
    if(r.prev_root != cur){
        return reject(ChainError::PREV_ROOT_MISMATCH,
                      "prev_root mismatch: expected " + cur + ", got " + r.prev_root, err, code);
    }

    if(!rfc3339_representable(r.timestamp)){
        return reject(ChainError::INVALID_TIMESTAMP,
                      "timestamp " + std::to_string(r.timestamp) + " outside RFC 3339 year range", err, code);
    }

    std::string c_err;
    CanonError c_code = CanonError::NONE;
    auto seal = r.content_digest(&c_err, &c_code);
    if(!seal){
        return reject(ChainError::CANONICALIZATION,
                      std::string("receipt content not canonicalizable (") + canon_error_name(c_code) + "): " + c_err,
                      err, code);
    }
    if(r.next_root != seal->hex()){
        return reject(ChainError::NEXT_ROOT_MISMATCH,
                      "next_root mismatch: expected " + seal->hex() + ", got " + r.next_root, err, code);
    }

    // The seal is well-formed hex by construction, so the MMR append cannot
    // fail here; check anyway so the invariant is enforced in one place.
    std::string m_err;
    if(!mmr_.append(seal->hex(), &m_err)){
        return reject(ChainError::MMR, m_err, err, code);
    }
    final_state_root_ = *seal;
    receipts_.push_back(r);

    CCHAIN_LOG_DEBUG(LogCategory::CHAIN, "corridor " + corridor_id_.str() + ": appended seq "
                     + std::to_string(h) + " next_root " + seal->hex());

    if(opts_.checkpoint_interval > 0 && height() % opts_.checkpoint_interval == 0){
        std::string cp_err;
        if(!create_checkpoint(&cp_err)){
            CCHAIN_LOG_ERROR(LogCategory::CHAIN, "auto checkpoint at height " + std::to_string(height())
                             + " failed: " + cp_err);
        }
    }
    return true;
}

std::optional<Checkpoint> ReceiptChain::create_checkpoint(std::string* err, ChainError* code){
    const uint64_t h = height();
    const std::string root = mmr_root();
    std::string d_err;
    auto d = Checkpoint::compute_digest(h, root, &d_err);
    if(!d){
        if(err) *err = "checkpoint digest: " + d_err;
        if(code) *code = ChainError::CANONICALIZATION;
        return std::nullopt;
    }

    Checkpoint cp{h, root, *d, corridor_id_, genesis_root_.hex(), final_state_root_hex(), mmr_.peaks(), now()};
    checkpoints_.push_back(cp);
    CCHAIN_LOG_INFO(LogCategory::CHAIN, "corridor " + corridor_id_.str() + ": checkpoint at height "
                    + std::to_string(h) + " " + d->to_string());
    return cp;
}

bool ReceiptChain::build_inclusion_proof(uint64_t sequence, MmrInclusionProof& out,
                                         std::string* err, ChainError* code) const {
    if(receipts_.empty()){
        if(err) *err = "chain is empty";
        if(code) *code = ChainError::EMPTY_CHAIN;
        return false;
    }
    std::string m_err;
    if(!mmr_.build_inclusion_proof(sequence, out, &m_err)){
        if(err) *err = m_err;
        if(code) *code = ChainError::MMR;
        return false;
    }
    return true;
}

bool ReceiptChain::verify_inclusion_proof(const MmrInclusionProof& proof) const {
    return mmr_.verify_inclusion_proof(proof);
}

std::optional<ReceiptChain> ReceiptChain::restore(const CorridorId& corridor_id,
                                                  const ContentDigest& genesis_root,
                                                  const std::vector<Receipt>& receipts,
                                                  ChainOptions opts,
                                                  std::string* err,
                                                  ChainError* code){
    // Replay without auto checkpoints; persisted checkpoints are restored by
    // the caller (from_json), not re-created with fresh timestamps.
    ReceiptChain chain(corridor_id, genesis_root, ChainOptions{});
    for(const auto& r : receipts){
        std::string e;
        ChainError c = ChainError::NONE;
        if(!chain.append(r, &e, &c)){
            CCHAIN_LOG_WARN(LogCategory::CHAIN, "restore of corridor " + corridor_id.str()
                            + " aborted at receipt " + std::to_string(chain.height()));
            if(err) *err = "receipt " + std::to_string(chain.height()) + ": " + e;
            if(code) *code = c;
            return std::nullopt;
        }
    }
    chain.opts_ = opts;
    return chain;
}

JNode ReceiptChain::to_json() const {
    JArray rs;
    rs.reserve(receipts_.size());
    for(const auto& r : receipts_) rs.push_back(r.to_json());
    JArray cps;
    cps.reserve(checkpoints_.size());
    for(const auto& c : checkpoints_) cps.push_back(c.to_json());

    JObject o;
    o["corridor_id"] = jstr(corridor_id_.str());
    o["genesis_root"] = jstr(genesis_root_.hex());
    o["receipts"] = jarr(std::move(rs));
    o["checkpoints"] = jarr(std::move(cps));
    return jobj(std::move(o));
}

std::optional<ReceiptChain> ReceiptChain::from_json(const JNode& n, ChainOptions opts,
                                                    std::string* err, ChainError* code){
    auto fail = [&](const std::string& m) -> std::optional<ReceiptChain> {
        CCHAIN_LOG_WARN(LogCategory::CHAIN, "chain load failed: " + m);
        if(err) *err = m;
        return std::nullopt;
    };
    auto mismatch = [&](const std::string& m) -> std::optional<ReceiptChain> {
        if(code) *code = ChainError::CHECKPOINT_MISMATCH;
        return fail(m);
    };
    const JObject* o = as_object(n);
    if(!o) return fail("chain: not an object");

    std::string cid, genesis;
    if(!get_string(*o, "corridor_id", cid)) return fail("chain: missing corridor_id");
    if(!get_string(*o, "genesis_root", genesis)) return fail("chain: missing genesis_root");
    auto id = CorridorId::parse(cid);
    if(!id) return fail("chain: invalid corridor_id");
    auto groot = ContentDigest::from_hex(genesis);
    if(!groot) return fail("chain: invalid genesis_root");

    const JNode* rn = get_field(*o, "receipts");
    const JArray* ra = rn ? as_array(*rn) : nullptr;
    if(!ra) return fail("chain: missing receipts");
    std::vector<Receipt> receipts;
    receipts.reserve(ra->size());
    for(const auto& e : *ra){
        std::string r_err;
        auto r = Receipt::from_json(e, &r_err);
        if(!r) return fail(r_err);
        receipts.push_back(std::move(*r));
    }

    auto chain = restore(*id, *groot, receipts, opts, err, code);
    if(!chain) return std::nullopt;

    const JNode* cn = get_field(*o, "checkpoints");
    const JArray* ca = cn ? as_array(*cn) : nullptr;
    if(!ca) return fail("chain: missing checkpoints");
    const auto leaves = chain->mmr_.leaves();
    for(const auto& e : *ca){
        std::string c_err;
        auto cp = Checkpoint::from_json(e, &c_err);
        if(!cp) return fail(c_err);
        if(cp->corridor_id != *id) return mismatch("checkpoint belongs to corridor " + cp->corridor_id.str());
        if(cp->height > chain->height()){
            return mismatch("checkpoint height " + std::to_string(cp->height) + " beyond chain height "
                            + std::to_string(chain->height()));
        }
        const std::string at = "checkpoint at height " + std::to_string(cp->height);
        std::vector<std::string> prefix(leaves.begin(), leaves.begin() + (ptrdiff_t)cp->height);
        std::string root;
        std::vector<MmrPeak> peaks;
        if(!mmr_root_from_leaves(prefix, root, &peaks, &c_err)) return fail(c_err);
        if(root != cp->mmr_root){
            return mismatch(at + " root mismatch: expected " + root + ", got " + cp->mmr_root);
        }
        if(cp->genesis_root != groot->hex()){
            return mismatch(at + " genesis_root mismatch: expected " + groot->hex() + ", got " + cp->genesis_root);
        }
        const std::string final_root = cp->height == 0 ? groot->hex() : prefix.back();
        if(cp->final_state_root != final_root){
            return mismatch(at + " final_state_root mismatch: expected " + final_root + ", got "
                            + cp->final_state_root);
        }
        if(cp->peaks != peaks) return mismatch(at + " peaks do not match the receipt prefix");
        chain->checkpoints_.push_back(std::move(*cp));
    }
    return chain;
}

} // namespace cchain
