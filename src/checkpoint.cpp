#include "checkpoint.h"
#include "constants.h"
#include "util.h"

namespace cchain {

std::optional<ContentDigest> Checkpoint::compute_digest(uint64_t height, const std::string& mmr_root,
                                                        std::string* err){
    JObject o;
    o["height"] = juint(height);
    o["mmr_root"] = jstr(mmr_root);
    return digest_value(jobj(std::move(o)), err);
}

bool Checkpoint::verify_digest() const {
    auto d = compute_digest(height, mmr_root);
    return d && *d == checkpoint_digest;
}

JNode Checkpoint::to_json() const {
    JArray pk;
    for(const auto& p : peaks){
        pk.push_back(jobj({{"height", juint(p.height)}, {"hash", jstr(p.hash)}}));
    }
    JObject o;
    o["type"] = jstr(CHECKPOINT_TYPE);
    o["height"] = juint(height);
    o["mmr_root"] = jstr(mmr_root);
    o["checkpoint_digest"] = jstr(checkpoint_digest.to_string());
    o["corridor_id"] = jstr(corridor_id.str());
    o["genesis_root"] = jstr(genesis_root);
    o["final_state_root"] = jstr(final_state_root);
    o["peaks"] = jarr(std::move(pk));
    o["timestamp"] = jstr(format_utc(timestamp));
    return jobj(std::move(o));
}

std::optional<Checkpoint> Checkpoint::from_json(const JNode& n, std::string* err){
    auto fail = [&](const std::string& m) -> std::optional<Checkpoint> {
        if(err) *err = "checkpoint: " + m;
        return std::nullopt;
    };
    const JObject* o = as_object(n);
    if(!o) return fail("not an object");

    std::string type, cid, dg, ts;
    uint64_t height = 0;
    std::string root, genesis, final_root;
    if(!get_string(*o, "type", type) || type != CHECKPOINT_TYPE) return fail("wrong type");
    if(!get_u64(*o, "height", height)) return fail("missing height");
    if(!get_string(*o, "mmr_root", root)) return fail("missing mmr_root");
    if(!get_string(*o, "checkpoint_digest", dg)) return fail("missing checkpoint_digest");
    if(!get_string(*o, "corridor_id", cid)) return fail("missing corridor_id");
    if(!get_string(*o, "genesis_root", genesis)) return fail("missing genesis_root");
    if(!get_string(*o, "final_state_root", final_root)) return fail("missing final_state_root");
    if(!get_string(*o, "timestamp", ts)) return fail("missing timestamp");

    auto id = CorridorId::parse(cid);
    if(!id) return fail("invalid corridor_id");
    auto stored = ContentDigest::from_hex(dg);
    if(!stored) return fail("invalid checkpoint_digest");
    int64_t t = 0;
    if(!parse_rfc3339(ts, t)) return fail("invalid timestamp");

    std::vector<MmrPeak> peaks;
    const JNode* pn = get_field(*o, "peaks");
    const JArray* pa = pn ? as_array(*pn) : nullptr;
    if(!pa) return fail("missing peaks");
    for(const auto& e : *pa){
        const JObject* po = as_object(e);
        uint64_t h = 0;
        MmrPeak p;
        if(!po || !get_u64(*po, "height", h) || h > 63 || !get_string(*po, "hash", p.hash)) return fail("bad peak");
        p.height = (uint32_t)h;
        peaks.push_back(std::move(p));
    }

    std::string d_err;
    auto expect = compute_digest(height, root, &d_err);
    if(!expect) return fail(d_err);
    if(*expect != *stored){
        return fail("digest mismatch (expected " + expect->hex() + ", got " + stored->hex() + ")");
    }

    return Checkpoint{height, root, *stored, *id, genesis, final_root, std::move(peaks), t};
}

} // namespace cchain
