#include "mmr.h"
#include "hex.h"
#include "log.h"

namespace cchain {

namespace {

struct PlanEntry {
    uint32_t height;
    uint64_t start;   // first leaf index covered by this mountain
};

// Mountains for `size` leaves, tallest first, from the set bits of `size`.
std::vector<PlanEntry> peak_plan(uint64_t size){
    std::vector<PlanEntry> plan;
    uint64_t start = 0;
    for(int h = 63; h >= 0; --h){
        uint64_t span = 1ull << h;
        if(size & span){
            plan.push_back({(uint32_t)h, start});
            start += span;
        }
    }
    return plan;
}

bool normalize_leaf(const std::string& in, Hash256& out, std::string* err, MmrError* code){
    if(!hex_to_hash(in, out)){
        if(err) *err = "malformed mmr leaf (want 64 hex chars, got " + std::to_string(in.size()) + ")";
        if(code) *code = MmrError::MALFORMED_LEAF;
        return false;
    }
    return true;
}

}

const char* mmr_error_name(MmrError e){
    switch(e){
        case MmrError::NONE: return "none";
        case MmrError::MALFORMED_LEAF: return "malformed_leaf";
        case MmrError::INDEX_OUT_OF_RANGE: return "index_out_of_range";
        case MmrError::EMPTY: return "empty";
    }
    return "unknown";
}

Hash256 mmr_leaf_hash(const Hash256& leaf_digest){
    Sha256 h;
    h.write_byte(0x00).write(leaf_digest);
    return h.finalize();
}

Hash256 mmr_node_hash(const Hash256& left, const Hash256& right){
    Sha256 h;
    h.write_byte(0x01).write(left).write(right);
    return h.finalize();
}

bool mmr_bag_peaks(const std::vector<MmrPeak>& peaks, std::string& root){
    if(peaks.empty()){ root.clear(); return true; }
    Hash256 bag{};
    if(!hex_to_hash(peaks.back().hash, bag)) return false;
    for(size_t i = peaks.size() - 1; i-- > 0; ){
        Hash256 p{};
        if(!hex_to_hash(peaks[i].hash, p)) return false;
        bag = mmr_node_hash(p, bag);
    }
    root = to_hex(bag);
    return true;
}

bool mmr_root_from_leaves(const std::vector<std::string>& leaves_hex,
                          std::string& root,
                          std::vector<MmrPeak>* peaks,
                          std::string* err){
    std::vector<Hash256> level;
    level.reserve(leaves_hex.size());
    for(const auto& l : leaves_hex){
        Hash256 d{};
        if(!normalize_leaf(l, d, err, nullptr)) return false;
        level.push_back(mmr_leaf_hash(d));
    }

    // Each mountain is a perfect tree over a contiguous run of leaves.
    std::vector<MmrPeak> out;
    for(const auto& m : peak_plan(level.size())){
        std::vector<Hash256> row(level.begin() + (ptrdiff_t)m.start,
                                 level.begin() + (ptrdiff_t)(m.start + (1ull << m.height)));
        while(row.size() > 1){
            std::vector<Hash256> up;
            up.reserve(row.size() / 2);
            for(size_t i = 0; i + 1 < row.size(); i += 2) up.push_back(mmr_node_hash(row[i], row[i + 1]));
            row.swap(up);
        }
        out.push_back({m.height, to_hex(row[0])});
    }

    if(!mmr_bag_peaks(out, root)) return false;
    if(peaks) *peaks = std::move(out);
    return true;
}

bool mmr_verify_inclusion_proof(const MmrInclusionProof& proof){
    if(proof.size == 0 || proof.leaf_index >= proof.size) return false;

    Hash256 leaf{};
    if(!hex_to_hash(proof.leaf_digest, leaf)) return false;
    Hash256 cur = mmr_leaf_hash(leaf);
    if(to_hex(cur) != to_lower_ascii(proof.leaf_hash)) return false;

    auto plan = peak_plan(proof.size);
    if(proof.peaks.size() != plan.size()) return false;
    for(size_t i = 0; i < plan.size(); ++i){
        if(proof.peaks[i].height != plan[i].height) return false;
    }
    if(proof.peak_index >= plan.size()) return false;
    const PlanEntry& m = plan[(size_t)proof.peak_index];
    if(m.height != proof.peak_height) return false;
    if(proof.leaf_index < m.start || proof.leaf_index - m.start >= (1ull << m.height)) return false;
    if(proof.path.size() != m.height) return false;

    uint64_t local = proof.leaf_index - m.start;
    for(const auto& step : proof.path){
        Hash256 sib{};
        if(!hex_to_hash(step.hash, sib)) return false;
        bool sibling_left = (local & 1) != 0;
        if(sibling_left != (step.side == PathSide::LEFT)) return false;
        cur = sibling_left ? mmr_node_hash(sib, cur) : mmr_node_hash(cur, sib);
        local >>= 1;
    }

    if(to_hex(cur) != to_lower_ascii(proof.peaks[(size_t)proof.peak_index].hash)) return false;

    std::vector<MmrPeak> peaks = proof.peaks;
    peaks[(size_t)proof.peak_index].hash = to_hex(cur);
    std::string root;
    if(!mmr_bag_peaks(peaks, root)) return false;
    return !root.empty() && root == to_lower_ascii(proof.root);
}

JNode mmr_proof_to_json(const MmrInclusionProof& p){
    JArray path;
    for(const auto& s : p.path){
        path.push_back(jobj({{"side", jstr(s.side == PathSide::LEFT ? "left" : "right")},
                             {"hash", jstr(s.hash)}}));
    }
    JArray peaks;
    for(const auto& pk : p.peaks){
        peaks.push_back(jobj({{"height", juint(pk.height)}, {"hash", jstr(pk.hash)}}));
    }
    JObject o;
    o["size"] = juint(p.size);
    o["root"] = jstr(p.root);
    o["leaf_index"] = juint(p.leaf_index);
    o["receipt_next_root"] = jstr(p.leaf_digest);
    o["leaf_hash"] = jstr(p.leaf_hash);
    o["peak_index"] = juint(p.peak_index);
    o["peak_height"] = juint(p.peak_height);
    o["path"] = jarr(std::move(path));
    o["peaks"] = jarr(std::move(peaks));
    return jobj(std::move(o));
}

bool mmr_proof_from_json(const JNode& n, MmrInclusionProof& out, std::string* err){
    auto fail = [&](const std::string& m){ if(err) *err = "mmr proof: " + m; return false; };
    const JObject* o = as_object(n);
    if(!o) return fail("not an object");

    MmrInclusionProof p;
    uint64_t ph = 0;
    if(!get_u64(*o, "size", p.size)) return fail("missing size");
    if(!get_string(*o, "root", p.root)) return fail("missing root");
    if(!get_u64(*o, "leaf_index", p.leaf_index)) return fail("missing leaf_index");
    if(!get_string(*o, "receipt_next_root", p.leaf_digest)) return fail("missing receipt_next_root");
    if(!get_string(*o, "leaf_hash", p.leaf_hash)) return fail("missing leaf_hash");
    if(!get_u64(*o, "peak_index", p.peak_index)) return fail("missing peak_index");
    if(!get_u64(*o, "peak_height", ph) || ph > 63) return fail("bad peak_height");
    p.peak_height = (uint32_t)ph;

    const JNode* pn = get_field(*o, "path");
    const JArray* path = pn ? as_array(*pn) : nullptr;
    if(!path) return fail("missing path");
    for(const auto& e : *path){
        const JObject* so = as_object(e);
        if(!so) return fail("path step not an object");
        std::string side;
        MmrPathStep step;
        if(!get_string(*so, "side", side) || !get_string(*so, "hash", step.hash)) return fail("bad path step");
        if(side == "left") step.side = PathSide::LEFT;
        else if(side == "right") step.side = PathSide::RIGHT;
        else return fail("bad path side '" + side + "'");
        p.path.push_back(std::move(step));
    }

    const JNode* kn = get_field(*o, "peaks");
    const JArray* peaks = kn ? as_array(*kn) : nullptr;
    if(!peaks) return fail("missing peaks");
    for(const auto& e : *peaks){
        const JObject* po = as_object(e);
        uint64_t h = 0;
        MmrPeak pk;
        if(!po || !get_u64(*po, "height", h) || h > 63 || !get_string(*po, "hash", pk.hash)) return fail("bad peak");
        pk.height = (uint32_t)h;
        p.peaks.push_back(std::move(pk));
    }

    out = std::move(p);
    return true;
}

// ---------------------------------------------------------------------------

bool MerkleMountainRange::append(const std::string& leaf_hex, std::string* err, MmrError* code){
    Hash256 d{};
    std::string e;
    if(!normalize_leaf(leaf_hex, d, &e, code)){
        CCHAIN_LOG_WARN(LogCategory::MMR, "append rejected: " + e);
        if(err) *err = e;
        return false;
    }

    Peak cur{0, mmr_leaf_hash(d)};
    leaf_digests_.push_back(d);
    leaf_hashes_.push_back(cur.hash);
    while(!peak_stack_.empty() && peak_stack_.back().height == cur.height){
        cur.hash = mmr_node_hash(peak_stack_.back().hash, cur.hash);
        cur.height += 1;
        peak_stack_.pop_back();
    }
    peak_stack_.push_back(cur);
    return true;
}

std::vector<MmrPeak> MerkleMountainRange::peaks() const {
    std::vector<MmrPeak> out;
    out.reserve(peak_stack_.size());
    for(const auto& p : peak_stack_) out.push_back({p.height, to_hex(p.hash)});
    return out;
}

std::string MerkleMountainRange::root() const {
    if(peak_stack_.empty()) return std::string();
    Hash256 bag = peak_stack_.back().hash;
    for(size_t i = peak_stack_.size() - 1; i-- > 0; ){
        bag = mmr_node_hash(peak_stack_[i].hash, bag);
    }
    return to_hex(bag);
}

std::vector<std::string> MerkleMountainRange::leaves() const {
    std::vector<std::string> out;
    out.reserve(leaf_digests_.size());
    for(const auto& d : leaf_digests_) out.push_back(to_hex(d));
    return out;
}

bool MerkleMountainRange::build_inclusion_proof(uint64_t index, MmrInclusionProof& out,
                                                std::string* err, MmrError* code) const {
    if(leaf_digests_.empty()){
        if(err) *err = "mmr is empty";
        if(code) *code = MmrError::EMPTY;
        return false;
    }
    if(index >= size()){
        if(err) *err = "leaf index " + std::to_string(index) + " out of range (size " + std::to_string(size()) + ")";
        if(code) *code = MmrError::INDEX_OUT_OF_RANGE;
        return false;
    }

    auto plan = peak_plan(size());
    size_t pi = 0;
    while(index >= plan[pi].start + (1ull << plan[pi].height)) ++pi;
    const PlanEntry& m = plan[pi];

    MmrInclusionProof p;
    p.size = size();
    p.root = root();
    p.leaf_index = index;
    p.leaf_digest = to_hex(leaf_digests_[(size_t)index]);
    p.leaf_hash = to_hex(leaf_hashes_[(size_t)index]);
    p.peak_index = pi;
    p.peak_height = m.height;
    p.peaks = peaks();

    std::vector<Hash256> row(leaf_hashes_.begin() + (ptrdiff_t)m.start,
                             leaf_hashes_.begin() + (ptrdiff_t)(m.start + (1ull << m.height)));
    uint64_t local = index - m.start;
    while(row.size() > 1){
        uint64_t sib = local ^ 1;
        p.path.push_back({(sib < local) ? PathSide::LEFT : PathSide::RIGHT, to_hex(row[(size_t)sib])});
        std::vector<Hash256> up;
        up.reserve(row.size() / 2);
        for(size_t i = 0; i + 1 < row.size(); i += 2) up.push_back(mmr_node_hash(row[i], row[i + 1]));
        row.swap(up);
        local >>= 1;
    }

    out = std::move(p);
    return true;
}

bool MerkleMountainRange::verify_inclusion_proof(const MmrInclusionProof& proof) const {
    if(to_lower_ascii(proof.root) != root()) return false;
    return mmr_verify_inclusion_proof(proof);
}

std::optional<MerkleMountainRange> MerkleMountainRange::from_leaves(const std::vector<std::string>& leaves_hex,
                                                                    std::string* err){
    MerkleMountainRange m;
    for(size_t i = 0; i < leaves_hex.size(); ++i){
        std::string e;
        if(!m.append(leaves_hex[i], &e)){
            if(err) *err = "leaf " + std::to_string(i) + ": " + e;
            return std::nullopt;
        }
    }
    return m;
}

} // namespace cchain
