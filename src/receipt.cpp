#include "receipt.h"
#include "util.h"

namespace cchain {

JNode DigestEntry::to_json() const {
    if(!artifact_type) return jstr(digest_sha256);
    JObject o;
    o["digest_sha256"] = jstr(digest_sha256);
    o["artifact_type"] = jstr(*artifact_type);
    if(uri) o["uri"] = jstr(*uri);
    return jobj(std::move(o));
}

bool DigestEntry::from_json(const JNode& n, DigestEntry& out, std::string* err){
    if(auto s = std::get_if<std::string>(&n.v)){
        out = DigestEntry::digest(*s);
        return true;
    }
    const JObject* o = as_object(n);
    if(!o){
        if(err) *err = "digest entry must be a string or an artifact reference";
        return false;
    }
    DigestEntry e;
    std::string type;
    if(!get_string(*o, "digest_sha256", e.digest_sha256) || !get_string(*o, "artifact_type", type)){
        if(err) *err = "artifact reference needs digest_sha256 and artifact_type";
        return false;
    }
    e.artifact_type = type;
    if(get_field(*o, "uri")){
        std::string u;
        if(!get_string(*o, "uri", u)){
            if(err) *err = "artifact reference uri must be a string";
            return false;
        }
        e.uri = u;
    }
    out = std::move(e);
    return true;
}

static JNode digest_set_json(const std::vector<DigestEntry>& set){
    JArray a;
    a.reserve(set.size());
    for(const auto& e : set) a.push_back(e.to_json());
    return jarr(std::move(a));
}

JNode Receipt::content_json() const {
    JObject o;
    o["type"] = jstr(type);
    o["corridor_id"] = jstr(corridor_id.str());
    o["sequence"] = juint(sequence);
    o["timestamp"] = jstr(format_utc(timestamp));
    o["prev_root"] = jstr(prev_root);
    o["lawpack_digest_set"] = digest_set_json(lawpack_digest_set);
    o["ruleset_digest_set"] = digest_set_json(ruleset_digest_set);
    if(transition) o["transition"] = *transition;
    if(transition_type_registry_digest_sha256){
        o["transition_type_registry_digest_sha256"] = jstr(*transition_type_registry_digest_sha256);
    }
    return jobj(std::move(o));
}

JNode Receipt::to_json() const {
    JNode n = content_json();
    auto& o = std::get<JObject>(n.v);
    o["next_root"] = jstr(next_root);
    if(proof) o["proof"] = *proof;
    return n;
}

std::optional<ContentDigest> Receipt::content_digest(std::string* err, CanonError* code) const {
    // Outside this range the rendered timestamp cannot be parsed back, and a
    // sealed receipt would not survive its own persistence.
    if(!rfc3339_representable(timestamp)){
        if(err) *err = "timestamp " + std::to_string(timestamp) + " outside RFC 3339 year range 0000-9999";
        if(code) *code = CanonError::TIMESTAMP_RANGE;
        return std::nullopt;
    }
    return digest_value(content_json(), err, code);
}

std::optional<std::string> Receipt::compute_next_root(std::string* err, CanonError* code) const {
    auto d = content_digest(err, code);
    if(!d) return std::nullopt;
    return d->hex();
}

bool Receipt::seal_next_root(std::string* err, CanonError* code){
    auto nr = compute_next_root(err, code);
    if(!nr) return false;
    next_root = *nr;
    return true;
}

static bool digest_set_from_json(const JObject& o, const char* key,
                                 std::vector<DigestEntry>& out, std::string* err){
    const JNode* f = get_field(o, key);
    const JArray* a = f ? as_array(*f) : nullptr;
    if(!a){
        if(err) *err = std::string("missing or invalid ") + key;
        return false;
    }
    out.clear();
    for(const auto& n : *a){
        DigestEntry e;
        std::string e_err;
        if(!DigestEntry::from_json(n, e, &e_err)){
            if(err) *err = std::string(key) + ": " + e_err;
            return false;
        }
        out.push_back(std::move(e));
    }
    return true;
}

std::optional<Receipt> Receipt::from_json(const JNode& n, std::string* err){
    auto fail = [&](const std::string& m) -> std::optional<Receipt> {
        if(err) *err = "receipt: " + m;
        return std::nullopt;
    };
    const JObject* o = as_object(n);
    if(!o) return fail("not an object");

    std::string cid, ts;
    if(!get_string(*o, "corridor_id", cid)) return fail("missing corridor_id");
    auto id = CorridorId::parse(cid);
    if(!id) return fail("invalid corridor_id '" + cid + "'");

    Receipt r(*id);
    if(!get_string(*o, "type", r.type)) return fail("missing type");
    if(!get_u64(*o, "sequence", r.sequence)) return fail("missing sequence");
    if(!get_string(*o, "timestamp", ts)) return fail("missing timestamp");
    if(!parse_rfc3339(ts, r.timestamp)) return fail("invalid timestamp '" + ts + "'");
    if(!get_string(*o, "prev_root", r.prev_root)) return fail("missing prev_root");
    if(!get_string(*o, "next_root", r.next_root)) return fail("missing next_root");

    std::string e;
    if(!digest_set_from_json(*o, "lawpack_digest_set", r.lawpack_digest_set, &e)) return fail(e);
    if(!digest_set_from_json(*o, "ruleset_digest_set", r.ruleset_digest_set, &e)) return fail(e);

    if(const JNode* t = get_field(*o, "transition")) r.transition = *t;
    if(get_field(*o, "transition_type_registry_digest_sha256")){
        std::string d;
        if(!get_string(*o, "transition_type_registry_digest_sha256", d)){
            return fail("transition_type_registry_digest_sha256 must be a string");
        }
        r.transition_type_registry_digest_sha256 = d;
    }
    if(const JNode* p = get_field(*o, "proof")) r.proof = *p;
    return r;
}

} // namespace cchain
