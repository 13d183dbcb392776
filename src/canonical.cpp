#include "canonical.h"
#include "log.h"
#include "util.h"
#include <cmath>
#include <cstdio>

namespace cchain {

const char* canon_error_name(CanonError e){
    switch(e){
        case CanonError::NONE: return "none";
        case CanonError::FLOAT_REJECTED: return "float_rejected";
        case CanonError::DEPTH_EXCEEDED: return "depth_exceeded";
        case CanonError::INVALID_UTF8: return "invalid_utf8";
        case CanonError::TIMESTAMP_RANGE: return "timestamp_range";
    }
    return "unknown";
}

namespace {

struct Writer {
    std::string out;
    CanonError code = CanonError::NONE;
    std::string err;

    bool fail(CanonError c, const std::string& msg){
        code = c;
        err = msg;
        return false;
    }

    bool write_double(double d){
        char buf[40];
        std::snprintf(buf, sizeof(buf), "%.17g", d);
        if(!std::isfinite(d) || std::trunc(d) != d)
            return fail(CanonError::FLOAT_REJECTED, std::string("float value rejected: ") + buf);
        // 2^63 and 2^64 are exact doubles, so these bounds are exact too
        if(d >= -9223372036854775808.0 && d < 9223372036854775808.0){
            out += std::to_string((int64_t)d);
            return true;
        }
        if(d >= 0.0 && d < 18446744073709551616.0){
            out += std::to_string((uint64_t)d);
            return true;
        }
        return fail(CanonError::FLOAT_REJECTED, std::string("float value outside integer range: ") + buf);
    }

    bool check_utf8(const std::string& s, const char* what){
        size_t bad = 0;
        if(utf8_valid(s, &bad)) return true;
        return fail(CanonError::INVALID_UTF8,
                    std::string(what) + " is not valid UTF-8 (byte " + std::to_string(bad) + ")");
    }

    bool write_string(const std::string& s){
        if(!check_utf8(s, "string")) return false;
        int64_t t;
        if(parse_rfc3339(s, t)){
            json_escape(format_utc(t), out);
        } else {
            json_escape(s, out);
        }
        return true;
    }

    bool write(const JNode& n, size_t depth){
        if(std::holds_alternative<JNull>(n.v)){ out += "null"; return true; }
        if(auto b = std::get_if<bool>(&n.v)){ out += (*b ? "true" : "false"); return true; }
        if(auto i = std::get_if<int64_t>(&n.v)){ out += std::to_string(*i); return true; }
        if(auto u = std::get_if<uint64_t>(&n.v)){ out += std::to_string(*u); return true; }
        if(auto d = std::get_if<double>(&n.v)) return write_double(*d);
        if(auto s = std::get_if<std::string>(&n.v)) return write_string(*s);

        if(depth >= CANON_MAX_DEPTH)
            return fail(CanonError::DEPTH_EXCEEDED, "nesting deeper than " + std::to_string(CANON_MAX_DEPTH));

        if(auto a = std::get_if<JArray>(&n.v)){
            out.push_back('[');
            for(size_t i = 0; i < a->size(); ++i){
                if(i) out.push_back(',');
                if(!write((*a)[i], depth + 1)) return false;
            }
            out.push_back(']');
            return true;
        }
        // std::map<std::string,...> iterates in char_traits<char> order,
        // which compares as unsigned bytes
        const auto& m = std::get<JObject>(n.v);
        out.push_back('{');
        size_t i = 0;
        for(const auto& kv : m){
            if(i++) out.push_back(',');
            if(!check_utf8(kv.first, "key")) return false;
            json_escape(kv.first, out);
            out.push_back(':');
            if(!write(kv.second, depth + 1)) return false;
        }
        out.push_back('}');
        return true;
    }
};

} // namespace

std::optional<CanonicalBytes> canonicalize(const JNode& value, std::string* err, CanonError* code){
    Writer w;
    if(!w.write(value, 0)){
        CCHAIN_LOG_DEBUG(LogCategory::CANON, "canonicalize rejected: " + w.err);
        if(err) *err = w.err;
        if(code) *code = w.code;
        return std::nullopt;
    }
    if(code) *code = CanonError::NONE;
    return CanonicalBytes(std::vector<uint8_t>(w.out.begin(), w.out.end()));
}

} // namespace cchain
