#include "json.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cerrno>
#include <limits>
namespace cchain {
static const size_t MAX_PARSE_DEPTH = 256;

static void skip(const std::string& s, size_t& i){ while(i<s.size() && isspace((unsigned char)s[i])) ++i; }

static void append_utf8(uint32_t cp, std::string& o){
    if(cp < 0x80){ o.push_back((char)cp); }
    else if(cp < 0x800){ o.push_back((char)(0xC0 | (cp>>6))); o.push_back((char)(0x80 | (cp & 0x3F))); }
    else if(cp < 0x10000){ o.push_back((char)(0xE0 | (cp>>12))); o.push_back((char)(0x80 | ((cp>>6) & 0x3F))); o.push_back((char)(0x80 | (cp & 0x3F))); }
    else { o.push_back((char)(0xF0 | (cp>>18))); o.push_back((char)(0x80 | ((cp>>12) & 0x3F))); o.push_back((char)(0x80 | ((cp>>6) & 0x3F))); o.push_back((char)(0x80 | (cp & 0x3F))); }
}

bool utf8_valid(const std::string& s, size_t* bad_offset){
    size_t i = 0;
    const size_t n = s.size();
    while(i < n){
        const unsigned char c = (unsigned char)s[i];
        size_t len;
        unsigned char lo = 0x80, hi = 0xBF;   // bounds for the second byte
        if(c < 0x80){ ++i; continue; }
        else if(c >= 0xC2 && c <= 0xDF) len = 2;
        else if(c == 0xE0){ len = 3; lo = 0xA0; }
        else if(c == 0xED){ len = 3; hi = 0x9F; }   // U+D800..U+DFFF
        else if(c >= 0xE1 && c <= 0xEF) len = 3;
        else if(c == 0xF0){ len = 4; lo = 0x90; }
        else if(c == 0xF4){ len = 4; hi = 0x8F; }   // caps at U+10FFFF
        else if(c >= 0xF1 && c <= 0xF3) len = 4;
        else { if(bad_offset) *bad_offset = i; return false; }

        if(i + len > n){ if(bad_offset) *bad_offset = i; return false; }
        const unsigned char c1 = (unsigned char)s[i + 1];
        if(c1 < lo || c1 > hi){ if(bad_offset) *bad_offset = i; return false; }
        for(size_t k = 2; k < len; ++k){
            const unsigned char ck = (unsigned char)s[i + k];
            if(ck < 0x80 || ck > 0xBF){ if(bad_offset) *bad_offset = i; return false; }
        }
        i += len;
    }
    return true;
}

static bool parse_hex4(const std::string& s, size_t i, uint32_t& out){
    if(i+4 > s.size()) return false;
    out = 0;
    for(size_t k=0;k<4;++k){
        char c = s[i+k]; uint32_t d;
        if(c>='0'&&c<='9') d = (uint32_t)(c-'0');
        else if(c>='a'&&c<='f') d = (uint32_t)(10+c-'a');
        else if(c>='A'&&c<='F') d = (uint32_t)(10+c-'A');
        else return false;
        out = (out<<4) | d;
    }
    return true;
}

static bool parse_string(const std::string& s, size_t& i, std::string& out){
    if(i>=s.size() || s[i]!='"') return false; ++i;
    std::string o;
    while(i<s.size() && s[i]!='"'){
        unsigned char ch = (unsigned char)s[i];
        if(ch < 0x20) return false;
        if(ch=='\\'){
            ++i; if(i>=s.size()) return false;
            char c=s[i];
            if(c=='"'||c=='\\'||c=='/') o.push_back(c);
            else if(c=='b') o.push_back('\b');
            else if(c=='f') o.push_back('\f');
            else if(c=='n') o.push_back('\n');
            else if(c=='r') o.push_back('\r');
            else if(c=='t') o.push_back('\t');
            else if(c=='u'){
                uint32_t cp;
                if(!parse_hex4(s, i+1, cp)) return false;
                i += 4;
                if(cp >= 0xD800 && cp <= 0xDBFF){
                    uint32_t lo;
                    if(i+2 >= s.size() || s[i+1]!='\\' || s[i+2]!='u' || !parse_hex4(s, i+3, lo)) return false;
                    if(lo < 0xDC00 || lo > 0xDFFF) return false;
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    i += 6;
                } else if(cp >= 0xDC00 && cp <= 0xDFFF){
                    return false;
                }
                append_utf8(cp, o);
            }
            else return false;
        } else o.push_back(s[i]);
        ++i;
    }
    if(i>=s.size()||s[i]!='"') return false;
    // escapes always decode to valid sequences, so this only catches raw bytes
    if(!utf8_valid(o)) return false;
    ++i; out.swap(o); return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out, size_t depth);
static bool parse_array(const std::string& s, size_t& i, JNode& out, size_t depth){
    if(s[i]!='[') return false; ++i; skip(s,i); JArray arr;
    if(i<s.size() && s[i]==']'){ ++i; out.v=arr; return true; }
    while(true){ JNode val; if(!parse_value(s,i,val,depth+1)) return false; arr.push_back(val); skip(s,i); if(i>=s.size()) return false; if(s[i]==','){ ++i; skip(s,i); continue; } if(s[i]==']'){ ++i; out.v=arr; return true; } return false; }
}
static bool parse_object(const std::string& s, size_t& i, JNode& out, size_t depth){
    if(s[i]!='{') return false; ++i; skip(s,i); JObject obj;
    if(i<s.size() && s[i]=='}'){ ++i; out.v=obj; return true; }
    while(true){
        std::string k; if(!parse_string(s,i,k)) return false; skip(s,i);
        if(i>=s.size() || s[i]!=':') return false; ++i; skip(s,i);
        JNode val; if(!parse_value(s,i,val,depth+1)) return false;
        // duplicate keys make the source ambiguous
        if(!obj.emplace(k, val).second) return false;
        skip(s,i); if(i>=s.size()) return false;
        if(s[i]==','){ ++i; skip(s,i); continue; }
        if(s[i]=='}'){ ++i; out.v=obj; return true; }
        return false;
    }
}
static bool parse_number(const std::string& s, size_t& i, JNode& out){
    size_t j=i; bool neg=false; bool is_float=false;
    if(i<s.size() && s[i]=='-'){ neg=true; ++i; }
    size_t digits_start=i;
    while(i<s.size() && isdigit((unsigned char)s[i])) ++i;
    if(i==digits_start) return false;
    if(i<s.size() && s[i]=='.'){ is_float=true; ++i; size_t f=i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i; if(i==f) return false; }
    if(i<s.size() && (s[i]=='e'||s[i]=='E')){ is_float=true; ++i; if(i<s.size()&&(s[i]=='+'||s[i]=='-')) ++i; size_t e=i; while(i<s.size()&&isdigit((unsigned char)s[i])) ++i; if(i==e) return false; }
    const std::string tok = s.substr(j, i-j);
    errno = 0;
    if(!is_float){
        char* end=nullptr;
        if(neg){
            long long v = std::strtoll(tok.c_str(), &end, 10);
            if(errno==0 && end && *end=='\0'){ out.v=(int64_t)v; return true; }
        } else {
            unsigned long long v = std::strtoull(tok.c_str(), &end, 10);
            if(errno==0 && end && *end=='\0'){
                if(v <= (unsigned long long)std::numeric_limits<int64_t>::max()) out.v=(int64_t)v;
                else out.v=(uint64_t)v;
                return true;
            }
        }
        errno = 0; // out of 64-bit range: keep as double
    }
    char* end=nullptr;
    double d = std::strtod(tok.c_str(), &end);
    if(!end || *end!='\0') return false;
    out.v=d; return true;
}
static bool parse_value(const std::string& s, size_t& i, JNode& out, size_t depth){
    if(depth > MAX_PARSE_DEPTH) return false;
    skip(s,i); if(i>=s.size()) return false;
    if(s[i]=='"'){ std::string str; if(!parse_string(s,i,str)) return false; out.v=str; return true; }
    if(s[i]=='{') return parse_object(s,i,out,depth);
    if(s[i]=='[') return parse_array(s,i,out,depth);
    if(s.compare(i,4,"true")==0){ i+=4; out.v=true; return true; }
    if(s.compare(i,5,"false")==0){ i+=5; out.v=false; return true; }
    if(s.compare(i,4,"null")==0){ i+=4; out.v=JNull{}; return true; }
    return parse_number(s,i,out);
}
bool json_parse(const std::string& s, JNode& out){ size_t i=0; JNode tmp; bool ok=parse_value(s,i,tmp,0); if(!ok) return false; skip(s,i); if(i!=s.size()) return false; out=tmp; return true; }

void json_escape(const std::string& s, std::string& o){
    o.push_back('"');
    for(unsigned char c : s){
        switch(c){
            case '"':  o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\b': o += "\\b"; break;
            case '\f': o += "\\f"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default:
                if(c < 0x20){ char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned)c); o += buf; }
                else o.push_back((char)c);
        }
    }
    o.push_back('"');
}

static void dump(const JNode& n, std::string& o){
    if(std::holds_alternative<JNull>(n.v)) o+="null";
    else if(std::holds_alternative<bool>(n.v)) o+=(std::get<bool>(n.v)?"true":"false");
    else if(std::holds_alternative<int64_t>(n.v)) o+=std::to_string(std::get<int64_t>(n.v));
    else if(std::holds_alternative<uint64_t>(n.v)) o+=std::to_string(std::get<uint64_t>(n.v));
    else if(std::holds_alternative<double>(n.v)){
        double d = std::get<double>(n.v);
        if(!std::isfinite(d)){ o+="null"; return; }
        char buf[32]; std::snprintf(buf, sizeof(buf), "%.17g", d); o+=buf;
    }
    else if(std::holds_alternative<std::string>(n.v)) json_escape(std::get<std::string>(n.v), o);
    else if(std::holds_alternative<JArray>(n.v)){ o.push_back('['); const auto& a=std::get<JArray>(n.v); for(size_t i=0;i<a.size();++i){ if(i) o.push_back(','); dump(a[i],o);} o.push_back(']'); }
    else { o.push_back('{'); const auto& m=std::get<JObject>(n.v); size_t i=0; for(auto& kv: m){ if(i++) o.push_back(','); json_escape(kv.first,o); o.push_back(':'); dump(kv.second,o);} o.push_back('}'); }
}
std::string json_dump(const JNode& n){ std::string o; dump(n,o); return o; }

JNode jnull(){ JNode n; n.v=JNull{}; return n; }
JNode jbool(bool b){ JNode n; n.v=b; return n; }
JNode jint(int64_t i){ JNode n; n.v=i; return n; }
JNode juint(uint64_t u){ JNode n; n.v=u; return n; }
JNode jdouble(double d){ JNode n; n.v=d; return n; }
JNode jstr(const std::string& s){ JNode n; n.v=s; return n; }
JNode jarr(JArray a){ JNode n; n.v=std::move(a); return n; }
JNode jobj(JObject o){ JNode n; n.v=std::move(o); return n; }

const JObject* as_object(const JNode& n){ return std::get_if<JObject>(&n.v); }
const JArray* as_array(const JNode& n){ return std::get_if<JArray>(&n.v); }

const JNode* get_field(const JObject& o, const std::string& key){
    auto it = o.find(key);
    return it == o.end() ? nullptr : &it->second;
}

bool get_string(const JObject& o, const std::string& key, std::string& out){
    const JNode* f = get_field(o, key);
    if(!f) return false;
    const std::string* s = std::get_if<std::string>(&f->v);
    if(!s) return false;
    out = *s; return true;
}

bool get_u64(const JObject& o, const std::string& key, uint64_t& out){
    const JNode* f = get_field(o, key);
    if(!f) return false;
    if(auto p = std::get_if<uint64_t>(&f->v)){ out = *p; return true; }
    if(auto p = std::get_if<int64_t>(&f->v)){ if(*p < 0) return false; out = (uint64_t)*p; return true; }
    return false;
}

bool get_i64(const JObject& o, const std::string& key, int64_t& out){
    const JNode* f = get_field(o, key);
    if(!f) return false;
    if(auto p = std::get_if<int64_t>(&f->v)){ out = *p; return true; }
    if(auto p = std::get_if<uint64_t>(&f->v)){ if(*p > (uint64_t)std::numeric_limits<int64_t>::max()) return false; out = (int64_t)*p; return true; }
    return false;
}
}
