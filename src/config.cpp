#include "config.h"
#include "log.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <climits>

using namespace cchain;

static inline std::string trim(const std::string& s){
    auto a = s.find_first_not_of(" \t\r\n");
    if(a==std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

static inline std::string lower(std::string s){
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

static bool parse_bool(const std::string& v, bool& out, const std::string& key){
    std::string l = lower(v);
    if(l=="1"||l=="true"||l=="yes"||l=="on"){ out = true; return true; }
    if(l=="0"||l=="false"||l=="no"||l=="off"){ out = false; return true; }
    log_error(LogCategory::CONFIG, "Config: Invalid " + key + " value '" + v + "' (expected true/false)");
    return false;
}

static bool safe_parse_u64(const std::string& v, uint64_t& out, const std::string& key){
    if(v.empty() || v[0]=='-' || v[0]=='+'){
        log_error(LogCategory::CONFIG, "Config: Invalid " + key + " value '" + v + "'");
        return false;
    }
    try {
        size_t used = 0;
        unsigned long long val = std::stoull(v, &used);
        if(used != v.size()){
            log_error(LogCategory::CONFIG, "Config: Invalid " + key + " value '" + v + "': trailing characters");
            return false;
        }
        out = static_cast<uint64_t>(val);
        return true;
    } catch (const std::exception& e) {
        log_error(LogCategory::CONFIG, "Config: Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

static bool safe_parse_u32(const std::string& v, uint32_t& out, const std::string& key){
    uint64_t val = 0;
    if(!safe_parse_u64(v, val, key)) return false;
    if(val > UINT32_MAX){
        log_error(LogCategory::CONFIG, "Config: " + key + " value '" + v + "' is too large");
        return false;
    }
    out = static_cast<uint32_t>(val);
    return true;
}

static void parse_stream(std::istream& in, Config& out){
    std::string line;
    int line_num = 0;
    while(std::getline(in, line)){
        ++line_num;
        line = trim(line);
        if(line.empty()) continue;
        if(line[0]=='#') continue;
        if(line.rfind("//",0)==0) continue;

        auto kpos = line.find('=');
        if(kpos==std::string::npos) {
            log_error(LogCategory::CONFIG, "Config line " + std::to_string(line_num) + ": missing '=' in '" + line + "'");
            continue;
        }
        std::string k = lower(trim(line.substr(0,kpos)));
        std::string v = trim(line.substr(kpos+1));

        if(k=="log_level") out.log_level = lower(v);
        else if(k=="log_categories") out.log_categories = lower(v);
        else if(k=="log_timestamps") parse_bool(v, out.log_timestamps, k);
        else if(k=="log_async") parse_bool(v, out.log_async, k);
        else if(k=="checkpoint_interval") safe_parse_u64(v, out.checkpoint_interval, k);
        else if(k=="anchor_chain_id"){
            if(v.empty()) log_error(LogCategory::CONFIG, "Config: anchor_chain_id must not be empty");
            else out.anchor_chain_id = v;
        }
        else if(k=="anchor_confirmations") safe_parse_u32(v, out.anchor_confirmations, k);
        else log_warn(LogCategory::CONFIG, "Config line " + std::to_string(line_num) + ": unknown key '" + k + "' ignored");
    }
}

bool cchain::load_config(const std::string& path, Config& out){
    std::ifstream f(path);
    if(!f.is_open()) return false;
    parse_stream(f, out);
    return true;
}

void cchain::parse_config(const std::string& text, Config& out){
    std::istringstream in(text);
    parse_stream(in, out);
}

bool cchain::apply_log_config(const Config& cfg, std::string* err){
    LogLevel level;
    if(!log_level_from_string(cfg.log_level, level)){
        if(err) *err = "unknown log_level '" + cfg.log_level + "'";
        return false;
    }

    uint32_t mask = 0;
    std::stringstream ss(cfg.log_categories);
    std::string item;
    while(std::getline(ss, item, ',')){
        item = trim(item);
        if(item.empty()) continue;
        LogCategory c;
        if(!log_category_from_string(item, c)){
            if(err) *err = "unknown log category '" + item + "'";
            return false;
        }
        mask |= static_cast<uint32_t>(c);
    }
    if(mask == 0) mask = static_cast<uint32_t>(LogCategory::ALL);

    log_set_level(level);
    log_set_categories(mask);
    log_enable_timestamps(cfg.log_timestamps);
    log_set_async(cfg.log_async);
    return true;
}

ChainOptions cchain::chain_options_from_config(const Config& cfg){
    ChainOptions opts;
    opts.checkpoint_interval = cfg.checkpoint_interval;
    return opts;
}

std::unique_ptr<AnchorTarget> cchain::anchor_target_from_config(const Config& cfg){
    log_info(LogCategory::CONFIG, "Config: anchoring to " + cfg.anchor_chain_id + " after "
             + std::to_string(cfg.anchor_confirmations) + " confirmations");
    return std::unique_ptr<AnchorTarget>(new MockAnchorTarget(cfg.anchor_chain_id, cfg.anchor_confirmations));
}
