#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <map>
namespace cchain {
struct JNull{};
// Integers keep their exact width; double only holds values that arrived
// with a fraction or exponent.
using JVal = std::variant<JNull, bool, int64_t, uint64_t, double, std::string,
                          std::vector<class JNode>, std::map<std::string, class JNode>>;
class JNode { public: JVal v; };
using JArray = std::vector<JNode>;
using JObject = std::map<std::string, JNode>;

bool json_parse(const std::string& s, JNode& out);
std::string json_dump(const JNode& n);
// Appends `s` as a quoted JSON string literal.
void json_escape(const std::string& s, std::string& out);
// Strict UTF-8 (RFC 3629): no overlong forms, no surrogates, nothing past
// U+10FFFF. On failure `bad_offset` is the first offending byte.
bool utf8_valid(const std::string& s, size_t* bad_offset = nullptr);

// Builders
JNode jnull();
JNode jbool(bool b);
JNode jint(int64_t i);
JNode juint(uint64_t u);
JNode jdouble(double d);
JNode jstr(const std::string& s);
JNode jarr(JArray a = {});
JNode jobj(JObject o = {});

// Accessors; all return false when the key is missing or has the wrong type.
const JObject* as_object(const JNode& n);
const JArray* as_array(const JNode& n);
bool get_string(const JObject& o, const std::string& key, std::string& out);
bool get_u64(const JObject& o, const std::string& key, uint64_t& out);
bool get_i64(const JObject& o, const std::string& key, int64_t& out);
const JNode* get_field(const JObject& o, const std::string& key);
}
