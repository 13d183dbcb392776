// Canonicalization and content digests
#include "canonical.h"
#include "digest.h"
#include "json.h"
#include "log.h"
#include <cmath>
#include <cstdio>
#include <limits>
#include <string>

#define TEST_CHECK(cond, msg) do { \
    if (!(cond)) { \
        std::fprintf(stderr, "FAIL: %s (line %d)\n", msg, __LINE__); \
        return 1; \
    } \
} while(0)

using namespace cchain;

static std::string canon(const JNode& n){
    auto cb = canonicalize(n);
    return cb ? cb->str() : std::string("<error>");
}

static JNode parse(const std::string& s){
    JNode n;
    if(!json_parse(s, n)) n = jstr("<parse error>");
    return n;
}

int main(){
    log_init(LogLevel::ERR);
    printf("Testing canonicalization...\n");

    // Key order independence
    {
        JNode a = jobj({{"a", jint(1)}, {"b", jint(2)}});
        JNode b = parse("{ \"b\": 2, \"a\": 1 }");
        TEST_CHECK(canon(a) == "{\"a\":1,\"b\":2}", "keys sorted, no whitespace");
        TEST_CHECK(canon(a) == canon(b), "field order must not matter");
        auto da = digest_value(a), db = digest_value(b);
        TEST_CHECK(da && db && *da == *db, "equal content must digest equally");
        printf("  [PASS] Key order independence\n");
    }

    // Array order sensitivity
    {
        JNode a = parse("[1,2,3]");
        JNode b = parse("[3,2,1]");
        TEST_CHECK(canon(a) == "[1,2,3]", "array kept in order");
        TEST_CHECK(canon(a) != canon(b), "array order must matter");
        TEST_CHECK(*digest_value(a) != *digest_value(b), "array order must change the digest");
        printf("  [PASS] Array order sensitivity\n");
    }

    // Keys compare by bytes, not numerically
    {
        JNode n = parse("{\"10\":0,\"9\":0,\"B\":0,\"a\":0}");
        TEST_CHECK(canon(n) == "{\"10\":0,\"9\":0,\"B\":0,\"a\":0}", "byte order of keys");
        printf("  [PASS] Byte-ordered keys\n");
    }

    // Determinism
    {
        JNode n = parse("{\"x\":[{\"z\":null,\"y\":true}],\"w\":\"s\",\"v\":-5}");
        auto c1 = canonicalize(n), c2 = canonicalize(n);
        TEST_CHECK(c1 && c2 && *c1 == *c2, "canonicalize twice gives same bytes");
        TEST_CHECK(c1->str() == "{\"v\":-5,\"w\":\"s\",\"x\":[{\"y\":true,\"z\":null}]}", "nested output");
        TEST_CHECK(digest(*c1) == digest(*c2), "digest is deterministic");
        printf("  [PASS] Determinism\n");
    }

    // Float rejection at any depth
    {
        CanonError code = CanonError::NONE;
        std::string err;
        TEST_CHECK(!canonicalize(jdouble(1.5), &err, &code), "top-level float rejected");
        TEST_CHECK(code == CanonError::FLOAT_REJECTED, "code is FLOAT_REJECTED");
        TEST_CHECK(!err.empty(), "error message filled");

        code = CanonError::NONE;
        JNode deep = parse("{\"a\":[{\"b\":{\"c\":[1,2,0.25]}}]}");
        TEST_CHECK(!canonicalize(deep, nullptr, &code), "nested float rejected");
        TEST_CHECK(code == CanonError::FLOAT_REJECTED, "nested code is FLOAT_REJECTED");

        TEST_CHECK(!canonicalize(jdouble(std::numeric_limits<double>::quiet_NaN())), "NaN rejected");
        TEST_CHECK(!canonicalize(jdouble(std::numeric_limits<double>::infinity())), "Inf rejected");
        TEST_CHECK(!canonicalize(jdouble(1e300)), "out of range integral double rejected");
        TEST_CHECK(!digest_value(deep), "digest_value propagates rejection");
        printf("  [PASS] Float rejection\n");
    }

    // Integral numbers
    {
        TEST_CHECK(canon(jdouble(3.0)) == "3", "integer-valued double emitted as integer");
        TEST_CHECK(canon(jdouble(-7.0)) == "-7", "negative integer-valued double");
        TEST_CHECK(canon(parse("1e3")) == "1000", "exponent form that is integral");
        TEST_CHECK(canon(juint(18446744073709551615ull)) == "18446744073709551615", "u64 max");
        TEST_CHECK(canon(jint(-9223372036854775807LL - 1)) == "-9223372036854775808", "i64 min");
        TEST_CHECK(canon(jstr("1.5")) == "\"1.5\"", "numeric strings pass through");
        printf("  [PASS] Integral numbers\n");
    }

    // Date-time normalization
    {
        TEST_CHECK(canon(jstr("2024-01-15T12:00:00Z")) == "\"2024-01-15T12:00:00Z\"", "UTC unchanged");
        TEST_CHECK(canon(jstr("2024-01-15T12:00:00+05:00")) == "\"2024-01-15T07:00:00Z\"", "positive offset");
        TEST_CHECK(canon(jstr("2024-01-15T23:30:00-01:00")) == "\"2024-01-16T00:30:00Z\"", "negative offset crosses day");
        TEST_CHECK(canon(jstr("2024-01-15T12:00:00.987654Z")) == "\"2024-01-15T12:00:00Z\"", "fraction truncated");
        TEST_CHECK(canon(jstr("2024-01-15t12:00:00z")) == "\"2024-01-15T12:00:00Z\"", "lowercase t/z");
        TEST_CHECK(canon(jstr("2024-02-30T12:00:00Z")) == "\"2024-02-30T12:00:00Z\"", "invalid date is a plain string");
        TEST_CHECK(canon(jstr("2024-01-15 12:00:00Z")) == "\"2024-01-15 12:00:00Z\"", "space separator is a plain string");
        TEST_CHECK(canon(jstr("2024-01-15T12:00:00")) == "\"2024-01-15T12:00:00\"", "no zone is a plain string");
        JNode a = jobj({{"t", jstr("2024-06-01T02:00:00+02:00")}});
        JNode b = jobj({{"t", jstr("2024-06-01T00:00:00Z")}});
        TEST_CHECK(*digest_value(a) == *digest_value(b), "same instant, same digest");
        printf("  [PASS] Date-time normalization\n");
    }

    // String escaping
    {
        std::string s = "q\"b\\n\n\t\x01";
        TEST_CHECK(canon(jstr(s)) == "\"q\\\"b\\\\n\\n\\t\\u0001\"", "escapes");
        TEST_CHECK(canon(jstr("caf\xc3\xa9")) == "\"caf\xc3\xa9\"", "non-ASCII emitted raw");
        printf("  [PASS] String escaping\n");
    }

    // Invalid UTF-8 never reaches the canonical form
    {
        CanonError code = CanonError::NONE;
        std::string err;
        TEST_CHECK(!canonicalize(jstr("\xff\xfe"), &err, &code), "invalid string rejected");
        TEST_CHECK(code == CanonError::INVALID_UTF8 && !err.empty(), "code is INVALID_UTF8");
        code = CanonError::NONE;
        TEST_CHECK(!canonicalize(jobj({{"ok", jarr({jstr("fine"), jstr("bad\xc0\x80")})}}), nullptr, &code),
                   "invalid string nested in an array rejected");
        TEST_CHECK(code == CanonError::INVALID_UTF8, "nested code");
        code = CanonError::NONE;
        TEST_CHECK(!canonicalize(jobj({{std::string("k\xed\xbf\xbf"), jint(1)}}), nullptr, &code),
                   "invalid key rejected");
        TEST_CHECK(code == CanonError::INVALID_UTF8, "key code");
        TEST_CHECK(!digest_value(jstr("\x80")), "no digest for invalid text");
        TEST_CHECK(canonicalize(jstr("\xf0\x9f\x98\x80")).has_value(), "four-byte sequence accepted");
        printf("  [PASS] UTF-8 validation\n");
    }

    // Depth limit
    {
        JNode n = jint(0);
        for(size_t i = 0; i < CANON_MAX_DEPTH; ++i) n = jarr({n});
        TEST_CHECK(canonicalize(n).has_value(), "nesting at the limit accepted");
        n = jarr({n});
        CanonError code = CanonError::NONE;
        TEST_CHECK(!canonicalize(n, nullptr, &code), "nesting past the limit rejected");
        TEST_CHECK(code == CanonError::DEPTH_EXCEEDED, "code is DEPTH_EXCEEDED");
        printf("  [PASS] Depth limit\n");
    }

    // Digest rendering and reload
    {
        auto cb = canonicalize(jobj());
        TEST_CHECK(cb && cb->str() == "{}", "empty object");
        ContentDigest d = digest(*cb);
        TEST_CHECK(d.algorithm() == DigestAlgorithm::SHA256, "algorithm tag");
        // sha256("{}")
        TEST_CHECK(d.hex() == "44136fa355b3678a1146ad16f7e8649e94fb4fc21fe77e8310c060f61caaff8a", "known vector");
        TEST_CHECK(d.to_string() == "sha256:" + d.hex(), "display form");

        auto r1 = ContentDigest::from_hex(d.hex());
        auto r2 = ContentDigest::from_hex(d.to_string());
        TEST_CHECK(r1 && *r1 == d, "reload from hex");
        TEST_CHECK(r2 && *r2 == d, "reload from display form");
        TEST_CHECK(!ContentDigest::from_hex(d.hex().substr(1)), "63 chars rejected");
        TEST_CHECK(!ContentDigest::from_hex(d.hex() + "0"), "65 chars rejected");
        TEST_CHECK(!ContentDigest::from_hex(std::string(63, 'a') + "g"), "non-hex rejected");
        TEST_CHECK(!ContentDigest::from_hex("md5:" + d.hex()), "unknown prefix rejected");
        printf("  [PASS] Digest rendering\n");
    }

    printf("All canonicalization tests passed!\n");
    return 0;
}
