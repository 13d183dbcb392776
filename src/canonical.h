#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "json.h"

namespace cchain {

// Deepest nesting of arrays/objects the canonicalizer accepts.
static const size_t CANON_MAX_DEPTH = 128;

enum class CanonError {
    NONE = 0,
    FLOAT_REJECTED,     // non-integral, NaN/Inf, or out-of-range floating value
    DEPTH_EXCEEDED,     // nesting deeper than CANON_MAX_DEPTH
    INVALID_UTF8,       // string or key that is not well-formed UTF-8
    TIMESTAMP_RANGE,    // receipt time outside the four-digit-year RFC 3339 range
};

const char* canon_error_name(CanonError e);

class CanonicalBytes;

// Converts a structured value into its canonical byte form:
//   - object keys sorted by raw byte order, no whitespace anywhere
//   - arrays keep their order
//   - floats rejected; integer-valued doubles are emitted as integers
//   - RFC 3339 date-time strings normalized to UTC `YYYY-MM-DDTHH:MM:SSZ`
//   - every string and key must be well-formed UTF-8
// On failure returns nullopt and fills `err`/`code` when given; nothing
// partial is ever produced.
std::optional<CanonicalBytes> canonicalize(const JNode& value,
                                           std::string* err = nullptr,
                                           CanonError* code = nullptr);

// Output of canonicalize(). There is no other way to create one, which keeps
// every digest in the system on the same serialization path.
class CanonicalBytes {
public:
    const std::vector<uint8_t>& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }
    std::string str() const { return std::string(bytes_.begin(), bytes_.end()); }

    bool operator==(const CanonicalBytes& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const CanonicalBytes& o) const { return bytes_ != o.bytes_; }

private:
    explicit CanonicalBytes(std::vector<uint8_t> b) : bytes_(std::move(b)) {}
    friend std::optional<CanonicalBytes> canonicalize(const JNode&, std::string*, CanonError*);

    std::vector<uint8_t> bytes_;
};

} // namespace cchain
