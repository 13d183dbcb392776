#pragma once
#include <cstdint>
#include <string>

namespace cchain {

// UNIX time (seconds since epoch, UTC)
int64_t now();

// RFC 3339 has four-digit years only: 0000-01-01T00:00:00Z .. 9999-12-31T23:59:59Z
static constexpr int64_t RFC3339_MIN_SECS = -62167219200LL;
static constexpr int64_t RFC3339_MAX_SECS = 253402300799LL;

inline bool rfc3339_representable(int64_t unix_secs){
    return unix_secs >= RFC3339_MIN_SECS && unix_secs <= RFC3339_MAX_SECS;
}

// Renders `YYYY-MM-DDTHH:MM:SSZ`. Only round-trips through parse_rfc3339 when
// rfc3339_representable(unix_secs).
std::string format_utc(int64_t unix_secs);

// Parses an RFC 3339 date-time (`YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)`,
// separator `T`/`t`, zone `Z`/`z`). Fractional seconds are dropped. Fails when
// the offset moves the instant outside the representable range.
bool parse_rfc3339(const std::string& s, int64_t& unix_secs);

} // namespace cchain
