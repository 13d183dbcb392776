#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include "sha256.h"

namespace cchain {

// Decodes hex (either case). Returns false on odd length or a non-hex
// character; `out` is left untouched on failure.
bool from_hex(const std::string& hex, std::vector<uint8_t>& out);
// Decodes exactly 64 hex characters into a 32-byte hash.
bool hex_to_hash(const std::string& hex, Hash256& out);

std::string to_hex(const uint8_t* data, size_t len);
std::string to_hex(const std::vector<uint8_t>& v);
std::string to_hex(const Hash256& h);

// True iff `s` is exactly 64 hex characters (either case).
bool is_hex32(const std::string& s);
std::string to_lower_ascii(std::string s);

}
