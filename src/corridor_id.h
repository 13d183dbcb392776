#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace cchain {

// Opaque identifier of one settlement corridor. Generated once when the
// corridor is established and never changed afterwards.
class CorridorId {
public:
    // Random 128-bit id (RFC 4122 version 4 layout). Returns nullopt only if
    // the OS random source is unavailable.
    static std::optional<CorridorId> generate(std::string* err = nullptr);
    // Parses the canonical 36-character lowercase/uppercase UUID form.
    static std::optional<CorridorId> parse(const std::string& s);

    // 8-4-4-4-12 lowercase hex
    const std::string& str() const { return text_; }

    bool operator==(const CorridorId& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const CorridorId& o) const { return bytes_ != o.bytes_; }
    bool operator<(const CorridorId& o) const { return bytes_ < o.bytes_; }

private:
    explicit CorridorId(const std::array<uint8_t, 16>& b);

    std::array<uint8_t, 16> bytes_;
    std::string text_;
};

} // namespace cchain

namespace std {
template<> struct hash<cchain::CorridorId> {
    size_t operator()(const cchain::CorridorId& id) const noexcept {
        return std::hash<std::string>()(id.str());
    }
};
}
