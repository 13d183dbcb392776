#include "corridor_id.h"
#include "hex.h"

#if !defined(_WIN32)
  #include <unistd.h>
  #include <fcntl.h>
  #include <errno.h>
  #if defined(__linux__)
    #include <sys/syscall.h>
  #endif
#else
  #define NOMINMAX
  #include <windows.h>
  #include <bcrypt.h>
  #pragma comment(lib, "bcrypt.lib")
#endif

namespace cchain {

static bool os_random(uint8_t* out, size_t len, std::string* err){
#if defined(_WIN32)
    if(BCryptGenRandom(NULL, out, (ULONG)len, BCRYPT_USE_SYSTEM_PREFERRED_RNG) == 0) return true;
    if(err) *err = "BCryptGenRandom failed";
    return false;
#else
  #if defined(__linux__)
    if(syscall(SYS_getrandom, out, len, 0) == (ssize_t)len) return true;
  #endif
    int fd = ::open("/dev/urandom", O_RDONLY);
    if(fd < 0){
        if(err) *err = "cannot open /dev/urandom";
        return false;
    }
    size_t off = 0;
    while(off < len){
        ssize_t r = ::read(fd, out + off, len - off);
        if(r < 0 && errno == EINTR) continue;
        if(r <= 0){
            ::close(fd);
            if(err) *err = "short read from /dev/urandom";
            return false;
        }
        off += (size_t)r;
    }
    ::close(fd);
    return true;
#endif
}

CorridorId::CorridorId(const std::array<uint8_t, 16>& b) : bytes_(b) {
    const std::string h = to_hex(b.data(), b.size());
    text_ = h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
            h.substr(16, 4) + "-" + h.substr(20, 12);
}

std::optional<CorridorId> CorridorId::generate(std::string* err){
    std::array<uint8_t, 16> b{};
    if(!os_random(b.data(), b.size(), err)) return std::nullopt;
    b[6] = (uint8_t)((b[6] & 0x0f) | 0x40); // version 4
    b[8] = (uint8_t)((b[8] & 0x3f) | 0x80); // RFC 4122 variant
    return CorridorId(b);
}

std::optional<CorridorId> CorridorId::parse(const std::string& s){
    if(s.size() != 36) return std::nullopt;
    if(s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') return std::nullopt;
    std::string compact;
    compact.reserve(32);
    for(size_t i = 0; i < s.size(); ++i){
        if(i == 8 || i == 13 || i == 18 || i == 23) continue;
        compact.push_back(s[i]);
    }
    std::vector<uint8_t> raw;
    if(!from_hex(compact, raw) || raw.size() != 16) return std::nullopt;
    std::array<uint8_t, 16> b{};
    for(size_t i = 0; i < 16; ++i) b[i] = raw[i];
    return CorridorId(b);
}

} // namespace cchain
