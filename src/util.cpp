#include "util.h"
#include <chrono>
#include <cstdio>

namespace cchain {

int64_t now(){
    using namespace std::chrono;
    return (int64_t)duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// Howard Hinnant's civil calendar conversions, valid for the proleptic
// Gregorian calendar over the whole int64 second range we accept.
static int64_t days_from_civil(int64_t y, unsigned m, unsigned d){
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = (unsigned)(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (int64_t)doe - 719468;
}

static void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d){
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = (unsigned)(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = (int64_t)yoe + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += (m <= 2);
}

static bool is_leap(int64_t y){ return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static unsigned days_in_month(int64_t y, unsigned m){
    static const unsigned k[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    return (m == 2 && is_leap(y)) ? 29u : k[m - 1];
}

std::string format_utc(int64_t t){
    int64_t days = t / 86400;
    int64_t rem = t % 86400;
    if(rem < 0){ rem += 86400; --days; }
    int64_t y; unsigned m, d;
    civil_from_days(days, y, m, d);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                  (long long)y, m, d, (int)(rem / 3600), (int)((rem % 3600) / 60), (int)(rem % 60));
    return buf;
}

static bool digits(const std::string& s, size_t pos, size_t n, int& out){
    if(pos + n > s.size()) return false;
    int v = 0;
    for(size_t i = pos; i < pos + n; ++i){
        if(s[i] < '0' || s[i] > '9') return false;
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

bool parse_rfc3339(const std::string& s, int64_t& out){
    // 2026-01-15T12:00:00Z is the shortest accepted form
    if(s.size() < 20) return false;
    int Y, M, D, h, mi, sec;
    if(!digits(s, 0, 4, Y) || s[4] != '-' || !digits(s, 5, 2, M) || s[7] != '-' ||
       !digits(s, 8, 2, D)) return false;
    if(s[10] != 'T' && s[10] != 't') return false;
    if(!digits(s, 11, 2, h) || s[13] != ':' || !digits(s, 14, 2, mi) || s[16] != ':' ||
       !digits(s, 17, 2, sec)) return false;
    if(M < 1 || M > 12 || D < 1 || (unsigned)D > days_in_month(Y, (unsigned)M)) return false;
    // second 60 is an RFC 3339 leap second; it folds into the next minute
    if(h > 23 || mi > 59 || sec > 60) return false;

    size_t i = 19;
    if(i < s.size() && s[i] == '.'){
        ++i;
        const size_t f = i;
        while(i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
        if(i == f) return false;
    }
    if(i >= s.size()) return false;

    int64_t offset = 0;
    if(s[i] == 'Z' || s[i] == 'z'){
        ++i;
    } else if(s[i] == '+' || s[i] == '-'){
        const int sign = (s[i] == '-') ? -1 : 1;
        int oh, om;
        if(!digits(s, i + 1, 2, oh) || i + 3 >= s.size() || s[i + 3] != ':' || !digits(s, i + 4, 2, om))
            return false;
        if(oh > 23 || om > 59) return false;
        offset = sign * (int64_t)(oh * 3600 + om * 60);
        i += 6;
    } else {
        return false;
    }
    if(i != s.size()) return false;

    const int64_t days = days_from_civil(Y, (unsigned)M, (unsigned)D);
    const int64_t t = days * 86400 + h * 3600 + mi * 60 + sec - offset;
    if(!rfc3339_representable(t)) return false;
    out = t;
    return true;
}

} // namespace cchain
