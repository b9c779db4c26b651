#include "anpwba_util.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <sodium.h>

namespace anpwba {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

std::string iso_utc_from_epoch(long t) {
    std::time_t tt = (std::time_t)t;
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char buf[64];
    const int n = std::snprintf(buf, sizeof(buf),
                                "%04d-%02d-%02dT%02d:%02d:%02dZ",
                                tm.tm_year + 1900,
                                tm.tm_mon + 1,
                                tm.tm_mday,
                                tm.tm_hour,
                                tm.tm_min,
                                tm.tm_sec);
    if (n < 0 || n >= (int)sizeof(buf)) return std::string();
    return std::string(buf);
}

static std::time_t timegm_portable(std::tm* tm) {
#if defined(_GNU_SOURCE) || defined(__linux__)
    return ::timegm(tm);
#else
    char* old = std::getenv("TZ");
    std::string oldv = old ? old : "";
    ::setenv("TZ", "UTC", 1);
    ::tzset();
    std::time_t t = std::mktime(tm);
    if (old) ::setenv("TZ", oldv.c_str(), 1);
    else ::unsetenv("TZ");
    ::tzset();
    return t;
#endif
}

std::optional<long> parse_iso8601_utc(const std::string& s) {
    if (s.size() < 20) return std::nullopt;
    if (s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':') return std::nullopt;

    auto to_int = [&](size_t a, size_t b, int* v) -> bool {
        int x = 0;
        for (size_t i = a; i < b; i++) {
            char c = s[i];
            if (c < '0' || c > '9') return false;
            x = x * 10 + (c - '0');
        }
        *v = x;
        return true;
    };

    int Y=0,M=0,D=0,h=0,m=0,se=0;
    if (!to_int(0,4,&Y) || !to_int(5,7,&M) || !to_int(8,10,&D)) return std::nullopt;
    if (!to_int(11,13,&h) || !to_int(14,16,&m) || !to_int(17,19,&se)) return std::nullopt;
    if (M < 1 || M > 12 || D < 1 || D > 31 || h > 23 || m > 59 || se > 60) return std::nullopt;

    size_t pos = 19;
    if (s[pos] == '.') {
        pos++;
        const size_t digits_start = pos;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') pos++;
        if (pos == digits_start) return std::nullopt;
    }
    if (pos >= s.size()) return std::nullopt;

    long offset_sec = 0;
    if (s[pos] == 'Z' || s[pos] == 'z') {
        pos++;
    } else if (s[pos] == '+' || s[pos] == '-') {
        const int sign = (s[pos] == '-') ? -1 : 1;
        pos++;
        int oh = 0, om = 0;
        if (pos + 5 == s.size() && s[pos + 2] == ':') {
            if (!to_int(pos, pos + 2, &oh) || !to_int(pos + 3, pos + 5, &om)) return std::nullopt;
            pos += 5;
        } else if (pos + 4 == s.size()) {
            if (!to_int(pos, pos + 2, &oh) || !to_int(pos + 2, pos + 4, &om)) return std::nullopt;
            pos += 4;
        } else {
            return std::nullopt;
        }
        if (oh > 23 || om > 59) return std::nullopt;
        offset_sec = sign * (oh * 3600L + om * 60L);
    } else {
        return std::nullopt;
    }
    if (pos != s.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = Y - 1900;
    tm.tm_mon  = M - 1;
    tm.tm_mday = D;
    tm.tm_hour = h;
    tm.tm_min  = m;
    tm.tm_sec  = se;
    const std::time_t t = timegm_portable(&tm);
    if (t == (std::time_t)-1) return std::nullopt;

    return (long)t - offset_sec;
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string trim_ws(std::string s) {
    auto is_ws = [](unsigned char c){ return c==' '||c=='\t'||c=='\r'||c=='\n'; };
    while (!s.empty() && is_ws((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && is_ws((unsigned char)s.back()))  s.pop_back();
    return s;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); i++) {
        if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
    }
    return true;
}

std::string b64url_encode(const unsigned char* data, size_t len) {
    size_t outLen = sodium_base64_encoded_len(len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    std::string out(outLen, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
    out.resize(std::strlen(out.c_str()));
    return out;
}

std::string b64url_encode(const std::vector<unsigned char>& v) {
    return b64url_encode(v.data(), v.size());
}

std::vector<unsigned char> b64url_decode(const std::string& in) {
    std::string s = in;
    while (!s.empty() && s.back() == '=') s.pop_back();

    std::vector<unsigned char> out(s.size() + 8);
    size_t out_len = 0;
    if (sodium_base642bin(out.data(), out.size(),
                          s.c_str(), s.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_URLSAFE_NO_PADDING) != 0) {
        throw std::runtime_error("invalid base64url");
    }
    out.resize(out_len);
    return out;
}

std::string hex_lower(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[2*i]     = kHex[(p[i] >> 4) & 0xF];
        out[2*i + 1] = kHex[p[i] & 0xF];
    }
    return out;
}

std::string random_hex(size_t nbytes) {
    std::vector<unsigned char> rnd(nbytes);
    randombytes_buf(rnd.data(), rnd.size());
    return hex_lower(rnd.data(), rnd.size());
}

std::string random_token_b64url(size_t nbytes) {
    std::vector<unsigned char> rnd(nbytes);
    randombytes_buf(rnd.data(), rnd.size());
    return b64url_encode(rnd);
}

bool secure_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace anpwba
