#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace anpwba {

    long now_epoch();

    // ISO-8601 UTC with milliseconds, e.g. 2026-01-19T12:34:56.123Z
    std::string now_iso_utc();

    // ISO-8601 UTC without fraction: "YYYY-MM-DDTHH:MM:SSZ"
    std::string iso_utc_from_epoch(long t);

    // Accepts "YYYY-MM-DDTHH:MM:SS[.fff...](Z|+hh:mm|-hh:mm)".
    // Returns epoch seconds, or nullopt on any malformed input.
    std::optional<long> parse_iso8601_utc(const std::string& s);

    std::string lower_ascii(std::string s);
    std::string trim_ws(std::string s);
    bool iequals(const std::string& a, const std::string& b);

    // base64url without padding (libsodium URLSAFE_NO_PADDING)
    std::string b64url_encode(const unsigned char* data, size_t len);
    std::string b64url_encode(const std::vector<unsigned char>& v);

    // Strict base64url decode. Trailing '=' is tolerated. Throws std::runtime_error.
    std::vector<unsigned char> b64url_decode(const std::string& in);

    std::string hex_lower(const unsigned char* p, size_t n);

    // randombytes_buf(n) rendered as lowercase hex (2n chars)
    std::string random_hex(size_t nbytes);

    // randombytes_buf(n) rendered as base64url without padding
    std::string random_token_b64url(size_t nbytes = 32);

    // Constant-time string equality (sodium_memcmp); false on length mismatch.
    bool secure_equals(const std::string& a, const std::string& b);

} // namespace anpwba
