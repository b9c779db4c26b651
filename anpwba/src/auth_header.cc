#include "auth_header.h"

#include "anpwba_util.h"
#include "signature_codec.h"

#include <map>

#include <nlohmann/json.hpp>

namespace anpwba {
using json = nlohmann::json;

/*
DIDWba header
=============

Wire form (one line, field order fixed):

  DIDWba did="<did>", nonce="<hex>", timestamp="<iso>", [resp_did="<did>",]
         verification_method="<fragment>", signature="<b64url>"

The header text is never signed. The signature covers a canonical JSON
object that binds the caller DID, nonce, timestamp and the *service domain
of the receiver*, so a header minted for one host cannot be replayed
against another. Two-way headers also bind resp_did and use the key name
"anp_service" instead of "service"; the two canonical forms never collide.

Grammar accepted by the parser:
  header := ws* "DIDWba" SP pair (ws* "," ws* pair)* ws*
  pair   := key ws* "=" ws* '"' value '"'
  value  := (any char except '"' and '\' | '\' any char)*

Unknown keys are skipped. Empty values count as missing.
*/

std::string canonical_single_way(const AuthHeaderParts& p, const std::string& service_domain) {
    json c;
    c["did"]       = p.did;
    c["nonce"]     = p.nonce;
    c["service"]   = service_domain;
    c["timestamp"] = p.timestamp;
    return c.dump(-1, ' ', false, json::error_handler_t::strict);
}

std::string canonical_two_way(const AuthHeaderParts& p, const std::string& service_domain) {
    json c;
    c["anp_service"] = service_domain;
    c["did"]         = p.did;
    c["nonce"]       = p.nonce;
    c["resp_did"]    = p.resp_did;
    c["timestamp"]   = p.timestamp;
    return c.dump(-1, ' ', false, json::error_handler_t::strict);
}

static std::string quote_value(const std::string& v) {
    std::string out;
    out.reserve(v.size() + 2);
    out.push_back('"');
    for (char c : v) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string format_auth_header(const AuthHeaderParts& p) {
    std::string h = kAuthScheme;
    h += " did=" + quote_value(p.did);
    h += ", nonce=" + quote_value(p.nonce);
    h += ", timestamp=" + quote_value(p.timestamp);
    if (p.is_two_way()) h += ", resp_did=" + quote_value(p.resp_did);
    h += ", verification_method=" + quote_value(p.verification_method);
    h += ", signature=" + quote_value(p.signature);
    return h;
}

void sign_auth_parts(AuthHeaderParts& p, const SigningKey& key, const std::string& service_domain) {
    const std::string canonical = p.is_two_way()
        ? canonical_two_way(p, service_domain)
        : canonical_single_way(p, service_domain);
    p.signature = key.sign(canonical);
}

static AuthHeaderParts fresh_parts(const std::string& did, const std::string& key_fragment) {
    AuthHeaderParts p;
    p.did = did;
    p.nonce = random_hex(16);
    p.timestamp = now_iso_utc();

    const auto hash = key_fragment.find('#');
    p.verification_method = (hash == std::string::npos) ? key_fragment : key_fragment.substr(hash + 1);
    return p;
}

std::string build_single_way(const std::string& did,
                             const std::string& key_fragment,
                             const SigningKey& key,
                             const std::string& service_domain) {
    AuthHeaderParts p = fresh_parts(did, key_fragment);
    sign_auth_parts(p, key, service_domain);
    return format_auth_header(p);
}

std::string build_two_way(const std::string& did,
                          const std::string& resp_did,
                          const std::string& key_fragment,
                          const SigningKey& key,
                          const std::string& service_domain) {
    AuthHeaderParts p = fresh_parts(did, key_fragment);
    p.resp_did = resp_did;
    sign_auth_parts(p, key, service_domain);
    return format_auth_header(p);
}

//------------------------------------------------------------------------------
// Parsing
//------------------------------------------------------------------------------

static HeaderParseResult fail(HeaderRc rc, const std::string& msg, const std::string& field = "") {
    HeaderParseResult r;
    r.ok = false;
    r.rc = rc;
    r.field = field;
    r.detail = field.empty() ? msg : (msg + ": " + field);
    return r;
}

static bool is_ws(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }

static bool is_key_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}

// Tokenize key="value" pairs. On error returns a failed result; on success
// out holds every pair seen.
static HeaderParseResult tokenize(const std::string& header, std::map<std::string, std::string>* out) {
    const std::string s = trim_ws(header);
    const std::string prefix = std::string(kAuthScheme) + " ";
    if (s.compare(0, prefix.size(), prefix) != 0)
        return fail(HeaderRc::BAD_SCHEME, "header must start with \"DIDWba \"");

    size_t i = prefix.size();
    const size_t n = s.size();
    bool expect_pair = true;

    while (true) {
        while (i < n && is_ws(s[i])) i++;
        if (i >= n) break;

        if (!expect_pair) {
            if (s[i] != ',') return fail(HeaderRc::SYNTAX, "expected ',' between fields");
            i++;
            expect_pair = true;
            continue;
        }

        const size_t key_start = i;
        while (i < n && is_key_char(s[i])) i++;
        if (i == key_start) return fail(HeaderRc::SYNTAX, "expected field name");
        const std::string key = s.substr(key_start, i - key_start);

        while (i < n && is_ws(s[i])) i++;
        if (i >= n || s[i] != '=') return fail(HeaderRc::SYNTAX, "expected '=' after", key);
        i++;
        while (i < n && is_ws(s[i])) i++;
        if (i >= n || s[i] != '"') return fail(HeaderRc::SYNTAX, "expected quoted value for", key);
        i++;

        std::string value;
        bool closed = false;
        while (i < n) {
            const char c = s[i++];
            if (c == '\\') {
                if (i >= n) break;
                value.push_back(s[i++]);
            } else if (c == '"') {
                closed = true;
                break;
            } else {
                value.push_back(c);
            }
        }
        if (!closed) return fail(HeaderRc::SYNTAX, "unterminated value for", key);

        if (!out->emplace(key, std::move(value)).second)
            return fail(HeaderRc::DUPLICATE_FIELD, "duplicate field", key);

        expect_pair = false;
    }

    if (expect_pair && !out->empty()) return fail(HeaderRc::SYNTAX, "trailing ','");

    HeaderParseResult ok;
    ok.ok = true;
    ok.rc = HeaderRc::OK;
    return ok;
}

static HeaderParseResult parse_common(const std::string& header, bool two_way) {
    std::map<std::string, std::string> kv;
    HeaderParseResult t = tokenize(header, &kv);
    if (!t.ok) return t;

    auto get = [&](const char* k) -> std::string {
        auto it = kv.find(k);
        return it == kv.end() ? std::string() : it->second;
    };

    const char* order_single[] = {"did", "nonce", "timestamp", "verification_method", "signature"};
    const char* order_two[]    = {"did", "nonce", "timestamp", "resp_did", "verification_method", "signature"};

    if (two_way) {
        for (const char* k : order_two)
            if (get(k).empty()) return fail(HeaderRc::MISSING_FIELD, "Missing required field", k);
    } else {
        for (const char* k : order_single)
            if (get(k).empty()) return fail(HeaderRc::MISSING_FIELD, "Missing required field", k);
    }

    HeaderParseResult r;
    r.ok = true;
    r.rc = HeaderRc::OK;
    r.parts.did = get("did");
    r.parts.nonce = get("nonce");
    r.parts.timestamp = get("timestamp");
    if (two_way) r.parts.resp_did = get("resp_did");

    const std::string vm = get("verification_method");
    const auto hash = vm.find('#');
    r.parts.verification_method = (hash == std::string::npos) ? vm : vm.substr(hash + 1);
    r.parts.signature = get("signature");
    return r;
}

HeaderParseResult parse_single_way(const std::string& header) {
    return parse_common(header, false);
}

HeaderParseResult parse_two_way(const std::string& header) {
    return parse_common(header, true);
}

std::string header_rc_str(HeaderRc rc) {
    switch (rc) {
        case HeaderRc::OK: return "OK";
        case HeaderRc::BAD_SCHEME: return "BAD_SCHEME";
        case HeaderRc::SYNTAX: return "SYNTAX";
        case HeaderRc::DUPLICATE_FIELD: return "DUPLICATE_FIELD";
        case HeaderRc::MISSING_FIELD: return "MISSING_FIELD";
    }
    return "UNKNOWN";
}

} // namespace anpwba
