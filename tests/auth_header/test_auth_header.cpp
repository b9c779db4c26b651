// tests/auth_header/test_auth_header.cpp
//
// DIDWba header codec:
// - canonical payloads are sorted-key compact JSON
// - build -> parse keeps every field, in wire order
// - single-way vs two-way discrimination via resp_did
// - grammar errors map to stable rc values

#include <cstdio>
#include <string>

#include <sodium.h>

#include "../common/test_support.h"
#include "auth_header.h"

using namespace anpwba;

static const char* kAlice = "did:wba:localhost%3A9527:wba:user:alice";
static const char* kBob = "did:wba:localhost%3A9527:wba:user:bob";

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "[auth_header] sodium_init failed\n");
        return 2;
    }
    int failures = 0;

    // Canonical forms
    {
        AuthHeaderParts p;
        p.did = "did:wba:a";
        p.nonce = "n1";
        p.timestamp = "2025-01-01T00:00:00.000Z";
        EXPECT_TRUE("auth_header", canonical_single_way(p, "example.com") ==
            R"({"did":"did:wba:a","nonce":"n1","service":"example.com","timestamp":"2025-01-01T00:00:00.000Z"})");

        p.resp_did = "did:wba:b";
        EXPECT_TRUE("auth_header", canonical_two_way(p, "example.com") ==
            R"({"anp_service":"example.com","did":"did:wba:a","nonce":"n1","resp_did":"did:wba:b","timestamp":"2025-01-01T00:00:00.000Z"})");
    }

    const SigningKey key = SigningKey::from_pem(testutil::generate_key_pem());

    // Single-way build / parse
    {
        const std::string h = build_single_way(kAlice, "key-1", key, "localhost");
        EXPECT_TRUE("auth_header", h.rfind("DIDWba did=\"", 0) == 0);
        EXPECT_TRUE("auth_header", h.find("resp_did") == std::string::npos);
        EXPECT_TRUE("auth_header", h.find("did=") < h.find("nonce=") &&
                                   h.find("nonce=") < h.find("timestamp=") &&
                                   h.find("timestamp=") < h.find("verification_method=") &&
                                   h.find("verification_method=") < h.find("signature="));

        const HeaderParseResult r = parse_single_way(h);
        EXPECT_TRUE("auth_header", r.ok);
        EXPECT_TRUE("auth_header", r.parts.did == kAlice);
        EXPECT_TRUE("auth_header", r.parts.nonce.size() == 32);
        EXPECT_TRUE("auth_header", parse_iso8601_utc(r.parts.timestamp).has_value());
        EXPECT_TRUE("auth_header", r.parts.verification_method == "key-1");
        EXPECT_TRUE("auth_header", !r.parts.is_two_way());

        const HeaderParseResult r2 = parse_two_way(h);
        EXPECT_TRUE("auth_header", !r2.ok);
        EXPECT_TRUE("auth_header", r2.rc == HeaderRc::MISSING_FIELD);
        EXPECT_TRUE("auth_header", r2.field == "resp_did");
        EXPECT_TRUE("auth_header", r2.detail == "Missing required field: resp_did");
    }

    // Two-way build / parse
    {
        const std::string h = build_two_way(kAlice, kBob, "key-1", key, "localhost");
        EXPECT_TRUE("auth_header", h.find("timestamp=") < h.find("resp_did=") &&
                                   h.find("resp_did=") < h.find("verification_method="));

        const HeaderParseResult r = parse_two_way(h);
        EXPECT_TRUE("auth_header", r.ok);
        EXPECT_TRUE("auth_header", r.parts.resp_did == kBob);
        EXPECT_TRUE("auth_header", r.parts.is_two_way());

        // single-way parsing of a two-way header ignores resp_did
        const HeaderParseResult r1 = parse_single_way(h);
        EXPECT_TRUE("auth_header", r1.ok);
        EXPECT_TRUE("auth_header", r1.parts.resp_did.empty());
    }

    // Fresh nonce per header
    {
        const auto a = parse_single_way(build_single_way(kAlice, "key-1", key, "localhost"));
        const auto b = parse_single_way(build_single_way(kAlice, "key-1", key, "localhost"));
        EXPECT_TRUE("auth_header", a.ok && b.ok && a.parts.nonce != b.parts.nonce);
    }

    // Grammar
    {
        const auto ws = parse_single_way(
            "  DIDWba did = \"did:wba:x\" ,nonce=\"n\",  timestamp=\"t\",verification_method=\"did:wba:x#key-2\", signature=\"s\"  ");
        EXPECT_TRUE("auth_header", ws.ok);
        EXPECT_TRUE("auth_header", ws.parts.verification_method == "key-2");

        const auto esc = parse_single_way(
            R"(DIDWba did="a\"b,c", nonce="n", timestamp="t", verification_method="key-1", signature="s")");
        EXPECT_TRUE("auth_header", esc.ok && esc.parts.did == "a\"b,c");

        AuthHeaderParts p;
        p.did = "x\"y\\z";
        p.nonce = "n";
        p.timestamp = "t";
        p.verification_method = "key-1";
        p.signature = "s";
        const auto back = parse_single_way(format_auth_header(p));
        EXPECT_TRUE("auth_header", back.ok && back.parts.did == p.did);

        EXPECT_TRUE("auth_header", parse_single_way("Bearer abc").rc == HeaderRc::BAD_SCHEME);
        EXPECT_TRUE("auth_header", parse_single_way("didwba did=\"x\"").rc == HeaderRc::BAD_SCHEME);
        EXPECT_TRUE("auth_header", parse_single_way("").rc == HeaderRc::BAD_SCHEME);
        EXPECT_TRUE("auth_header", parse_single_way("DIDWba did=x").rc == HeaderRc::SYNTAX);
        EXPECT_TRUE("auth_header", parse_single_way("DIDWba did=\"x").rc == HeaderRc::SYNTAX);
        EXPECT_TRUE("auth_header", parse_single_way("DIDWba did=\"x\" nonce=\"y\"").rc == HeaderRc::SYNTAX);
        EXPECT_TRUE("auth_header", parse_single_way("DIDWba did=\"x\", did=\"y\"").rc == HeaderRc::DUPLICATE_FIELD);

        const auto missing = parse_single_way("DIDWba did=\"x\", nonce=\"\", timestamp=\"t\"");
        EXPECT_TRUE("auth_header", missing.rc == HeaderRc::MISSING_FIELD && missing.field == "nonce");

        const auto no_sig = parse_single_way(
            "DIDWba did=\"x\", nonce=\"n\", timestamp=\"t\", verification_method=\"key-1\"");
        EXPECT_TRUE("auth_header", no_sig.rc == HeaderRc::MISSING_FIELD && no_sig.field == "signature");
    }

    if (failures) {
        std::fprintf(stderr, "[auth_header] %d failure(s)\n", failures);
        return 1;
    }
    std::fprintf(stderr, "[auth_header] OK\n");
    return 0;
}
