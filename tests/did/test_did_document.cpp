// tests/did/test_did_document.cpp
//
// DID documents and did:wba identifiers:
// - parse_did_document tolerance / rejection
// - resolve_verification_method by fragment
// - colon and underscore DID spellings, document URLs
// - registry + chained fetchers

#include <cstdio>
#include <string>

#include <sodium.h>
#include <nlohmann/json.hpp>

#include "../common/test_support.h"
#include "did_document.h"

using json = nlohmann::json;
using namespace anpwba;

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "[did] sodium_init failed\n");
        return 2;
    }
    int failures = 0;

    // Documents
    {
        const json raw = json::parse(R"({
          "@context": ["https://www.w3.org/ns/did/v1"],
          "id": "did:wba:example.com:user:alice",
          "verificationMethod": [
            {"id": "did:wba:example.com:user:alice#key-1", "type": "EcdsaSecp256k1VerificationKey2019",
             "controller": "did:wba:example.com:user:alice",
             "publicKeyJwk": {"kty": "EC", "crv": "secp256k1", "x": "AA", "y": "AA"}},
            {"id": "did:wba:example.com:user:alice#no-jwk", "type": "X"},
            "junk"
          ],
          "authentication": ["did:wba:example.com:user:alice#key-1", {"id": "did:wba:example.com:user:alice#key-2"}],
          "service": [{"id": "#ad", "type": "AgentDescription"}]
        })");

        DidDocument doc;
        std::string err;
        EXPECT_TRUE("did", parse_did_document(raw, &doc, &err));
        EXPECT_TRUE("did", doc.id == "did:wba:example.com:user:alice");
        EXPECT_TRUE("did", doc.verification_methods.size() == 1);
        EXPECT_TRUE("did", doc.authentication.size() == 2);
        EXPECT_TRUE("did", doc.raw.contains("service"));

        EXPECT_TRUE("did", resolve_verification_method(doc, "key-1").type == "EcdsaSecp256k1VerificationKey2019");

        bool not_found = false;
        try {
            (void)resolve_verification_method(doc, "key-2");
        } catch (const VerificationMethodNotFound& e) {
            not_found = std::string(e.what()) == "Verification method not found: key-2" && e.fragment() == "key-2";
        }
        EXPECT_TRUE("did", not_found);

        EXPECT_TRUE("did", !parse_did_document(json::array(), &doc, &err));
        EXPECT_TRUE("did", !parse_did_document(json{{"verificationMethod", json::array()}}, &doc, &err));
        EXPECT_TRUE("did", !parse_did_document(json{{"id", "did:wba:x"}}, &doc, &err));
        EXPECT_TRUE("did", err == "did document has no usable verificationMethod");
    }

    // Non-string members in a peer's document are rejected, never thrown
    {
        const json jwk = {{"kty", "EC"}, {"crv", "secp256k1"}, {"x", "AA"}, {"y", "AA"}};
        const json bad_id = {
            {"id", "did:wba:evil.example:user:mallory"},
            {"verificationMethod", json::array({json{{"id", 5}, {"publicKeyJwk", jwk}}})},
        };
        const json bad_type = {
            {"id", "did:wba:evil.example:user:mallory"},
            {"verificationMethod", json::array({
                json{{"id", "did:wba:evil.example:user:mallory#key-1"}, {"type", json::array()}, {"publicKeyJwk", jwk}},
                json{{"id", "did:wba:evil.example:user:mallory#key-2"}, {"controller", 7}, {"publicKeyJwk", jwk}},
                json{{"id", "did:wba:evil.example:user:mallory#key-3"}, {"type", "JsonWebKey2020"}, {"publicKeyJwk", jwk}},
            })},
        };

        bool threw = false;
        DidDocument doc;
        std::string err;
        try {
            EXPECT_TRUE("did", !parse_did_document(bad_id, &doc, &err));
            EXPECT_TRUE("did", err == "did document has no usable verificationMethod");

            EXPECT_TRUE("did", parse_did_document(bad_type, &doc, &err));
            EXPECT_TRUE("did", doc.verification_methods.size() == 1);
            EXPECT_TRUE("did", doc.verification_methods[0].id == "did:wba:evil.example:user:mallory#key-3");
            EXPECT_TRUE("did", doc.verification_methods[0].controller == "did:wba:evil.example:user:mallory");
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[did] unexpected exception: %s\n", e.what());
            threw = true;
        }
        EXPECT_TRUE("did", !threw);
    }

    // make_did_document round trip through JSON
    {
        const auto t = testutil::make_identity("did:wba:localhost%3A9527:wba:user:bob");
        DidDocument back;
        EXPECT_TRUE("did", parse_did_document(t.doc.raw, &back));
        EXPECT_TRUE("did", back.id == t.doc.id);
        EXPECT_TRUE("did", back.verification_methods.size() == 1 &&
                           back.verification_methods[0].id == t.doc.id + "#key-1");
        EXPECT_TRUE("did", back.verification_methods[0].public_key_jwk == t.doc.verification_methods[0].public_key_jwk);
    }

    // Identifiers
    {
        EXPECT_TRUE("did", supports_method("did:wba:example.com"));
        EXPECT_TRUE("did", !supports_method("did:web:example.com"));
        EXPECT_TRUE("did", !supports_method("did:wba:"));

        const auto c = parse_did("did:wba:localhost%3A9527:wba:user:27c0b1d11180f973");
        EXPECT_TRUE("did", c && c->host == "localhost" && c->port == 9527 && c->port_explicit);
        EXPECT_TRUE("did", c && c->segments.size() == 3 && c->unique_id == "27c0b1d11180f973");
        EXPECT_TRUE("did", c && did_document_url(*c) == "http://localhost:9527/wba/user/27c0b1d11180f973/did.json");

        const auto u = parse_did("did:wba:localhost_9527_wba_user_27c0b1d11180f973");
        EXPECT_TRUE("did", u && u->host == "localhost" && u->port == 9527);
        EXPECT_TRUE("did", u && c && u->segments == c->segments);

        const auto remote = parse_did("did:wba:example.com:wba:user:abc");
        EXPECT_TRUE("did", remote && remote->port == 443 && !remote->port_explicit);
        EXPECT_TRUE("did", remote && did_document_url(*remote) == "https://example.com/wba/user/abc/did.json");

        const auto bare_local = parse_did("did:wba:localhost:wba:user:abc");
        EXPECT_TRUE("did", bare_local && bare_local->port == 9527);

        EXPECT_TRUE("did", !parse_did("did:wba:localhost%3Axyz:wba:user:a"));
        EXPECT_TRUE("did", !parse_did("did:wba:example.com::user"));
        EXPECT_TRUE("did", !parse_did("did:key:z6Mk"));

        EXPECT_TRUE("did", is_insecure_local_did("did:wba:localhost%3A9527:wba:user:a"));
        EXPECT_TRUE("did", is_insecure_local_did("did:wba:localhost:wba:user:a"));
        EXPECT_TRUE("did", !is_insecure_local_did("did:wba:example.com:wba:user:a"));
    }

    // Registry and chaining
    {
        const auto a = testutil::make_identity("did:wba:localhost%3A9527:wba:user:a");
        const auto b = testutil::make_identity("did:wba:localhost%3A9527:wba:user:b");

        DidDocumentRegistry r1, r2;
        r1.put(a.doc);
        r2.put(b.doc);
        EXPECT_TRUE("did", r1.size() == 1);

        const DidFetcher chained = chain_fetchers({r1.fetcher(), r2.fetcher()});
        EXPECT_TRUE("did", chained(a.did) && chained(a.did)->id == a.did);
        EXPECT_TRUE("did", chained(b.did) && chained(b.did)->id == b.did);
        EXPECT_TRUE("did", !chained("did:wba:localhost%3A9527:wba:user:c"));

        EXPECT_TRUE("did", r1.remove(a.did));
        EXPECT_TRUE("did", !r1.remove(a.did));
        EXPECT_TRUE("did", !chained(a.did));
    }

    if (failures) {
        std::fprintf(stderr, "[did] %d failure(s)\n", failures);
        return 1;
    }
    std::fprintf(stderr, "[did] OK\n");
    return 0;
}
