// tests/node/test_node.cpp
//
// Node wiring from a Config:
// - domains/wildcards/default host reach DomainPolicy, domains_path overrides
// - key_id reaches LocalIdentityStore, audit level reaches AuditLog
// - window, nonce and token settings reach the responder context
// - initiator and responder built from one Node complete a two-way handshake

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include <sodium.h>
#include <nlohmann/json.hpp>

#include "../common/test_support.h"
#include "http_transport.h"
#include "node.h"

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace anpwba;

static const char* kAlice = "did:wba:api.example.com%3A8443:wba:user:alice";
static const char* kBob = "did:wba:api.example.com%3A8443:wba:user:bob";

static void write_file(const fs::path& p, const std::string& s) {
    fs::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << s;
}

// Identity whose document lists its key under "key-2".
static void provision(const fs::path& users, const std::string& name, const std::string& did) {
    const std::string pem = testutil::generate_key_pem();
    const SigningKey key = SigningKey::from_pem(pem);
    const DidDocument doc = make_did_document(did, "key-2", key.verification_method_type(), key.public_jwk());
    write_file(users / ("user_" + name) / "did_document.json", doc.raw.dump(2));
    write_file(users / ("user_" + name) / "key-2_private.pem", pem);
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "[node] sodium_init failed\n");
        return 2;
    }
    int failures = 0;

    testutil::ScratchDir dir("node");
    const std::string cfg_path = dir.file("anpwba.json");
    {
        json j = {
            {"data_root", dir.file("data")},
            {"default_host", "api.example.com"},
            {"default_port", 8443},
            {"key_id", "key-2"},
            {"timestamp_window_sec", 120},
            {"nonce_ttl_sec", 30},
            {"nonce_max_pending", 50},
            {"token_ttl_sec", 900},
            {"http_timeout_sec", 3},
            {"audit_path", dir.file("audit.jsonl")},
            {"audit_min_level", "debug"},
            {"domains", {{"api.example.com", 8443}, {"Localhost", 9527}, {"bad.example.com", "x"}}},
            {"wildcards", json::array({"*.example.net", "example.org"})},
        };
        write_file(cfg_path, j.dump(2));
    }

    Config cfg;
    std::string err;
    EXPECT_TRUE("node", load_config_file(cfg_path, &cfg, &err));
    EXPECT_TRUE("node", cfg.domains.size() == 2 && cfg.domains.count("localhost") == 1);
    EXPECT_TRUE("node", cfg.wildcards.size() == 1 && cfg.wildcards[0] == "*.example.net");

    auto node = make_node(cfg);

    // Domains
    {
        const HostPort def = node->domains->default_host_port();
        EXPECT_TRUE("node", def.host == "api.example.com" && def.port == 8443);
        EXPECT_TRUE("node", node->domains->is_supported_domain("api.example.com", 8443));
        EXPECT_TRUE("node", !node->domains->is_supported_domain("api.example.com", 443));
        EXPECT_TRUE("node", node->domains->is_supported_domain("a.example.net"));
        EXPECT_TRUE("node", !node->domains->is_supported_domain("user.localhost"));
        EXPECT_TRUE("node", !node->domains->is_supported_domain("x.localhost"));
        EXPECT_TRUE("node", !node->domains->is_supported_domain("bad.example.com"));
    }

    // domains_path wins over the config sections; a broken one is ignored
    {
        write_file(dir.file("domains.json"), R"({"domains":{"other.example.org":443}})");
        Config c2 = cfg;
        c2.domains_path = dir.file("domains.json");
        const auto p2 = make_domain_policy(c2);
        EXPECT_TRUE("node", p2->is_supported_domain("other.example.org", 443));
        EXPECT_TRUE("node", !p2->is_supported_domain("api.example.com", 8443));

        c2.domains_path = dir.file("missing.json");
        const auto p3 = make_domain_policy(c2);
        EXPECT_TRUE("node", p3->is_supported_domain("api.example.com", 8443));
    }

    // Audit
    {
        EXPECT_TRUE("node", node->audit != nullptr);
        EXPECT_TRUE("node", node->audit && node->audit->min_level_str() == "DEBUG");
        EXPECT_TRUE("node", node->audit && node->audit->path() == dir.file("audit.jsonl"));

        Config quiet = cfg;
        quiet.audit_min_level = "loud";
        const auto a2 = make_audit_log(quiet);
        EXPECT_TRUE("node", a2 && a2->min_level_str() == "INFO");

        quiet.audit_path.clear();
        EXPECT_TRUE("node", make_audit_log(quiet) == nullptr);
    }

    // Contexts
    AuthResponderContext rctx = make_responder_context(*node);
    AuthInitiatorContext ictx = make_initiator_context(*node);
    {
        EXPECT_TRUE("node", rctx.timestamps.window_sec == 120);
        EXPECT_TRUE("node", rctx.nonce_ttl_sec == 30 && rctx.nonce_max_pending == 50);
        EXPECT_TRUE("node", rctx.token_ttl_sec == 900);
        EXPECT_TRUE("node", rctx.nonces == node->nonces.get() && rctx.audit == node->audit.get());
        EXPECT_TRUE("node", static_cast<bool>(rctx.resolve_did));

        EXPECT_TRUE("node", ictx.identities == node->identities.get());
        EXPECT_TRUE("node", ictx.timestamps.window_sec == 120);
        EXPECT_TRUE("node", static_cast<bool>(ictx.send) && static_cast<bool>(ictx.resolve_did));
    }

    // Identities under the default domain, with key-2
    {
        const DomainPaths paths = node->domains->all_data_paths("api.example.com", 8443);
        provision(paths.user_did_path, "alice", kAlice);
        provision(paths.user_did_path, "bob", kBob);

        EXPECT_TRUE("node", load_domain_identities(*node) == 2);
        EXPECT_TRUE("node", load_domain_identities(*node, "evil.example.com", 443) == 0);

        const auto a = node->identities->find(kAlice);
        EXPECT_TRUE("node", a && a->key_id == "key-2" && !a->private_key_pem.empty());
    }

    // Handshake between two identities of the same node
    {
        const auto bob_id = node->identities->find(kBob);
        EXPECT_TRUE("node", bob_id != nullptr);
        if (bob_id) {
            AuthResponder responder(rctx);
            ictx.send = [&](const HttpRequest& req) -> HttpResponse {
                const ResponderResult rr =
                    responder.handle(header_value(req.headers, "Authorization"), url_host(req.url), *bob_id);
                HttpResponse r;
                r.status = rr.status;
                if (!rr.authorization.empty()) r.headers.emplace("Authorization", rr.authorization);
                return r;
            };
            AuthInitiator init(ictx);

            AuthRequest req;
            req.caller_did = kAlice;
            req.target_did = kBob;
            req.url = "https://api.example.com:8443/wba/user/bob/inbox";

            const AuthOutcome out = init.send(req);
            EXPECT_TRUE("node", out.status == 200 && out.is_auth_pass && out.auth_mode == "two-way");

            const auto issued = bob_id->ledger->get_token_to_remote(kAlice);
            const auto created = issued ? parse_iso8601_utc(issued->created_at) : std::nullopt;
            const auto expires = issued ? parse_iso8601_utc(issued->expires_at) : std::nullopt;
            EXPECT_TRUE("node", created && expires && *expires - *created == 900);
            EXPECT_TRUE("node", node->nonces->size() == 1);
        }

        std::string chain_err;
        EXPECT_TRUE("node", node->audit && node->audit->verify_chain(&chain_err) >= 3);
    }

    if (failures) {
        std::fprintf(stderr, "[node] %d failure(s)\n", failures);
        return 1;
    }
    std::fprintf(stderr, "[node] OK\n");
    return 0;
}
