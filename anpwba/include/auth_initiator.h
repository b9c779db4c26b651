#pragma once

#include "audit_log.h"
#include "auth_verifier.h"
#include "did_document.h"
#include "http_transport.h"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace anpwba {

struct LocalIdentity;
class LocalIdentityStore;
class SigningKey;

struct AuthRequest {
    std::string caller_did;
    std::string target_did;
    std::string url;
    std::string method = "GET";
    std::optional<nlohmann::json> json_body;
    httplib::Headers custom_headers;
    bool use_two_way = true;
};

struct AuthAttempt {
    std::string mode; // "bearer" | "two-way" | "single-way"
    int status = 0;
};

struct AuthOutcome {
    int status = 0;
    std::string response;  // response body as received
    std::string info;      // short, no secrets
    bool is_auth_pass = false;
    std::string auth_mode; // mode of the final attempt, "" if none was sent
    std::vector<AuthAttempt> attempts;
};

// auth_value is one of:
//   "no auth header" | "single-way" | "two-way" | "json parse failed"
struct TokenParseResult {
    std::string auth_value;
    std::optional<std::string> token;
    nlohmann::json two_way; // parsed two-way object when auth_value == "two-way"
};

// Never throws.
TokenParseResult parse_token_from_response(const httplib::Headers& response_headers);

// custom headers, then Authorization / Content-Type / X-DID-Caller on top.
// The auth layer owns these three: custom Authorization and Content-Type are
// always dropped (case-insensitive), a custom X-DID-Caller is kept only when
// caller_did is "". Every other custom header passes through unchanged.
httplib::Headers merge_headers(const httplib::Headers& custom,
                               const std::string& authorization,
                               const std::string& caller_did);

struct AuthInitiatorContext {
    LocalIdentityStore* identities = nullptr; // required
    Transport send;                           // required
    DidFetcher resolve_did;                   // for counter-signature checks
    AuditLog* audit = nullptr;

    TimestampPolicy timestamps;               // applied to counter-signatures
    bool reuse_cached_tokens = true;
};

/*
AuthInitiator
=============

Outbound side of DIDWba:

  INIT
    -> [cached token] BEARER        2xx: pass  401/403: revoke, continue
    -> TRY_TWO_WAY                  2xx: pass  401/403: TRY_SINGLE_WAY
    -> TRY_SINGLE_WAY               2xx: pass  401/403: fail

Any other status ends the run with is_auth_pass=false. Transport failures
end it with status 500.

A token received on success is stored in the caller's ledger as a
"from remote" token for target_did. A two-way reply that carries a
counter-signature is a pass only when that signature verifies as
target_did; otherwise the run fails and the token is discarded. A reply
without one is accepted as single-way.

Throws ConfigurationError when the caller DID has no local identity or no
usable private key. Everything else is reported in AuthOutcome.
*/
class AuthInitiator {
public:
    explicit AuthInitiator(AuthInitiatorContext ctx);

    AuthOutcome send(const AuthRequest& req);

    // Drop every cached signer. Next request reloads the PEM.
    void clear_cache();
    std::size_t cached_signers() const;

private:
    AuthInitiatorContext ctx_;

    mutable std::mutex mu_; // protects signers_
    std::map<std::string, std::shared_ptr<const SigningKey>> signers_;

    std::shared_ptr<const SigningKey> signer_for(const LocalIdentity& id);

    HttpResponse exchange(const AuthRequest& req, const std::string& authorization);

    AuthOutcome run(const AuthRequest& req,
                    LocalIdentity& id,
                    const SigningKey& key,
                    const std::string& service_domain);

    AuthOutcome on_two_way_ok(const AuthRequest& req, LocalIdentity& id, AuthOutcome out, const HttpResponse& r);
    AuthOutcome on_single_way_ok(const AuthRequest& req, LocalIdentity& id, AuthOutcome out, const HttpResponse& r);

    bool verify_counter_signature(const std::string& header,
                                  const std::string& expected_did,
                                  const std::string& own_did) const;

    void finish(const AuthRequest& req, const AuthOutcome& out) const;
};

} // namespace anpwba
