#include "auth_initiator.h"

#include "anpwba_util.h"
#include "auth_header.h"
#include "local_identity.h"
#include "signature_codec.h"

#include <iostream>

namespace anpwba {
using json = nlohmann::json;

static bool is_2xx(int s) { return s >= 200 && s < 300; }
static bool is_denied(int s) { return s == 401 || s == 403; }

TokenParseResult parse_token_from_response(const httplib::Headers& response_headers) {
    TokenParseResult r;

    const std::string auth = trim_ws(header_value(response_headers, "Authorization"));
    if (auth.empty()) {
        r.auth_value = "no auth header";
        return r;
    }

    // "Bearer <token>", any case, any run of whitespace.
    if (auth.size() > 6 && iequals(auth.substr(0, 6), "bearer") && (auth[6] == ' ' || auth[6] == '\t')) {
        const std::string tok = trim_ws(auth.substr(7));
        if (!tok.empty()) {
            r.auth_value = "single-way";
            r.token = tok;
            return r;
        }
    }

    json j = json::parse(auth, nullptr, false);
    if (j.is_array()) j = j.empty() ? json() : j[0];
    if (j.is_discarded() || !j.is_object()) {
        r.auth_value = "json parse failed";
        return r;
    }

    if (j.contains("access_token") && j["access_token"].is_string()) {
        r.token = j["access_token"].get<std::string>();
    }
    if (j.contains("resp_did_auth_header")) {
        r.auth_value = "two-way";
        r.two_way = j;
    } else {
        r.auth_value = "single-way";
    }
    return r;
}

httplib::Headers merge_headers(const httplib::Headers& custom,
                               const std::string& authorization,
                               const std::string& caller_did) {
    httplib::Headers out;
    for (const auto& kv : custom) {
        if (iequals(kv.first, "Authorization") || iequals(kv.first, "Content-Type")) continue;
        if (iequals(kv.first, "X-DID-Caller") && !caller_did.empty()) continue;
        out.emplace(kv.first, kv.second);
    }
    out.emplace("Authorization", authorization);
    out.emplace("Content-Type", "application/json");
    if (!caller_did.empty()) out.emplace("X-DID-Caller", caller_did);
    return out;
}

AuthInitiator::AuthInitiator(AuthInitiatorContext ctx) : ctx_(std::move(ctx)) {}

void AuthInitiator::clear_cache() {
    std::lock_guard<std::mutex> lk(mu_);
    signers_.clear();
}

std::size_t AuthInitiator::cached_signers() const {
    std::lock_guard<std::mutex> lk(mu_);
    return signers_.size();
}

std::shared_ptr<const SigningKey> AuthInitiator::signer_for(const LocalIdentity& id) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = signers_.find(id.did);
        if (it != signers_.end()) return it->second;
    }

    std::shared_ptr<const SigningKey> key;
    try {
        key = std::make_shared<const SigningKey>(SigningKey::from_pem(id.private_key_pem));
    } catch (const KeyError& e) {
        throw ConfigurationError("unusable private key for " + id.did + ": " + e.what());
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto ins = signers_.emplace(id.did, key);
    return ins.first->second;
}

HttpResponse AuthInitiator::exchange(const AuthRequest& req, const std::string& authorization) {
    HttpRequest hr;
    hr.method = req.method.empty() ? "GET" : req.method;
    hr.url = req.url;
    hr.headers = merge_headers(req.custom_headers, authorization, req.caller_did);
    if (req.json_body) hr.body = req.json_body->dump();
    return ctx_.send(hr);
}

bool AuthInitiator::verify_counter_signature(const std::string& header,
                                             const std::string& expected_did,
                                             const std::string& own_did) const {
    HeaderParseResult pr = parse_two_way(header);
    if (!pr.ok) pr = parse_single_way(header);
    if (!pr.ok) {
        std::cerr << "[initiator] counter-signature unparseable: " << pr.detail << std::endl;
        return false;
    }
    if (pr.parts.did != expected_did) {
        std::cerr << "[initiator] counter-signature from " << shorten(pr.parts.did)
                  << ", expected " << shorten(expected_did) << std::endl;
        return false;
    }
    if (!verify_timestamp(pr.parts.timestamp, ctx_.timestamps)) {
        std::cerr << "[initiator] counter-signature timestamp outside window" << std::endl;
        return false;
    }
    if (!ctx_.resolve_did) {
        std::cerr << "[initiator] no DID resolver configured, counter-signature unchecked" << std::endl;
        return false;
    }

    std::optional<DidDocument> doc;
    try {
        doc = ctx_.resolve_did(pr.parts.did);
    } catch (const std::exception& e) {
        std::cerr << "[initiator] resolving " << shorten(pr.parts.did) << " failed: " << e.what() << std::endl;
        return false;
    }
    if (!doc) {
        std::cerr << "[initiator] cannot resolve " << shorten(pr.parts.did) << std::endl;
        return false;
    }

    const VerifyResult vr = pr.parts.is_two_way()
        ? verify_two_way(header, *doc, kCounterSignService, own_did)
        : verify_single_way(header, *doc, kCounterSignService);
    if (!vr.valid) {
        std::cerr << "[initiator] counter-signature rejected: " << vr.message << std::endl;
    }
    return vr.valid;
}

AuthOutcome AuthInitiator::on_two_way_ok(const AuthRequest& req, LocalIdentity& id, AuthOutcome out, const HttpResponse& r) {
    const TokenParseResult tp = parse_token_from_response(r.headers);

    if (!tp.token) {
        if (tp.auth_value == "no auth header") {
            out.is_auth_pass = true;
            out.info = "200 without token, endpoint does not require auth";
        } else {
            out.is_auth_pass = false;
            out.info = "200 with unrecognized authorization (" + tp.auth_value + ")";
        }
        return out;
    }

    if (tp.auth_value != "two-way") {
        id.ledger->store_token_from_remote(req.target_did, *tp.token);
        out.is_auth_pass = true;
        out.auth_mode = "single-way";
        out.info = "responder answered single-way, stored token from " + shorten(req.target_did);
        return out;
    }

    // A counter-signature was sent: it must prove the responder is target_did.
    std::string counter;
    const json& h = tp.two_way["resp_did_auth_header"];
    if (h.is_object() && h.contains("Authorization") && h["Authorization"].is_string()) {
        counter = h["Authorization"].get<std::string>();
    }
    if (counter.empty() || !verify_counter_signature(counter, req.target_did, req.caller_did)) {
        out.is_auth_pass = false;
        out.info = "responder counter-signature invalid, token discarded";
        return out;
    }

    id.ledger->store_token_from_remote(req.target_did, *tp.token);
    out.is_auth_pass = true;
    out.info = "two-way auth ok, stored token from " + shorten(req.target_did);
    return out;
}

AuthOutcome AuthInitiator::on_single_way_ok(const AuthRequest& req, LocalIdentity& id, AuthOutcome out, const HttpResponse& r) {
    const TokenParseResult tp = parse_token_from_response(r.headers);

    if (!tp.token) {
        out.is_auth_pass = tp.auth_value == "no auth header";
        out.info = out.is_auth_pass ? "200 without token, endpoint does not require auth"
                                    : "200 with unrecognized authorization (" + tp.auth_value + ")";
        return out;
    }
    if (tp.auth_value != "single-way") {
        out.is_auth_pass = false;
        out.info = "200 with a non single-way token on single-way request";
        return out;
    }

    id.ledger->store_token_from_remote(req.target_did, *tp.token);
    out.is_auth_pass = true;
    out.info = "single-way auth ok, stored token from " + shorten(req.target_did);
    return out;
}

AuthOutcome AuthInitiator::run(const AuthRequest& req,
                               LocalIdentity& id,
                               const SigningKey& key,
                               const std::string& service_domain) {
    AuthOutcome out;

    // 0) cached token from an earlier handshake
    if (ctx_.reuse_cached_tokens && id.ledger->is_token_valid(req.target_did, TokenDirection::From)) {
        const auto rec = id.ledger->get_token_from_remote(req.target_did);
        const HttpResponse r = exchange(req, "Bearer " + rec->token);
        out.attempts.push_back({"bearer", r.status});
        out.status = r.status;
        out.response = r.body;
        out.auth_mode = "bearer";

        if (is_2xx(r.status)) {
            out.is_auth_pass = true;
            out.info = "cached token accepted";
            return out;
        }
        if (!is_denied(r.status)) {
            out.info = "unexpected status " + std::to_string(r.status) + " with cached token";
            return out;
        }
        std::cerr << "[initiator] cached token for " << shorten(req.target_did)
                  << " rejected (" << r.status << "), re-authenticating" << std::endl;
        id.ledger->revoke_token_from_remote(req.target_did);
        audit_emit(ctx_.audit, AuditLog::MinLevel::INFO, "ledger.revoke", "ok",
                   {{"peer", shorten(req.target_did)}, {"direction", "from"}, {"status", std::to_string(r.status)}});
    }

    // 1) two-way
    if (req.use_two_way) {
        const std::string header = build_two_way(id.did, req.target_did, id.key_id, key, service_domain);
        const HttpResponse r = exchange(req, header);
        out.attempts.push_back({"two-way", r.status});
        out.status = r.status;
        out.response = r.body;
        out.auth_mode = "two-way";

        if (is_2xx(r.status)) return on_two_way_ok(req, id, out, r);
        if (!is_denied(r.status)) {
            out.is_auth_pass = false;
            out.info = "unexpected status " + std::to_string(r.status);
            return out;
        }
        std::cerr << "[initiator] two-way rejected (" << r.status << "), falling back to single-way" << std::endl;
    }

    // 2) single-way
    const std::string header = build_single_way(id.did, id.key_id, key, service_domain);
    const HttpResponse r = exchange(req, header);
    out.attempts.push_back({"single-way", r.status});
    out.status = r.status;
    out.response = r.body;
    out.auth_mode = "single-way";

    if (is_2xx(r.status)) return on_single_way_ok(req, id, out, r);

    out.is_auth_pass = false;
    if (is_denied(r.status)) {
        out.info = req.use_two_way ? "both returned 401/403" : "single-way returned 401/403";
    } else {
        out.info = "unexpected status " + std::to_string(r.status);
    }
    return out;
}

void AuthInitiator::finish(const AuthRequest& req, const AuthOutcome& out) const {
    std::cerr << "[initiator] " << req.method << " " << req.url << " status=" << out.status
              << " pass=" << (out.is_auth_pass ? "true" : "false")
              << " mode=" << (out.auth_mode.empty() ? "-" : out.auth_mode)
              << " info=" << out.info << std::endl;

    audit_emit(ctx_.audit, AuditLog::MinLevel::INFO,
               out.is_auth_pass ? "initiator.pass" : "initiator.fail",
               out.is_auth_pass ? "ok" : "fail",
               {{"caller", shorten(req.caller_did)},
                {"target", shorten(req.target_did)},
                {"status", std::to_string(out.status)},
                {"mode", out.auth_mode},
                {"attempts", std::to_string(out.attempts.size())}});
}

AuthOutcome AuthInitiator::send(const AuthRequest& req) {
    if (!ctx_.identities) throw ConfigurationError("AuthInitiator has no identity store");
    if (!ctx_.send) throw ConfigurationError("AuthInitiator has no transport");

    // Configuration problems propagate to the caller.
    const auto id = ctx_.identities->identity_or_throw(req.caller_did);
    const auto key = signer_for(*id);

    AuthOutcome out;
    const std::string service_domain = url_host(req.url);
    if (service_domain.empty()) {
        out.status = 500;
        out.info = "malformed URL";
        finish(req, out);
        return out;
    }

    try {
        out = run(req, *id, *key, service_domain);
    } catch (const TransportError& e) {
        out.status = 500;
        out.is_auth_pass = false;
        out.info = std::string("request failed: ") + e.what();
    } catch (const std::exception& e) {
        // signing failures and transport implementations that throw their own types
        out.status = 500;
        out.is_auth_pass = false;
        out.info = std::string("auth flow error: ") + e.what();
    }

    finish(req, out);
    return out;
}

} // namespace anpwba
