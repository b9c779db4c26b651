#include "auth_responder.h"

#include "anpwba_util.h"
#include "auth_header.h"
#include "local_identity.h"
#include "signature_codec.h"

#include <algorithm>
#include <iostream>
#include <limits>

#include <nlohmann/json.hpp>

namespace anpwba {
using json = nlohmann::json;

std::string responder_rc_str(ResponderRc rc) {
  switch (rc) {
    case ResponderRc::OK: return "OK";
    case ResponderRc::NO_HEADER: return "NO_HEADER";
    case ResponderRc::BAD_SCHEME: return "BAD_SCHEME";
    case ResponderRc::HEADER_PARSE: return "HEADER_PARSE";
    case ResponderRc::TOKEN_INVALID: return "TOKEN_INVALID";
    case ResponderRc::TIMESTAMP: return "TIMESTAMP";
    case ResponderRc::NONCE_REPLAY: return "NONCE_REPLAY";
    case ResponderRc::DID_UNRESOLVED: return "DID_UNRESOLVED";
    case ResponderRc::VERIFY_FAILED: return "VERIFY_FAILED";
    case ResponderRc::RESP_DID_MISMATCH: return "RESP_DID_MISMATCH";
  }
  return "UNKNOWN";
}

AuthResponder::AuthResponder(AuthResponderContext ctx) : ctx_(std::move(ctx)) {}

int AuthResponder::nonce_ttl_sec() const {
  // A nonce must outlive every timestamp that can still pass the window.
  const long floor_sec = 2 * std::max(0L, ctx_.timestamps.window_sec);
  const long ttl = std::max<long>(ctx_.nonce_ttl_sec, floor_sec);
  return static_cast<int>(std::min<long>(ttl, std::numeric_limits<int>::max()));
}

ResponderResult AuthResponder::reject(const std::string& caller_did,
                                      int status,
                                      ResponderRc rc,
                                      const std::string& detail) const {
  ResponderResult r;
  r.status = status;
  r.rc = rc;
  r.caller_did = caller_did;
  r.detail = detail;

  std::cerr << "[responder] deny " << (caller_did.empty() ? "-" : shorten(caller_did))
            << " rc=" << responder_rc_str(rc) << " status=" << status << " detail=" << detail << std::endl;

  audit_emit(ctx_.audit, AuditLog::MinLevel::SECURITY,
             rc == ResponderRc::NONCE_REPLAY ? "auth.nonce_replay" : "auth.verify_fail",
             status == 403 ? "deny" : "fail",
             {{"did", shorten(caller_did)}, {"rc", responder_rc_str(rc)}, {"status", std::to_string(status)}});
  return r;
}

ResponderResult AuthResponder::handle_bearer(const std::string& token, LocalIdentity& own) const {
  const auto peer = own.ledger->match_token_to_remote(token);
  if (!peer) return reject("", 401, ResponderRc::TOKEN_INVALID, "invalid or expired token");

  ResponderResult r;
  r.status = 200;
  r.rc = ResponderRc::OK;
  r.caller_did = *peer;
  r.mode = "bearer";
  r.detail = "token accepted";
  return r;
}

ResponderResult AuthResponder::handle(const std::string& authorization,
                                      const std::string& service_domain,
                                      LocalIdentity& own) {
  const std::string auth = trim_ws(authorization);
  if (auth.empty()) return reject("", 401, ResponderRc::NO_HEADER, "missing Authorization header");

  if (auth.size() > 7 && iequals(auth.substr(0, 7), "bearer ")) {
    return handle_bearer(trim_ws(auth.substr(7)), own);
  }
  if (auth.rfind(std::string(kAuthScheme) + " ", 0) != 0) {
    return reject("", 401, ResponderRc::BAD_SCHEME, "unsupported authorization scheme");
  }

  // 1) parse
  HeaderParseResult pr = parse_two_way(auth);
  const bool two_way = pr.ok;
  if (!two_way) {
    pr = parse_single_way(auth);
    if (!pr.ok) return reject("", 401, ResponderRc::HEADER_PARSE, pr.detail);
  }
  const AuthHeaderParts& p = pr.parts;

  // 2) timestamp
  if (!verify_timestamp(p.timestamp, ctx_.timestamps)) {
    return reject(p.did, 401, ResponderRc::TIMESTAMP, "timestamp outside window");
  }

  // 3) replay. Recorded only once the signature has verified.
  const std::string nonce_key = p.did + "|" + p.nonce;
  if (ctx_.nonces && ctx_.nonces->seen(nonce_key, nonce_ttl_sec())) {
    return reject(p.did, 403, ResponderRc::NONCE_REPLAY, "nonce already used");
  }

  // 4) caller DID document
  if (!supports_method(p.did)) {
    return reject(p.did, 401, ResponderRc::DID_UNRESOLVED, "unsupported DID method");
  }
  std::optional<DidDocument> doc;
  if (ctx_.resolve_did) {
    try {
      doc = ctx_.resolve_did(p.did);
    } catch (const std::exception& e) {
      return reject(p.did, 401, ResponderRc::DID_UNRESOLVED, std::string("DID resolution failed: ") + e.what());
    }
  }
  if (!doc) return reject(p.did, 401, ResponderRc::DID_UNRESOLVED, "cannot resolve DID document");

  // 5) signature
  const VerifyResult vr = two_way ? verify_two_way(auth, *doc, service_domain, own.did)
                                  : verify_single_way(auth, *doc, service_domain);
  if (!vr.valid) {
    if (vr.rc == VerifyRc::RESP_DID_MISMATCH) {
      return reject(p.did, 403, ResponderRc::RESP_DID_MISMATCH, vr.message);
    }
    return reject(p.did, 401, ResponderRc::VERIFY_FAILED, vr.message);
  }
  if (ctx_.nonces && !ctx_.nonces->insert_if_absent(nonce_key, nonce_ttl_sec(), ctx_.nonce_max_pending)) {
    return reject(p.did, 403, ResponderRc::NONCE_REPLAY, "nonce already used");
  }

  // The counter-signing key is checked before anything is stored.
  std::string counter;
  if (two_way) {
    if (own.private_key_pem.empty()) throw ConfigurationError("no private key provisioned for " + own.did);
    try {
      const SigningKey key = SigningKey::from_pem(own.private_key_pem);
      counter = build_single_way(own.did, own.key_id, key, kCounterSignService);
    } catch (const KeyError& e) {
      throw ConfigurationError("unusable private key for " + own.did + ": " + e.what());
    }
  }

  // 6) token
  const std::string token = random_token_b64url(32);
  own.ledger->store_token_to_remote(p.did, token, ctx_.token_ttl_sec);

  audit_emit(ctx_.audit, AuditLog::MinLevel::SECURITY, "auth.verify_ok", "ok",
             {{"did", shorten(p.did)}, {"mode", two_way ? "two-way" : "single-way"}});
  audit_emit(ctx_.audit, AuditLog::MinLevel::INFO, "auth.token_issued", "ok",
             {{"did", shorten(p.did)}, {"ttl_sec", std::to_string(ctx_.token_ttl_sec)}});

  // 7) reply
  ResponderResult r;
  r.status = 200;
  r.rc = ResponderRc::OK;
  r.caller_did = p.did;
  r.mode = two_way ? "two-way" : "single-way";
  r.detail = vr.message;

  if (!two_way) {
    r.authorization = "bearer " + token;
  } else {
    json item = {
      {"access_token", token},
      {"token_type", "bearer"},
      {"req_did", p.did},
      {"resp_did", own.did},
      {"resp_did_auth_header", {{"Authorization", counter}}},
    };
    r.authorization = json::array({item}).dump();
  }

  std::cerr << "[responder] " << r.mode << " ok for " << shorten(p.did) << std::endl;
  return r;
}

DidFetcher default_did_resolver(const LocalIdentityStore& identities, int timeout_sec) {
  return chain_fetchers({identities.local_fetcher(), http_did_fetcher(timeout_sec)});
}

} // namespace anpwba
