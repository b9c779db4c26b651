#pragma once

#include "audit_log.h"
#include "auth_verifier.h"
#include "did_document.h"
#include "nonce_cache.h"

#include <cstddef>
#include <string>

namespace anpwba {

struct LocalIdentity;
class LocalIdentityStore;

enum class ResponderRc : int {
  OK = 0,

  NO_HEADER = 10,
  BAD_SCHEME = 11,
  HEADER_PARSE = 12,

  TOKEN_INVALID = 20,

  TIMESTAMP = 30,
  NONCE_REPLAY = 31,

  DID_UNRESOLVED = 40,
  VERIFY_FAILED = 41,
  RESP_DID_MISMATCH = 42,
};

struct ResponderResult {
  int status = 401;
  ResponderRc rc = ResponderRc::VERIFY_FAILED;

  // Value for the response Authorization header; "" when nothing is issued.
  std::string authorization;
  std::string caller_did;
  std::string mode;   // "bearer" | "single-way" | "two-way"
  std::string detail; // short, no secrets
};

struct AuthResponderContext {
  DidFetcher resolve_did;        // required
  AuditLog* audit = nullptr;
  NonceCache* nonces = nullptr;  // nullptr disables replay protection

  TimestampPolicy timestamps;
  // Raised to 2 * timestamps.window_sec when lower.
  int nonce_ttl_sec = 600;
  std::size_t nonce_max_pending = 100000;
  long token_ttl_sec = 1800;
};

/*
AuthResponder
=============

Server side of DIDWba for one local identity.

Authorization forms accepted:
  Bearer <token>     : must match a valid token this identity issued earlier.
  DIDWba ...         : single-way, or two-way when resp_did is present.

DIDWba pipeline:
  1) parse (two-way if resp_did present)
  2) timestamp window
  3) nonce replay check ("<did>|<nonce>")
  4) resolve caller DID document
  5) verify signature (service = service_domain), then record the nonce
  6) mint token, store_token_to_remote(caller, token, token_ttl)
  7) reply:
       single-way: "bearer <token>"
       two-way:    [{"access_token","token_type":"bearer","req_did","resp_did",
                     "resp_did_auth_header":{"Authorization":"DIDWba ..."}}]
     The counter-signature is a single-way header from this identity to
     the caller, bound to service "virtual.WBAback".

Status: 200 ok, 403 resp_did mismatch or replay, 401 everything else.
Throws ConfigurationError only when a two-way reply must be signed and the
identity has no usable key.
*/
class AuthResponder {
public:
  explicit AuthResponder(AuthResponderContext ctx);

  ResponderResult handle(const std::string& authorization,
                         const std::string& service_domain,
                         LocalIdentity& own);

private:
  AuthResponderContext ctx_;

  ResponderResult reject(const std::string& caller_did, int status, ResponderRc rc, const std::string& detail) const;
  ResponderResult handle_bearer(const std::string& token, LocalIdentity& own) const;
  int nonce_ttl_sec() const;
};

std::string responder_rc_str(ResponderRc rc);

// Local identities first, then the network. did:wba:localhost... and IP
// hosts are fetched over plain http.
DidFetcher default_did_resolver(const LocalIdentityStore& identities, int timeout_sec);

} // namespace anpwba
