#pragma once

#include <string>

namespace anpwba {

class SigningKey;

inline constexpr const char* kAuthScheme = "DIDWba";

// Service domain a responder's counter-signature is bound to.
inline constexpr const char* kCounterSignService = "virtual.WBAback";

enum class HeaderRc : int {
  OK = 0,

  BAD_SCHEME = 10,
  SYNTAX = 11,
  DUPLICATE_FIELD = 12,
  MISSING_FIELD = 13,
};

// Fields of one DIDWba header. resp_did is empty for single-way.
// verification_method holds the fragment only ("key-1").
struct AuthHeaderParts {
  std::string did;
  std::string nonce;
  std::string timestamp;
  std::string resp_did;
  std::string verification_method;
  std::string signature;

  bool is_two_way() const { return !resp_did.empty(); }
};

struct HeaderParseResult {
  bool ok = false;
  HeaderRc rc = HeaderRc::SYNTAX;

  std::string field;  // set for MISSING_FIELD / DUPLICATE_FIELD
  std::string detail; // short, no secrets

  AuthHeaderParts parts;
};

// Canonical bytes that get signed. Sorted-key compact JSON:
//   single-way: {did, nonce, service, timestamp}
//   two-way:    {anp_service, did, nonce, resp_did, timestamp}
std::string canonical_single_way(const AuthHeaderParts& p, const std::string& service_domain);
std::string canonical_two_way(const AuthHeaderParts& p, const std::string& service_domain);

// Serialize in wire order:
// did, nonce, timestamp, [resp_did,] verification_method, signature
std::string format_auth_header(const AuthHeaderParts& p);

// Sign p in place for service_domain. Mode follows p.is_two_way().
void sign_auth_parts(AuthHeaderParts& p, const SigningKey& key, const std::string& service_domain);

// Fresh nonce (16 random bytes, hex) and timestamp (now, ISO-8601 ms).
std::string build_single_way(const std::string& did,
                             const std::string& key_fragment,
                             const SigningKey& key,
                             const std::string& service_domain);

std::string build_two_way(const std::string& did,
                          const std::string& resp_did,
                          const std::string& key_fragment,
                          const SigningKey& key,
                          const std::string& service_domain);

// Never throw. parse_single_way ignores a resp_did field if one is present;
// parse_two_way requires it and reports MISSING_FIELD("resp_did") otherwise.
HeaderParseResult parse_single_way(const std::string& header);
HeaderParseResult parse_two_way(const std::string& header);

std::string header_rc_str(HeaderRc rc);

} // namespace anpwba
