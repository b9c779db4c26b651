#include "auth_verifier.h"

#include "anpwba_util.h"
#include "did_document.h"
#include "signature_codec.h"

#include <cstdlib>

namespace anpwba {

static VerifyResult fail(VerifyRc rc, const std::string& msg, const std::string& detail = "") {
  VerifyResult r;
  r.valid = false;
  r.rc = rc;
  r.message = msg;
  r.detail = detail;
  return r;
}

static VerifyResult verify_common(const std::string& header,
                                  const DidDocument& doc,
                                  const std::string& service_domain,
                                  const std::string* own_did)
{
  const bool two_way = (own_did != nullptr);

  // 1) Parse header
  const HeaderParseResult pr = two_way ? parse_two_way(header) : parse_single_way(header);
  if (!pr.ok) {
    const VerifyRc rc = (pr.rc == HeaderRc::MISSING_FIELD) ? VerifyRc::MISSING_FIELD : VerifyRc::HEADER_PARSE;
    return fail(rc, pr.detail, header_rc_str(pr.rc));
  }
  const AuthHeaderParts& parts = pr.parts;

  // 2) Audience binding (two-way only)
  if (two_way && parts.resp_did != *own_did) {
    return fail(VerifyRc::RESP_DID_MISMATCH, "resp_did mismatch");
  }

  // 3) Document must belong to the caller
  if (doc.id != parts.did) {
    return fail(VerifyRc::DID_MISMATCH, "DID document does not match header did");
  }

  // 4) Verification method
  const VerificationMethod* vm = nullptr;
  try {
    vm = &resolve_verification_method(doc, parts.verification_method);
  } catch (const VerificationMethodNotFound& e) {
    return fail(VerifyRc::VM_NOT_FOUND, e.what());
  }

  // 5) Canonical bytes (must match signer)
  std::string canonical;
  try {
    canonical = two_way ? canonical_two_way(parts, service_domain)
                        : canonical_single_way(parts, service_domain);
  } catch (const std::exception& e) {
    return fail(VerifyRc::CANONICAL_BUILD, "canonical build failed", e.what());
  }

  // 6) Signature
  bool sig_ok = false;
  try {
    sig_ok = verify_signature(canonical, parts.signature, vm->public_key_jwk);
  } catch (const KeyError& e) {
    return fail(VerifyRc::KEY_INVALID, "Signature verification failed", e.what());
  } catch (const std::exception& e) {
    return fail(VerifyRc::INTERNAL, "Signature verification failed", e.what());
  }
  if (!sig_ok) {
    return fail(VerifyRc::SIG_INVALID, "Signature verification failed");
  }

  VerifyResult out;
  out.valid = true;
  out.rc = VerifyRc::OK;
  out.message = "Signature verification successful";
  out.payload = parts;
  return out;
}

VerifyResult verify_single_way(const std::string& header,
                               const DidDocument& doc,
                               const std::string& service_domain) {
  return verify_common(header, doc, service_domain, nullptr);
}

VerifyResult verify_two_way(const std::string& header,
                            const DidDocument& doc,
                            const std::string& service_domain,
                            const std::string& own_did) {
  return verify_common(header, doc, service_domain, &own_did);
}

static bool parse_epoch_seconds(const std::string& s, long* out) {
  if (s.empty() || s.size() > 18) return false;
  size_t i = (s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  for (size_t k = i; k < s.size(); k++) {
    if (s[k] < '0' || s[k] > '9') return false;
  }
  *out = std::strtol(s.c_str(), nullptr, 10);
  return true;
}

bool verify_timestamp(const std::string& ts_in, const TimestampPolicy& policy) {
  const std::string ts = trim_ws(ts_in);

  long t = 0;
  if (!parse_epoch_seconds(ts, &t)) {
    auto iso = parse_iso8601_utc(ts);
    if (!iso) return false;
    t = *iso;
  }

  const long now = (policy.now_unix_sec != 0) ? policy.now_unix_sec : now_epoch();
  const long diff = (now > t) ? (now - t) : (t - now);
  return diff <= policy.window_sec;
}

std::string verify_rc_str(VerifyRc rc) {
  switch (rc) {
    case VerifyRc::OK: return "OK";
    case VerifyRc::HEADER_PARSE: return "HEADER_PARSE";
    case VerifyRc::MISSING_FIELD: return "MISSING_FIELD";
    case VerifyRc::DID_MISMATCH: return "DID_MISMATCH";
    case VerifyRc::VM_NOT_FOUND: return "VM_NOT_FOUND";
    case VerifyRc::KEY_INVALID: return "KEY_INVALID";
    case VerifyRc::CANONICAL_BUILD: return "CANONICAL_BUILD";
    case VerifyRc::SIG_INVALID: return "SIG_INVALID";
    case VerifyRc::RESP_DID_MISMATCH: return "RESP_DID_MISMATCH";
    case VerifyRc::INTERNAL: return "INTERNAL";
  }
  return "UNKNOWN";
}

} // namespace anpwba
