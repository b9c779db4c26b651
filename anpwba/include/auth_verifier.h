#pragma once

#include "auth_header.h"

#include <optional>
#include <string>

namespace anpwba {

struct DidDocument;

enum class VerifyRc : int {
  OK = 0,

  HEADER_PARSE = 10,
  MISSING_FIELD = 11,

  DID_MISMATCH = 20,

  VM_NOT_FOUND = 30,
  KEY_INVALID = 31,

  CANONICAL_BUILD = 40,
  SIG_INVALID = 41,

  RESP_DID_MISMATCH = 50,

  INTERNAL = 99,
};

struct VerifyResult {
  bool valid = false;
  VerifyRc rc = VerifyRc::INTERNAL;

  std::string message; // stable, user-facing
  std::string detail;  // short, no secrets

  std::optional<AuthHeaderParts> payload; // set when valid
};

// Never throw. Every failure is reported through VerifyResult.
VerifyResult verify_single_way(const std::string& header,
                               const DidDocument& doc,
                               const std::string& service_domain);

// As above, plus resp_did must equal own_did ("resp_did mismatch").
VerifyResult verify_two_way(const std::string& header,
                            const DidDocument& doc,
                            const std::string& service_domain,
                            const std::string& own_did);

struct TimestampPolicy {
  long window_sec = 300;

  // 0 => use anpwba::now_epoch()
  long now_unix_sec = 0;
};

// Epoch seconds or ISO-8601. Valid iff |now - ts| <= window_sec.
// Malformed input returns false.
bool verify_timestamp(const std::string& ts, const TimestampPolicy& policy = TimestampPolicy{});

std::string verify_rc_str(VerifyRc rc);

} // namespace anpwba
