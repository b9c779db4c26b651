#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace anpwba {

/*
AuditEvent
==========

One authentication-relevant event.

Event names follow "<subsystem>.<action>":
  - "auth.verify_ok" / "auth.verify_fail"
  - "auth.token_issued"
  - "auth.nonce_replay"
  - "initiator.pass" / "initiator.fail"
  - "ledger.revoke"

Never put tokens, signatures, nonces or key material in f. DIDs, reason
codes and HTTP statuses are fine.
*/
struct AuditEvent {
    std::string ts_utc;   // filled by append() when empty
    std::string event;
    std::string outcome;  // "ok" | "fail" | "deny"
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL.

  line_hash_i = SHA256(line_hash_{i-1} || json_i_without_line_hash)

Genesis prev_hash is 64 zeros. The last line_hash is also kept in a small
state file so append() does not rescan the log.

Tamper-evident only: whoever can rewrite both files can rewrite history.
*/
class AuditLog {
public:
    // Ordering: DEBUG < INFO < ADMIN < SECURITY
    enum class MinLevel : int {
        DEBUG    = 0,
        INFO     = 1,
        ADMIN    = 2,
        SECURITY = 3,
    };

    AuditLog(std::string jsonl_path, std::string state_path);

    // Dropped silently when level is below min level. Thread-safe.
    // Returns false if the line could not be written.
    bool append(const AuditEvent& e, MinLevel level = MinLevel::SECURITY);

    // Accepts DEBUG/INFO/ADMIN/SECURITY (any case).
    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    // Re-walk the JSONL file and recompute every link.
    // Returns number of verified lines, or -1 with *err set.
    long verify_chain(std::string* err = nullptr) const;

    const std::string& path() const { return jsonl_path_; }

private:
    std::atomic<int> min_level_{static_cast<int>(MinLevel::INFO)};

    std::string jsonl_path_;
    std::string state_path_;

    std::mutex mu_;

    std::string load_prev_hash_();
    bool store_prev_hash_(const std::string& h);

    static std::string json_escape_(const std::string& s);

    // Returns the full line; *out_line_hash receives its chained hash.
    static std::string build_json_(const AuditEvent& e,
                                   const std::string& prev_hash,
                                   std::string* out_line_hash);
};

// Null-safe convenience used by the verifier and initiator.
// Write failures are reported on stderr by append().
void audit_emit(AuditLog* log,
                AuditLog::MinLevel level,
                const std::string& event,
                const std::string& outcome,
                std::map<std::string, std::string> fields = {});

// Truncate identifiers for logs.
inline std::string shorten(const std::string& s, size_t maxlen = 64) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

} // namespace anpwba
