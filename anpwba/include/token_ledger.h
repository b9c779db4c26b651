#pragma once
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anpwba {

struct TokenRecord {
    std::string req_did;    // outbound: self; inbound: the peer that issued it
    std::string token;      // opaque bearer value
    std::string created_at; // ISO8601 UTC
    std::string expires_at; // ISO8601 UTC ("" => no expiry; inbound records never carry one)
    bool is_revoked = false;
};

enum class TokenDirection { To, From };

struct TokenStats {
    std::size_t to_remote_count = 0;
    std::size_t from_remote_count = 0;
    std::size_t valid_to_remote_count = 0;
    std::size_t valid_from_remote_count = 0;
};

/*
Per-identity token ledger.

"to remote"   : tokens this identity issued to a peer after verifying it.
"from remote" : tokens a peer issued to this identity.

Revoke is asymmetric on purpose:
- revoke_token_to_remote deletes the record.
- revoke_token_from_remote keeps it with is_revoked=true.

All methods are thread-safe. When constructed with a json_path every
mutation is written through with save_atomic().
*/
class TokenLedger {
public:
    explicit TokenLedger(std::string self_did, std::string json_path = "");

    // Missing file => empty ledger.
    bool load(std::string* err = nullptr);

    // Test hook; default is anpwba::now_epoch().
    void set_clock(std::function<long()> now);

    const std::string& self_did() const { return self_did_; }

    // ttl_seconds < 0 produces an already-expired record. Expiry is clamped
    // to 9999-12-31T23:59:59Z.
    TokenRecord store_token_to_remote(const std::string& peer_did, const std::string& token, long ttl_seconds);
    std::optional<TokenRecord> get_token_to_remote(const std::string& peer_did) const;
    bool revoke_token_to_remote(const std::string& peer_did);

    TokenRecord store_token_from_remote(const std::string& peer_did, const std::string& token);
    std::optional<TokenRecord> get_token_from_remote(const std::string& peer_did) const;
    bool revoke_token_from_remote(const std::string& peer_did);

    bool is_token_valid(const std::string& peer_did, TokenDirection dir) const;

    // Deletes outbound records with expires_at <= now. Inbound untouched.
    std::size_t cleanup_expired_tokens();

    TokenStats get_token_stats() const;

    // Peer DID whose valid outbound token equals token (constant-time compare).
    std::optional<std::string> match_token_to_remote(const std::string& token) const;

    std::vector<std::string> peers(TokenDirection dir) const;

private:
    // protects to_remote_ + from_remote_ + save_atomic()
    mutable std::mutex mu_;

    std::string self_did_;
    std::string json_path_;
    std::function<long()> now_;

    std::map<std::string, TokenRecord> to_remote_;
    std::map<std::string, TokenRecord> from_remote_;

    long now() const;
    bool to_valid_locked(const TokenRecord& r, long now) const;
    void persist_locked(const char* op);
    bool save_atomic(std::string* err);
};

} // namespace anpwba
