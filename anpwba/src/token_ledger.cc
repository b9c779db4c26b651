#include "token_ledger.h"

#include "anpwba_util.h"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace anpwba {

/*
================================================================================
Token Ledger
================================================================================

One ledger per local identity. Two maps keyed by peer DID:

  to_remote_   : { req_did=self, token, created_at, expires_at, is_revoked }
  from_remote_ : { req_did=peer, token, created_at, is_revoked }

Persistence (optional):
  - JSON file, full rewrite on every mutation: ledger -> <path>.tmp -> rename.
  - Saves happen under mu_ so memory and disk never diverge between two
    concurrent mutations of the same peer.
  - A failed save is logged and the in-memory state is kept; the next
    successful mutation rewrites the whole file.

Expiry:
  - Outbound records are valid while now < expires_at.
  - An unparseable expires_at is treated as expired.
  - Inbound records carry no expiry.
================================================================================
*/

static bool record_from_json(const json& it, TokenRecord* out) {
    if (!it.is_object()) return false;
    TokenRecord r;
    if (it.contains("req_did") && it["req_did"].is_string()) r.req_did = it["req_did"].get<std::string>();
    if (it.contains("token") && it["token"].is_string()) r.token = it["token"].get<std::string>();
    if (it.contains("created_at") && it["created_at"].is_string()) r.created_at = it["created_at"].get<std::string>();
    if (it.contains("expires_at") && it["expires_at"].is_string()) r.expires_at = it["expires_at"].get<std::string>();
    if (it.contains("is_revoked") && it["is_revoked"].is_boolean()) r.is_revoked = it["is_revoked"].get<bool>();
    if (r.token.empty()) return false;
    *out = std::move(r);
    return true;
}

static json record_to_json(const TokenRecord& r) {
    json it;
    it["req_did"] = r.req_did;
    it["token"] = r.token;
    it["created_at"] = r.created_at;
    if (!r.expires_at.empty()) it["expires_at"] = r.expires_at;
    it["is_revoked"] = r.is_revoked;
    return it;
}

TokenLedger::TokenLedger(std::string self_did, std::string json_path)
    : self_did_(std::move(self_did)), json_path_(std::move(json_path)) {}

void TokenLedger::set_clock(std::function<long()> now) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ = std::move(now);
}

long TokenLedger::now() const {
    return now_ ? now_() : now_epoch();
}

bool TokenLedger::load(std::string* err) {
    std::lock_guard<std::mutex> lk(mu_);
    to_remote_.clear();
    from_remote_.clear();

    if (json_path_.empty()) return true;

    std::ifstream f(json_path_);
    if (!f.good()) return true;

    json root;
    try {
        f >> root;
    } catch (const std::exception& e) {
        if (err) *err = std::string("token ledger parse failed: ") + e.what();
        return false;
    }
    if (!root.is_object()) return true;

    auto load_map = [&](const char* key, std::map<std::string, TokenRecord>* m) {
        if (!root.contains(key) || !root[key].is_object()) return;
        for (auto it = root[key].begin(); it != root[key].end(); ++it) {
            TokenRecord r;
            if (record_from_json(it.value(), &r)) (*m)[it.key()] = std::move(r);
        }
    };
    load_map("to_remote", &to_remote_);
    load_map("from_remote", &from_remote_);
    return true;
}

bool TokenLedger::save_atomic(std::string* err) {
    json root;
    root["self_did"] = self_did_;
    root["to_remote"] = json::object();
    root["from_remote"] = json::object();
    for (const auto& kv : to_remote_) root["to_remote"][kv.first] = record_to_json(kv.second);
    for (const auto& kv : from_remote_) root["from_remote"][kv.first] = record_to_json(kv.second);

    std::filesystem::path p(json_path_);
    std::filesystem::path dir = p.parent_path();
    std::error_code ec;
    if (!dir.empty()) std::filesystem::create_directories(dir, ec);

    std::filesystem::path tmp = p;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.good()) {
            if (err) *err = "failed to open tmp for write: " + tmp.string();
            return false;
        }
        out << root.dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            if (err) *err = "failed writing tmp: " + tmp.string();
            return false;
        }
    }

    std::filesystem::rename(tmp, p, ec);
    if (ec) {
        if (err) *err = std::string("rename(tmp->ledger) failed: ") + ec.message();
        return false;
    }
    return true;
}

void TokenLedger::persist_locked(const char* op) {
    if (json_path_.empty()) return;
    std::string err;
    if (!save_atomic(&err)) {
        std::cerr << "[ledger] WARNING: " << op << " not persisted: " << err << std::endl;
    }
}

bool TokenLedger::to_valid_locked(const TokenRecord& r, long now) const {
    if (r.is_revoked) return false;
    if (r.expires_at.empty()) return true;
    auto exp = parse_iso8601_utc(r.expires_at);
    if (!exp) return false;
    return *exp > now;
}

//------------------------------------------------------------------------------
// Outbound
//------------------------------------------------------------------------------

// 9999-12-31T23:59:59Z, the last instant a 4-digit ISO year can carry.
static const long kMaxExpiryEpoch = 253402300799L;
// Negative TTLs only need to land in the past.
static const long kMinTtl = -86400L;

static long expiry_epoch(long now, long ttl_seconds) {
    if (ttl_seconds < kMinTtl) ttl_seconds = kMinTtl;
    if (now >= kMaxExpiryEpoch || ttl_seconds > kMaxExpiryEpoch - now) return kMaxExpiryEpoch;
    return now + ttl_seconds;
}

TokenRecord TokenLedger::store_token_to_remote(const std::string& peer_did, const std::string& token, long ttl_seconds) {
    std::lock_guard<std::mutex> lk(mu_);
    const long t = now();

    TokenRecord r;
    r.req_did = self_did_;
    r.token = token;
    r.created_at = iso_utc_from_epoch(t);
    r.expires_at = iso_utc_from_epoch(expiry_epoch(t, ttl_seconds));
    r.is_revoked = false;

    to_remote_[peer_did] = r;
    persist_locked("store_token_to_remote");
    return r;
}

std::optional<TokenRecord> TokenLedger::get_token_to_remote(const std::string& peer_did) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = to_remote_.find(peer_did);
    if (it == to_remote_.end()) return std::nullopt;
    return it->second;
}

bool TokenLedger::revoke_token_to_remote(const std::string& peer_did) {
    std::lock_guard<std::mutex> lk(mu_);
    if (to_remote_.erase(peer_did) == 0) return false;
    persist_locked("revoke_token_to_remote");
    return true;
}

//------------------------------------------------------------------------------
// Inbound
//------------------------------------------------------------------------------

TokenRecord TokenLedger::store_token_from_remote(const std::string& peer_did, const std::string& token) {
    std::lock_guard<std::mutex> lk(mu_);

    TokenRecord r;
    r.req_did = peer_did;
    r.token = token;
    r.created_at = iso_utc_from_epoch(now());
    r.is_revoked = false;

    from_remote_[peer_did] = r;
    persist_locked("store_token_from_remote");
    return r;
}

std::optional<TokenRecord> TokenLedger::get_token_from_remote(const std::string& peer_did) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = from_remote_.find(peer_did);
    if (it == from_remote_.end()) return std::nullopt;
    return it->second;
}

bool TokenLedger::revoke_token_from_remote(const std::string& peer_did) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = from_remote_.find(peer_did);
    if (it == from_remote_.end()) return false;
    it->second.is_revoked = true;
    persist_locked("revoke_token_from_remote");
    return true;
}

//------------------------------------------------------------------------------
// Queries / maintenance
//------------------------------------------------------------------------------

bool TokenLedger::is_token_valid(const std::string& peer_did, TokenDirection dir) const {
    std::lock_guard<std::mutex> lk(mu_);
    if (dir == TokenDirection::To) {
        auto it = to_remote_.find(peer_did);
        return it != to_remote_.end() && to_valid_locked(it->second, now());
    }
    auto it = from_remote_.find(peer_did);
    return it != from_remote_.end() && !it->second.is_revoked;
}

std::size_t TokenLedger::cleanup_expired_tokens() {
    std::lock_guard<std::mutex> lk(mu_);
    const long t = now();

    std::size_t removed = 0;
    for (auto it = to_remote_.begin(); it != to_remote_.end();) {
        const TokenRecord& r = it->second;
        bool expired = false;
        if (!r.expires_at.empty()) {
            auto exp = parse_iso8601_utc(r.expires_at);
            expired = !exp || *exp <= t;
        }
        if (expired) {
            it = to_remote_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    if (removed > 0) persist_locked("cleanup_expired_tokens");
    return removed;
}

TokenStats TokenLedger::get_token_stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    const long t = now();

    TokenStats s;
    s.to_remote_count = to_remote_.size();
    s.from_remote_count = from_remote_.size();
    for (const auto& kv : to_remote_) {
        if (to_valid_locked(kv.second, t)) s.valid_to_remote_count++;
    }
    for (const auto& kv : from_remote_) {
        if (!kv.second.is_revoked) s.valid_from_remote_count++;
    }
    return s;
}

std::optional<std::string> TokenLedger::match_token_to_remote(const std::string& token) const {
    std::lock_guard<std::mutex> lk(mu_);
    const long t = now();
    for (const auto& kv : to_remote_) {
        if (secure_equals(kv.second.token, token) && to_valid_locked(kv.second, t)) return kv.first;
    }
    return std::nullopt;
}

std::vector<std::string> TokenLedger::peers(TokenDirection dir) const {
    std::lock_guard<std::mutex> lk(mu_);
    const auto& m = (dir == TokenDirection::To) ? to_remote_ : from_remote_;
    std::vector<std::string> out;
    out.reserve(m.size());
    for (const auto& kv : m) out.push_back(kv.first);
    return out;
}

} // namespace anpwba
