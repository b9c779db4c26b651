#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>

namespace anpwba {

// Anti-replay cache for DIDWba nonces. Keys are "<did>|<nonce>".
// An entry older than ttl_sec is treated as absent.
//
// Only verified requests should be inserted: a full cache evicts its
// oldest entries, so unauthenticated traffic must never reach it.
class NonceCache {
public:
    NonceCache() = default;

    // True if key was inserted within ttl_sec. Does not record anything.
    bool seen(const std::string& key, int ttl_sec) const;

    // Returns false if key was already seen within ttl_sec. At max_pending
    // entries, expired entries are dropped first, then the oldest ones.
    bool insert_if_absent(const std::string& key, int ttl_sec, std::size_t max_pending);

    // Drop everything older than ttl_sec. Returns number removed.
    std::size_t gc(int ttl_sec);

    std::size_t size() const;

private:
    using clock = std::chrono::steady_clock;

    struct Entry {
        clock::time_point at;
        std::uint64_t seq = 0;
    };
    struct Queued {
        clock::time_point at;
        std::uint64_t seq = 0;
        std::string key;
    };

    mutable std::mutex mu_;
    std::uint64_t next_seq_ = 0;
    std::unordered_map<std::string, Entry> seen_;
    // Insertion order. May hold stale keys whose map entry was replaced;
    // those are skipped when popped.
    std::deque<Queued> order_;

    std::size_t gc_locked(int ttl_sec, clock::time_point now);
    bool pop_oldest_locked();
};

} // namespace anpwba
