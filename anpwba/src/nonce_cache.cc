#include "nonce_cache.h"

namespace anpwba {

static std::chrono::seconds ttl_of(int ttl_sec) {
    return std::chrono::seconds(ttl_sec < 0 ? 0 : ttl_sec);
}

// Pops one queue entry; true if it removed a live key.
bool NonceCache::pop_oldest_locked() {
    const Queued front = std::move(order_.front());
    order_.pop_front();
    auto it = seen_.find(front.key);
    if (it == seen_.end() || it->second.seq != front.seq) return false;
    seen_.erase(it);
    return true;
}

std::size_t NonceCache::gc_locked(int ttl_sec, clock::time_point now) {
    const auto ttl = ttl_of(ttl_sec);
    std::size_t removed = 0;
    while (!order_.empty() && now - order_.front().at >= ttl) {
        if (pop_oldest_locked()) removed++;
    }
    return removed;
}

bool NonceCache::seen(const std::string& key, int ttl_sec) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = seen_.find(key);
    return it != seen_.end() && clock::now() - it->second.at < ttl_of(ttl_sec);
}

bool NonceCache::insert_if_absent(const std::string& key, int ttl_sec, std::size_t max_pending) {
    std::lock_guard<std::mutex> lk(mu_);
    const auto now = clock::now();

    auto it = seen_.find(key);
    if (it != seen_.end()) {
        if (now - it->second.at < ttl_of(ttl_sec)) return false;
        seen_.erase(it);
    }

    if (seen_.size() >= max_pending) {
        gc_locked(ttl_sec, now);
        while (!seen_.empty() && seen_.size() >= max_pending) pop_oldest_locked();
    }

    const std::uint64_t seq = next_seq_++;
    seen_[key] = Entry{now, seq};
    order_.push_back(Queued{now, seq, key});
    return true;
}

std::size_t NonceCache::gc(int ttl_sec) {
    std::lock_guard<std::mutex> lk(mu_);
    return gc_locked(ttl_sec, clock::now());
}

std::size_t NonceCache::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seen_.size();
}

} // namespace anpwba
