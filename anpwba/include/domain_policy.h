#pragma once
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anpwba {

struct HostPort {
    std::string host;
    int port = 80;

    bool operator==(const HostPort& o) const { return host == o.host && port == o.port; }
};

struct DomainConfig {
    std::string domain;
    bool supported = false;
    int port = 80;
    std::string data_path;
};

// Per-domain storage namespace. Everything a local identity persists lives
// under base_path.
struct DomainPaths {
    std::string base_path;          // <data_root>/<safe_host>_<port>
    std::string user_did_path;      // .../anp_users
    std::string user_hosted_path;   // .../anp_users_hosted
    std::string agents_cfg_path;    // .../agents_config
    std::string hosted_did_queue;   // .../hosted_did_queue
    std::string hosted_did_results; // .../hosted_did_results
};

struct DomainAccess {
    bool allowed = false;
    HostPort target;
    std::string error;
};

struct DomainDirStatus {
    bool base_exists = false;
    bool users_exists = false;
    bool agents_exists = false;
};

struct DomainStats {
    std::size_t supported_domains = 0;
    std::vector<std::string> domains;
    std::size_t cache_size = 0;
    std::map<std::string, DomainDirStatus> domain_status; // "host:port"
};

struct DomainPolicySettings {
    std::string data_root = "data_user";
    std::string default_host = "localhost";
    int default_port = 9527;

    // exact host -> port
    std::map<std::string, int> supported = {
        {"localhost", 9527},
        {"user.localhost", 9527},
        {"service.localhost", 9527},
        {"127.0.0.1", 9527},
        {"::1", 9527},
    };

    // "*.suffix" patterns; match any port
    std::vector<std::string> wildcards = {"*.localhost"};
};

/*
DomainPolicy
============

Answers two questions for a multi-tenant node:
- Is host[:port] one of ours?
- Where on disk does that host's data live?

Exact entries are port-bound. Wildcards ("*.localhost") match any
subdomain on any port but never the bare suffix itself.

domain_config() results are memoized; every policy change invalidates the
cache. One mutex guards the domain table and the cache together, so a
lookup never sees a half-applied change.
*/
class DomainPolicy {
public:
    DomainPolicy();
    explicit DomainPolicy(DomainPolicySettings s);

    // JSON: { "data_root": "...", "default_host": "...", "default_port": 9527,
    //         "domains": { "host": port, ... }, "wildcards": ["*.x", ...] }
    // Missing keys keep current values. On error the policy is unchanged.
    bool load(const std::string& path, std::string* err = nullptr);

    HostPort default_host_port() const;

    // "[::1]:9527" -> {::1, 9527}; "" -> default; "h:junk" -> {h, 80}
    HostPort parse_host_header(const std::string& value) const;

    bool is_supported_domain(const std::string& host, std::optional<int> port = std::nullopt) const;

    std::string data_path_for_domain(const std::string& host, int port, bool absolute = false) const;
    DomainPaths all_data_paths(const std::string& host, int port, bool absolute = false) const;

    DomainConfig domain_config(const std::string& host);

    DomainAccess validate_domain_access(const std::string& host_header) const;

    bool ensure_domain_directories(const std::string& host, int port, std::string* err = nullptr) const;

    DomainStats domain_stats() const;

    void add_supported_domain(const std::string& host, int port);
    bool remove_supported_domain(const std::string& host);
    void add_wildcard(const std::string& pattern);

    void clear_cache();
    std::size_t cache_size() const;

private:
    mutable std::mutex mu_;
    DomainPolicySettings s_;
    std::map<std::string, DomainConfig> cache_;

    bool is_supported_locked(const std::string& host, std::optional<int> port) const;
    std::string data_path_locked(const std::string& host, int port, bool absolute) const;
    DomainPaths all_paths_locked(const std::string& host, int port, bool absolute) const;
};

// Host with every non [A-Za-z0-9] byte replaced by '_'.
std::string safe_domain_string(const std::string& host);

} // namespace anpwba
