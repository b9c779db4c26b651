#include "domain_policy.h"

#include "anpwba_util.h"

#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace anpwba {

std::string safe_domain_string(const std::string& host) {
    std::string out = host;
    for (char& c : out) {
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!alnum) c = '_';
    }
    return out;
}

static std::optional<int> parse_port(const std::string& s) {
    if (s.empty() || s.size() > 5) return std::nullopt;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + (c - '0');
    }
    if (v <= 0 || v > 65535) return std::nullopt;
    return v;
}

DomainPolicy::DomainPolicy() = default;

DomainPolicy::DomainPolicy(DomainPolicySettings s)
    : s_(std::move(s)) {}

bool DomainPolicy::load(const std::string& path, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) {
        if (err) *err = "cannot open " + path;
        return false;
    }

    json root;
    try {
        f >> root;
    } catch (const std::exception& e) {
        if (err) *err = std::string("domain policy parse failed: ") + e.what();
        return false;
    }
    if (!root.is_object()) {
        if (err) *err = "domain policy must be a JSON object";
        return false;
    }

    // Build into a temp copy, then swap under the lock.
    DomainPolicySettings tmp;
    {
        std::lock_guard<std::mutex> lk(mu_);
        tmp = s_;
    }

    if (root.contains("data_root") && root["data_root"].is_string())
        tmp.data_root = root["data_root"].get<std::string>();
    if (root.contains("default_host") && root["default_host"].is_string())
        tmp.default_host = root["default_host"].get<std::string>();
    if (root.contains("default_port") && root["default_port"].is_number_integer())
        tmp.default_port = root["default_port"].get<int>();

    if (root.contains("domains")) {
        if (!root["domains"].is_object()) {
            if (err) *err = "\"domains\" must map host -> port";
            return false;
        }
        tmp.supported.clear();
        for (auto it = root["domains"].begin(); it != root["domains"].end(); ++it) {
            if (!it.value().is_number_integer()) {
                std::cerr << "[domain] WARNING: skipping " << it.key() << " (port is not an integer)" << std::endl;
                continue;
            }
            tmp.supported[lower_ascii(it.key())] = it.value().get<int>();
        }
    }

    if (root.contains("wildcards") && root["wildcards"].is_array()) {
        tmp.wildcards.clear();
        for (const auto& w : root["wildcards"]) {
            if (w.is_string()) tmp.wildcards.push_back(lower_ascii(w.get<std::string>()));
        }
    }

    std::lock_guard<std::mutex> lk(mu_);
    s_ = std::move(tmp);
    cache_.clear();
    std::cerr << "[domain] loaded " << s_.supported.size() << " domains, "
              << s_.wildcards.size() << " wildcards from " << path << std::endl;
    return true;
}

HostPort DomainPolicy::default_host_port() const {
    std::lock_guard<std::mutex> lk(mu_);
    return HostPort{s_.default_host, s_.default_port};
}

HostPort DomainPolicy::parse_host_header(const std::string& value_in) const {
    const std::string value = trim_ws(value_in);
    if (value.empty()) return default_host_port();

    if (value[0] == '[') {
        const auto close = value.find(']');
        if (close == std::string::npos) return default_host_port();
        HostPort hp;
        hp.host = value.substr(1, close - 1);
        if (close + 1 < value.size() && value[close + 1] == ':') {
            hp.port = parse_port(value.substr(close + 2)).value_or(80);
        }
        return hp;
    }

    const auto first = value.find(':');
    const auto last = value.rfind(':');
    if (first == std::string::npos) return HostPort{value, 80};

    // bare IPv6 without brackets: no port can be expressed
    if (first != last) return HostPort{value, 80};

    HostPort hp;
    hp.host = value.substr(0, last);
    hp.port = parse_port(value.substr(last + 1)).value_or(80);
    return hp;
}

bool DomainPolicy::is_supported_locked(const std::string& host_in, std::optional<int> port) const {
    const std::string host = lower_ascii(host_in);

    auto it = s_.supported.find(host);
    if (it != s_.supported.end()) {
        return !port || *port == it->second;
    }

    for (const auto& w : s_.wildcards) {
        if (w.size() < 2 || w[0] != '*') continue;
        const std::string suffix = w.substr(1);
        if (host.size() > suffix.size() &&
            host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return true;
        }
    }
    return false;
}

bool DomainPolicy::is_supported_domain(const std::string& host, std::optional<int> port) const {
    std::lock_guard<std::mutex> lk(mu_);
    return is_supported_locked(host, port);
}

std::string DomainPolicy::data_path_locked(const std::string& host, int port, bool absolute) const {
    std::filesystem::path p = std::filesystem::path(s_.data_root) /
                              (safe_domain_string(host) + "_" + std::to_string(port));
    if (absolute) p = std::filesystem::absolute(p).lexically_normal();
    return p.string();
}

std::string DomainPolicy::data_path_for_domain(const std::string& host, int port, bool absolute) const {
    std::lock_guard<std::mutex> lk(mu_);
    return data_path_locked(host, port, absolute);
}

DomainPaths DomainPolicy::all_paths_locked(const std::string& host, int port, bool absolute) const {
    const std::filesystem::path base(data_path_locked(host, port, absolute));
    DomainPaths out;
    out.base_path = base.string();
    out.user_did_path = (base / "anp_users").string();
    out.user_hosted_path = (base / "anp_users_hosted").string();
    out.agents_cfg_path = (base / "agents_config").string();
    out.hosted_did_queue = (base / "hosted_did_queue").string();
    out.hosted_did_results = (base / "hosted_did_results").string();
    return out;
}

DomainPaths DomainPolicy::all_data_paths(const std::string& host, int port, bool absolute) const {
    std::lock_guard<std::mutex> lk(mu_);
    return all_paths_locked(host, port, absolute);
}

DomainConfig DomainPolicy::domain_config(const std::string& host_in) {
    const std::string host = lower_ascii(host_in);
    std::lock_guard<std::mutex> lk(mu_);

    auto cached = cache_.find(host);
    if (cached != cache_.end()) return cached->second;

    DomainConfig c;
    c.domain = host;
    auto it = s_.supported.find(host);
    c.supported = (it != s_.supported.end()) || is_supported_locked(host, std::nullopt);
    c.port = (it != s_.supported.end()) ? it->second : 80;
    c.data_path = data_path_locked(host, c.port, false);

    cache_[host] = c;
    return c;
}

DomainAccess DomainPolicy::validate_domain_access(const std::string& host_header) const {
    DomainAccess a;
    a.target = parse_host_header(host_header);
    a.allowed = is_supported_domain(a.target.host, a.target.port);
    if (!a.allowed) a.error = "unsupported domain: " + a.target.host + ":" + std::to_string(a.target.port);
    return a;
}

bool DomainPolicy::ensure_domain_directories(const std::string& host, int port, std::string* err) const {
    DomainPaths p;
    {
        std::lock_guard<std::mutex> lk(mu_);
        p = all_paths_locked(host, port, false);
    }

    for (const std::string& d : {p.base_path, p.user_did_path, p.user_hosted_path,
                                 p.agents_cfg_path, p.hosted_did_queue, p.hosted_did_results}) {
        std::error_code ec;
        std::filesystem::create_directories(d, ec);
        if (ec) {
            if (err) *err = "create_directories(" + d + ") failed: " + ec.message();
            return false;
        }
    }
    return true;
}

DomainStats DomainPolicy::domain_stats() const {
    std::lock_guard<std::mutex> lk(mu_);

    DomainStats st;
    st.supported_domains = s_.supported.size();
    st.cache_size = cache_.size();
    for (const auto& kv : s_.supported) {
        st.domains.push_back(kv.first);

        const DomainPaths p = all_paths_locked(kv.first, kv.second, false);
        std::error_code ec;
        DomainDirStatus ds;
        ds.base_exists = std::filesystem::is_directory(p.base_path, ec);
        ds.users_exists = std::filesystem::is_directory(p.user_did_path, ec);
        ds.agents_exists = std::filesystem::is_directory(p.agents_cfg_path, ec);
        st.domain_status[kv.first + ":" + std::to_string(kv.second)] = ds;
    }
    return st;
}

void DomainPolicy::add_supported_domain(const std::string& host, int port) {
    const std::string h = lower_ascii(host);
    std::lock_guard<std::mutex> lk(mu_);
    s_.supported[h] = port;
    cache_.clear();
}

bool DomainPolicy::remove_supported_domain(const std::string& host) {
    const std::string h = lower_ascii(host);
    std::lock_guard<std::mutex> lk(mu_);
    const bool removed = s_.supported.erase(h) > 0;
    cache_.clear();
    return removed;
}

void DomainPolicy::add_wildcard(const std::string& pattern) {
    std::lock_guard<std::mutex> lk(mu_);
    s_.wildcards.push_back(lower_ascii(pattern));
    cache_.clear();
}

void DomainPolicy::clear_cache() {
    std::lock_guard<std::mutex> lk(mu_);
    cache_.clear();
}

std::size_t DomainPolicy::cache_size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return cache_.size();
}

} // namespace anpwba
