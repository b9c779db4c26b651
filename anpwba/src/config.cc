#include "config.h"

#include "anpwba_util.h"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace anpwba {

static bool parse_long(const char* s, long* out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    const long v = std::strtol(s, &end, 10);
    if (!end || *end != '\0') return false;
    *out = v;
    return true;
}

template <typename T>
static void env_number(const char* name, T* dst, long min_v, long max_v) {
    const char* v = std::getenv(name);
    if (!v) return;
    long n = 0;
    if (!parse_long(v, &n) || n < min_v || n > max_v) {
        std::cerr << "[config] WARNING: ignoring " << name << "=" << v << " (out of range)" << std::endl;
        return;
    }
    *dst = (T)n;
}

static void env_string(const char* name, std::string* dst) {
    if (const char* v = std::getenv(name)) *dst = v;
}

template <typename T>
static void json_number(const json& j, const char* key, T* dst, long min_v, long max_v) {
    if (!j.contains(key)) return;
    if (!j[key].is_number_integer()) {
        std::cerr << "[config] WARNING: " << key << " must be an integer" << std::endl;
        return;
    }
    const long n = j[key].get<long>();
    if (n < min_v || n > max_v) {
        std::cerr << "[config] WARNING: " << key << "=" << n << " out of range" << std::endl;
        return;
    }
    *dst = (T)n;
}

static void json_string(const json& j, const char* key, std::string* dst) {
    if (!j.contains(key)) return;
    if (!j[key].is_string()) {
        std::cerr << "[config] WARNING: " << key << " must be a string" << std::endl;
        return;
    }
    *dst = j[key].get<std::string>();
}

static void json_domains(const json& j, Config* cfg) {
    if (j.contains("domains")) {
        if (!j["domains"].is_object()) {
            std::cerr << "[config] WARNING: domains must map host -> port" << std::endl;
        } else {
            for (auto it = j["domains"].begin(); it != j["domains"].end(); ++it) {
                const json& v = it.value();
                if (!v.is_number_integer() || v.get<long>() < 1 || v.get<long>() > 65535) {
                    std::cerr << "[config] WARNING: skipping domain " << it.key() << " (bad port)" << std::endl;
                    continue;
                }
                cfg->domains[lower_ascii(it.key())] = v.get<int>();
            }
        }
    }
    if (j.contains("wildcards")) {
        if (!j["wildcards"].is_array()) {
            std::cerr << "[config] WARNING: wildcards must be an array" << std::endl;
            return;
        }
        for (const auto& w : j["wildcards"]) {
            if (w.is_string() && w.get<std::string>().rfind("*.", 0) == 0) {
                cfg->wildcards.push_back(lower_ascii(w.get<std::string>()));
            } else {
                std::cerr << "[config] WARNING: skipping wildcard " << w.dump() << std::endl;
            }
        }
    }
}

bool load_config_file(const std::string& path, Config* cfg, std::string* err) {
    std::ifstream f(path);
    if (!f.good()) {
        if (err) *err = "cannot open " + path;
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        if (err) *err = std::string("config parse failed: ") + e.what();
        return false;
    }
    if (!j.is_object()) {
        if (err) *err = "config must be a JSON object";
        return false;
    }

    json_string(j, "data_root", &cfg->data_root);
    json_string(j, "default_host", &cfg->default_host);
    json_number(j, "default_port", &cfg->default_port, 1, 65535);
    json_string(j, "key_id", &cfg->key_id);
    json_number(j, "timestamp_window_sec", &cfg->timestamp_window_sec, 1, 86400);
    json_number(j, "nonce_ttl_sec", &cfg->nonce_ttl_sec, 1, 86400);
    json_number(j, "nonce_max_pending", &cfg->nonce_max_pending, 1, 100000000);
    json_number(j, "token_ttl_sec", &cfg->token_ttl_sec, 1, 30L * 86400);
    json_number(j, "http_timeout_sec", &cfg->http_timeout_sec, 1, 600);
    json_string(j, "audit_path", &cfg->audit_path);
    json_string(j, "audit_min_level", &cfg->audit_min_level);
    json_string(j, "domains_path", &cfg->domains_path);
    json_domains(j, cfg);
    return true;
}

void apply_env_overrides(Config* cfg) {
    env_string("ANPWBA_DATA_ROOT", &cfg->data_root);
    env_string("ANPWBA_DEFAULT_HOST", &cfg->default_host);
    env_number("ANPWBA_DEFAULT_PORT", &cfg->default_port, 1, 65535);
    env_string("ANPWBA_KEY_ID", &cfg->key_id);
    env_number("ANPWBA_TS_WINDOW_SEC", &cfg->timestamp_window_sec, 1, 86400);
    env_number("ANPWBA_NONCE_TTL_SEC", &cfg->nonce_ttl_sec, 1, 86400);
    env_number("ANPWBA_TOKEN_TTL_SEC", &cfg->token_ttl_sec, 1, 30L * 86400);
    env_number("ANPWBA_HTTP_TIMEOUT_SEC", &cfg->http_timeout_sec, 1, 600);
    env_string("ANPWBA_AUDIT_PATH", &cfg->audit_path);
    env_string("ANPWBA_AUDIT_MIN_LEVEL", &cfg->audit_min_level);
    env_string("ANPWBA_DOMAINS_PATH", &cfg->domains_path);
}

Config load_config(const std::string& path) {
    Config cfg;

    std::string file = path;
    if (file.empty()) {
        if (const char* p = std::getenv("ANPWBA_CONFIG")) file = p;
    }
    if (!file.empty()) {
        std::string err;
        if (!load_config_file(file, &cfg, &err)) {
            std::cerr << "[config] WARNING: " << err << ", using defaults" << std::endl;
        } else {
            std::cerr << "[config] loaded " << file << std::endl;
        }
    }

    apply_env_overrides(&cfg);
    return cfg;
}

} // namespace anpwba
