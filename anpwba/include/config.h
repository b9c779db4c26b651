#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace anpwba {

// Runtime settings. Defaults match a stock single-node setup on localhost:9527.
struct Config {
    std::string data_root = "data_user";
    std::string default_host = "localhost";
    int default_port = 9527;
    std::string key_id = "key-1";

    long timestamp_window_sec = 300;
    int nonce_ttl_sec = 600;             // raised to 2 * timestamp window when lower
    std::size_t nonce_max_pending = 100000;
    long token_ttl_sec = 1800;
    int http_timeout_sec = 10;

    std::string audit_path;              // "" => audit disabled
    std::string audit_min_level = "INFO";
    std::string domains_path;            // optional DomainPolicy JSON

    // "domains": {"host": port, ...} and "wildcards": ["*.suffix", ...].
    // Empty keeps the DomainPolicy defaults.
    std::map<std::string, int> domains;
    std::vector<std::string> wildcards;
};

// Reads a JSON object; unknown keys are ignored, bad values keep the default
// and log a [config] WARNING. Missing file is an error.
bool load_config_file(const std::string& path, Config* cfg, std::string* err = nullptr);

// ANPWBA_DATA_ROOT, ANPWBA_DEFAULT_HOST, ANPWBA_DEFAULT_PORT, ANPWBA_KEY_ID,
// ANPWBA_TS_WINDOW_SEC, ANPWBA_NONCE_TTL_SEC, ANPWBA_TOKEN_TTL_SEC,
// ANPWBA_HTTP_TIMEOUT_SEC, ANPWBA_AUDIT_PATH, ANPWBA_AUDIT_MIN_LEVEL,
// ANPWBA_DOMAINS_PATH
void apply_env_overrides(Config* cfg);

// Defaults <- file (path, else $ANPWBA_CONFIG if set) <- environment.
Config load_config(const std::string& path = "");

} // namespace anpwba
