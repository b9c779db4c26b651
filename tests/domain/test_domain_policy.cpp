// tests/domain/test_domain_policy.cpp
//
// DomainPolicy: Host header parsing, allow-list + wildcard matching,
// per-domain data paths, memoized domain_config, JSON loading,
// domain_config consistency while the table changes under it.

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <sodium.h>

#include "../common/test_support.h"
#include "domain_policy.h"

using namespace anpwba;

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "[domain] sodium_init failed\n");
        return 2;
    }
    int failures = 0;

    // Host header
    {
        DomainPolicy p;
        EXPECT_TRUE("domain", (p.parse_host_header("[::1]:9527") == HostPort{"::1", 9527}));
        EXPECT_TRUE("domain", (p.parse_host_header("[::1]") == HostPort{"::1", 80}));
        EXPECT_TRUE("domain", (p.parse_host_header("") == HostPort{"localhost", 9527}));
        EXPECT_TRUE("domain", (p.parse_host_header("   ") == HostPort{"localhost", 9527}));
        EXPECT_TRUE("domain", (p.parse_host_header("localhost:invalid") == HostPort{"localhost", 80}));
        EXPECT_TRUE("domain", (p.parse_host_header("example.com") == HostPort{"example.com", 80}));
        EXPECT_TRUE("domain", (p.parse_host_header("example.com:8080") == HostPort{"example.com", 8080}));
        EXPECT_TRUE("domain", (p.parse_host_header("example.com:99999") == HostPort{"example.com", 80}));
    }

    // Allow-list
    {
        DomainPolicy p;
        EXPECT_TRUE("domain", p.is_supported_domain("localhost", 9527));
        EXPECT_TRUE("domain", p.is_supported_domain("LOCALHOST", 9527));
        EXPECT_TRUE("domain", p.is_supported_domain("localhost"));
        EXPECT_TRUE("domain", !p.is_supported_domain("localhost", 8080));
        EXPECT_TRUE("domain", p.is_supported_domain("sub.localhost"));
        EXPECT_TRUE("domain", p.is_supported_domain("sub.localhost", 1234));
        EXPECT_TRUE("domain", p.is_supported_domain("a.b.localhost", 80));
        EXPECT_TRUE("domain", !p.is_supported_domain("evil-localhost"));
        EXPECT_TRUE("domain", !p.is_supported_domain("example.com"));

        const DomainAccess ok = p.validate_domain_access("localhost:9527");
        EXPECT_TRUE("domain", ok.allowed && ok.error.empty());
        const DomainAccess bad = p.validate_domain_access("example.com:9527");
        EXPECT_TRUE("domain", !bad.allowed && bad.error == "unsupported domain: example.com:9527");

        p.add_supported_domain("Example.com", 443);
        EXPECT_TRUE("domain", p.is_supported_domain("example.com", 443));
        EXPECT_TRUE("domain", p.remove_supported_domain("example.com"));
        EXPECT_TRUE("domain", !p.is_supported_domain("example.com", 443));
        EXPECT_TRUE("domain", !p.remove_supported_domain("example.com"));

        p.add_wildcard("*.example.org");
        EXPECT_TRUE("domain", p.is_supported_domain("api.example.org", 8443));
        EXPECT_TRUE("domain", !p.is_supported_domain("example.org"));
    }

    // Paths
    {
        DomainPolicySettings s;
        s.data_root = "root";
        DomainPolicy p(s);

        EXPECT_TRUE("domain", safe_domain_string("user.localhost") == "user_localhost");
        EXPECT_TRUE("domain", safe_domain_string("::1") == "__1");

        const std::string base = p.data_path_for_domain("user.localhost", 9527);
        EXPECT_TRUE("domain", base == (std::filesystem::path("root") / "user_localhost_9527").string());

        const std::string abs = p.data_path_for_domain("user.localhost", 9527, true);
        EXPECT_TRUE("domain", std::filesystem::path(abs).is_absolute());

        const DomainPaths paths = p.all_data_paths("localhost", 9527);
        const std::filesystem::path b(paths.base_path);
        EXPECT_TRUE("domain", paths.user_did_path == (b / "anp_users").string());
        EXPECT_TRUE("domain", paths.user_hosted_path == (b / "anp_users_hosted").string());
        EXPECT_TRUE("domain", paths.agents_cfg_path == (b / "agents_config").string());
        EXPECT_TRUE("domain", paths.hosted_did_queue == (b / "hosted_did_queue").string());
        EXPECT_TRUE("domain", paths.hosted_did_results == (b / "hosted_did_results").string());
    }

    // Memoized config
    {
        DomainPolicy p;
        const DomainConfig c1 = p.domain_config("localhost");
        EXPECT_TRUE("domain", c1.supported && c1.port == 9527);
        EXPECT_TRUE("domain", p.cache_size() == 1);

        const DomainConfig c2 = p.domain_config("sub.localhost");
        EXPECT_TRUE("domain", c2.supported && c2.port == 80);
        const DomainConfig c3 = p.domain_config("example.com");
        EXPECT_TRUE("domain", !c3.supported);
        EXPECT_TRUE("domain", p.cache_size() == 3);

        p.add_supported_domain("example.com", 443);
        EXPECT_TRUE("domain", p.cache_size() == 0);
        const DomainConfig c4 = p.domain_config("example.com");
        EXPECT_TRUE("domain", c4.supported && c4.port == 443);

        p.clear_cache();
        EXPECT_TRUE("domain", p.cache_size() == 0);
        EXPECT_TRUE("domain", p.is_supported_domain("example.com", 443)); // list untouched
    }

    // Directories, stats, JSON load
    {
        testutil::ScratchDir dir("domain");
        DomainPolicySettings s;
        s.data_root = dir.path.string();
        DomainPolicy p(s);

        std::string err;
        EXPECT_TRUE("domain", p.ensure_domain_directories("localhost", 9527, &err));
        const DomainStats st = p.domain_stats();
        EXPECT_TRUE("domain", st.supported_domains == 5);
        const auto it = st.domain_status.find("localhost:9527");
        EXPECT_TRUE("domain", it != st.domain_status.end() && it->second.base_exists &&
                              it->second.users_exists && it->second.agents_exists);
        const auto other = st.domain_status.find("user.localhost:9527");
        EXPECT_TRUE("domain", other != st.domain_status.end() && !other->second.base_exists);

        const std::string cfg = dir.file("domains.json");
        {
            std::ofstream f(cfg);
            f << R"({"default_host":"node.example","default_port":8443,
                     "domains":{"node.example":8443,"bad":"x"},"wildcards":["*.node.example"]})";
        }
        EXPECT_TRUE("domain", p.load(cfg, &err));
        EXPECT_TRUE("domain", (p.default_host_port() == HostPort{"node.example", 8443}));
        EXPECT_TRUE("domain", p.is_supported_domain("node.example", 8443));
        EXPECT_TRUE("domain", !p.is_supported_domain("localhost", 9527));
        EXPECT_TRUE("domain", !p.is_supported_domain("bad"));
        EXPECT_TRUE("domain", p.is_supported_domain("a.node.example"));

        {
            std::ofstream f(cfg);
            f << R"({"domains":[1,2,3]})";
        }
        EXPECT_TRUE("domain", !p.load(cfg, &err));
        EXPECT_TRUE("domain", p.is_supported_domain("node.example", 8443)); // unchanged
        EXPECT_TRUE("domain", !p.load(dir.file("missing.json"), &err));
    }

    // Readers never see a half-applied change
    {
        DomainPolicy p;
        std::atomic<bool> stop{false};
        std::atomic<int> torn{0};
        std::atomic<long> reads{0};

        std::vector<std::thread> readers;
        for (int t = 0; t < 3; t++) {
            readers.emplace_back([&]() {
                do {
                    const DomainConfig c = p.domain_config("Shard.Example");
                    const bool ok = c.domain == "shard.example" &&
                                    (c.supported ? (c.port == 7000 && c.data_path.size() >= 18 &&
                                                    c.data_path.compare(c.data_path.size() - 18, 18, "shard_example_7000") == 0)
                                                 : (c.port == 80 && c.data_path.size() >= 16 &&
                                                    c.data_path.compare(c.data_path.size() - 16, 16, "shard_example_80") == 0));
                    if (!ok) torn++;
                    (void)p.domain_stats();
                    reads++;
                } while (!stop.load());
            });
        }

        std::thread writer([&]() {
            for (int i = 0; i < 2000; i++) {
                p.add_supported_domain("shard.example", 7000);
                if (i % 3 == 0) p.clear_cache();
                p.remove_supported_domain("shard.example");
            }
            p.add_supported_domain("shard.example", 7000);
            stop = true;
        });

        writer.join();
        for (auto& th : readers) th.join();

        EXPECT_TRUE("domain", torn.load() == 0);
        EXPECT_TRUE("domain", reads.load() > 0);
        const DomainConfig last = p.domain_config("shard.example");
        EXPECT_TRUE("domain", last.supported && last.port == 7000);
    }

    if (failures) {
        std::fprintf(stderr, "[domain] %d failure(s)\n", failures);
        return 1;
    }
    std::fprintf(stderr, "[domain] OK\n");
    return 0;
}
