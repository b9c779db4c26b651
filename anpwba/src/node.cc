#include "node.h"

#include "http_transport.h"

#include <iostream>

namespace anpwba {

DomainPolicySettings domain_settings_from(const Config& cfg) {
    DomainPolicySettings s;
    s.data_root = cfg.data_root;
    s.default_host = cfg.default_host;
    s.default_port = cfg.default_port;
    if (!cfg.domains.empty()) s.supported = cfg.domains;
    if (!cfg.wildcards.empty()) s.wildcards = cfg.wildcards;
    return s;
}

std::unique_ptr<DomainPolicy> make_domain_policy(const Config& cfg) {
    auto policy = std::make_unique<DomainPolicy>(domain_settings_from(cfg));
    if (!cfg.domains_path.empty()) {
        std::string err;
        if (!policy->load(cfg.domains_path, &err)) {
            std::cerr << "[node] WARNING: domain policy " << cfg.domains_path << ": " << err
                      << " (using config domains)" << std::endl;
        }
    }
    return policy;
}

std::unique_ptr<AuditLog> make_audit_log(const Config& cfg) {
    if (cfg.audit_path.empty()) return nullptr;

    auto log = std::make_unique<AuditLog>(cfg.audit_path, cfg.audit_path + ".state");
    if (!log->set_min_level_str(cfg.audit_min_level)) {
        std::cerr << "[node] WARNING: unknown audit level '" << cfg.audit_min_level
                  << "', keeping " << log->min_level_str() << std::endl;
    }
    return log;
}

TimestampPolicy timestamp_policy_from(const Config& cfg) {
    TimestampPolicy p;
    p.window_sec = cfg.timestamp_window_sec;
    return p;
}

std::unique_ptr<Node> make_node(const Config& cfg) {
    auto node = std::make_unique<Node>();
    node->cfg = cfg;
    node->domains = make_domain_policy(cfg);
    node->identities = std::make_unique<LocalIdentityStore>(cfg.key_id);
    node->audit = make_audit_log(cfg);
    node->nonces = std::make_unique<NonceCache>();
    return node;
}

std::size_t load_domain_identities(Node& node, const std::string& host, int port) {
    HostPort hp{host, port};
    if (hp.host.empty()) hp = node.domains->default_host_port();
    if (!node.domains->is_supported_domain(hp.host, hp.port)) {
        std::cerr << "[node] WARNING: " << hp.host << ":" << hp.port << " is not a supported domain" << std::endl;
        return 0;
    }
    const DomainPaths paths = node.domains->all_data_paths(hp.host, hp.port);
    return node.identities->load_users_dir(paths.user_did_path);
}

AuthInitiatorContext make_initiator_context(Node& node) {
    AuthInitiatorContext ctx;
    ctx.identities = node.identities.get();
    ctx.send = httplib_transport(node.cfg.http_timeout_sec);
    ctx.resolve_did = default_did_resolver(*node.identities, node.cfg.http_timeout_sec);
    ctx.audit = node.audit.get();
    ctx.timestamps = timestamp_policy_from(node.cfg);
    return ctx;
}

AuthResponderContext make_responder_context(Node& node) {
    AuthResponderContext ctx;
    ctx.resolve_did = default_did_resolver(*node.identities, node.cfg.http_timeout_sec);
    ctx.audit = node.audit.get();
    ctx.nonces = node.nonces.get();
    ctx.timestamps = timestamp_policy_from(node.cfg);
    ctx.nonce_ttl_sec = node.cfg.nonce_ttl_sec;
    ctx.nonce_max_pending = node.cfg.nonce_max_pending;
    ctx.token_ttl_sec = node.cfg.token_ttl_sec;
    return ctx;
}

} // namespace anpwba
