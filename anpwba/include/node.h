#pragma once

#include "audit_log.h"
#include "auth_initiator.h"
#include "auth_responder.h"
#include "auth_verifier.h"
#include "config.h"
#include "domain_policy.h"
#include "local_identity.h"
#include "nonce_cache.h"

#include <cstddef>
#include <memory>
#include <string>

namespace anpwba {

/*
Node
====

Everything one process needs to speak DIDWba, built from a Config:

  domains     DomainPolicy    data_root, default host/port, "domains",
                              "wildcards", then domains_path on top
  identities  LocalIdentityStore(key_id)
  audit       AuditLog at audit_path (+ ".state"), min level applied;
              null when audit_path is ""
  nonces      NonceCache shared by every responder of this node

Contexts handed to AuthInitiator / AuthResponder point into the Node, so
the Node must outlive them.
*/
struct Node {
    Config cfg;
    std::unique_ptr<DomainPolicy> domains;
    std::unique_ptr<LocalIdentityStore> identities;
    std::unique_ptr<AuditLog> audit;
    std::unique_ptr<NonceCache> nonces;
};

DomainPolicySettings domain_settings_from(const Config& cfg);

// Settings from cfg, then cfg.domains_path if set. A policy file that
// fails to load is logged and the settings from cfg are kept.
std::unique_ptr<DomainPolicy> make_domain_policy(const Config& cfg);

// nullptr when cfg.audit_path is empty.
std::unique_ptr<AuditLog> make_audit_log(const Config& cfg);

TimestampPolicy timestamp_policy_from(const Config& cfg);

std::unique_ptr<Node> make_node(const Config& cfg);

// Loads <data_root>/<host>_<port>/anp_users/user_* into node.identities.
// Uses the default host/port when host is "".
std::size_t load_domain_identities(Node& node, const std::string& host = "", int port = 0);

// httplib transport and local-then-network DID resolution.
AuthInitiatorContext make_initiator_context(Node& node);
AuthResponderContext make_responder_context(Node& node);

} // namespace anpwba
