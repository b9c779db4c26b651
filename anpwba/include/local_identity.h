#pragma once

#include "contact_directory.h"
#include "did_document.h"
#include "token_ledger.h"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace anpwba {

// The process is missing something it needs to act as a DID: no identity
// provisioned, no private key, unreadable key. Distinct from a peer's bad
// credential, which is always a result value.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One local DID and everything scoped to it.
struct LocalIdentity {
    std::string did;
    std::string key_id = "key-1";
    std::string user_dir;          // "" for in-memory identities
    DidDocument did_document;
    std::string private_key_pem;   // "" when no key was provisioned

    std::unique_ptr<TokenLedger> ledger;
    std::unique_ptr<ContactDirectory> contacts;
};

/*
LocalIdentityStore
==================

Registry of the DIDs this process can act as.

On-disk layout (one directory per user under a domain's anp_users path):

  <anp_users>/user_<id>/did_document.json
  <anp_users>/user_<id>/<key_id>_private.pem
  <anp_users>/user_<id>/tokens.json      (written by TokenLedger)
  <anp_users>/user_<id>/contacts.json    (written by ContactDirectory)

Identities are handed out as shared_ptr so callers keep a stable ledger
even if the store is reloaded.
*/
class LocalIdentityStore {
public:
    explicit LocalIdentityStore(std::string key_id = "key-1");

    // Scan user_* directories. Unusable entries are logged and skipped.
    // Returns number of identities loaded; missing directory => 0.
    std::size_t load_users_dir(const std::string& anp_users_path);

    // In-memory identity (tests, hosted DIDs). Replaces an existing DID.
    std::shared_ptr<LocalIdentity> add_identity(const DidDocument& doc,
                                                const std::string& private_key_pem,
                                                const std::string& user_dir = "");

    std::shared_ptr<LocalIdentity> find(const std::string& did) const;

    // Throws ConfigurationError when unknown or without a private key.
    std::shared_ptr<LocalIdentity> identity_or_throw(const std::string& did) const;

    bool remove(const std::string& did);
    std::vector<std::string> dids() const;

    // Resolves DIDs of local identities without network access.
    DidFetcher local_fetcher() const;

private:
    mutable std::mutex mu_;
    std::string key_id_;
    std::map<std::string, std::shared_ptr<LocalIdentity>> by_did_;
};

} // namespace anpwba
