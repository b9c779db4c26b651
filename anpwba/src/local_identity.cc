#include "local_identity.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace anpwba {

static bool slurp(const fs::path& p, std::string* out) {
    std::ifstream f(p, std::ios::binary);
    if (!f.good()) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    *out = ss.str();
    return true;
}

LocalIdentityStore::LocalIdentityStore(std::string key_id)
    : key_id_(std::move(key_id)) {}

std::shared_ptr<LocalIdentity> LocalIdentityStore::add_identity(const DidDocument& doc,
                                                                const std::string& private_key_pem,
                                                                const std::string& user_dir) {
    auto id = std::make_shared<LocalIdentity>();
    id->did = doc.id;
    id->key_id = key_id_;
    id->user_dir = user_dir;
    id->did_document = doc;
    id->private_key_pem = private_key_pem;

    const std::string tokens_path = user_dir.empty() ? "" : (fs::path(user_dir) / "tokens.json").string();
    const std::string contacts_path = user_dir.empty() ? "" : (fs::path(user_dir) / "contacts.json").string();
    id->ledger = std::make_unique<TokenLedger>(doc.id, tokens_path);
    id->contacts = std::make_unique<ContactDirectory>(contacts_path);

    std::string err;
    if (!id->ledger->load(&err)) {
        std::cerr << "[identity] WARNING: " << doc.id << ": " << err << " (starting with empty ledger)" << std::endl;
    }
    err.clear();
    if (!id->contacts->load(&err)) {
        std::cerr << "[identity] WARNING: " << doc.id << ": " << err << " (starting with no contacts)" << std::endl;
    }

    std::lock_guard<std::mutex> lk(mu_);
    by_did_[doc.id] = id;
    return id;
}

std::size_t LocalIdentityStore::load_users_dir(const std::string& anp_users_path) {
    std::error_code ec;
    if (!fs::is_directory(anp_users_path, ec)) return 0;

    std::size_t loaded = 0;
    for (const auto& entry : fs::directory_iterator(anp_users_path, ec)) {
        if (!entry.is_directory(ec)) continue;
        const std::string name = entry.path().filename().string();
        if (name.rfind("user_", 0) != 0) continue;

        std::string doc_text;
        if (!slurp(entry.path() / "did_document.json", &doc_text)) {
            std::cerr << "[identity] skipping " << name << ": no did_document.json" << std::endl;
            continue;
        }

        json j = json::parse(doc_text, nullptr, false);
        DidDocument doc;
        std::string err;
        if (j.is_discarded() || !parse_did_document(j, &doc, &err)) {
            std::cerr << "[identity] skipping " << name << ": "
                      << (j.is_discarded() ? std::string("invalid JSON") : err) << std::endl;
            continue;
        }

        std::string pem;
        if (!slurp(entry.path() / (key_id_ + "_private.pem"), &pem)) {
            std::cerr << "[identity] WARNING: " << doc.id << " has no " << key_id_
                      << "_private.pem; it can verify but not sign" << std::endl;
        }

        add_identity(doc, pem, entry.path().string());
        loaded++;
    }
    if (ec) {
        std::cerr << "[identity] WARNING: scanning " << anp_users_path << ": " << ec.message() << std::endl;
    }

    std::cerr << "[identity] loaded " << loaded << " identities from " << anp_users_path << std::endl;
    return loaded;
}

std::shared_ptr<LocalIdentity> LocalIdentityStore::find(const std::string& did) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = by_did_.find(did);
    return it == by_did_.end() ? nullptr : it->second;
}

std::shared_ptr<LocalIdentity> LocalIdentityStore::identity_or_throw(const std::string& did) const {
    auto id = find(did);
    if (!id) throw ConfigurationError("no local identity for " + did);
    if (id->private_key_pem.empty()) throw ConfigurationError("no private key provisioned for " + did);
    return id;
}

bool LocalIdentityStore::remove(const std::string& did) {
    std::lock_guard<std::mutex> lk(mu_);
    return by_did_.erase(did) > 0;
}

std::vector<std::string> LocalIdentityStore::dids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(by_did_.size());
    for (const auto& kv : by_did_) out.push_back(kv.first);
    return out;
}

DidFetcher LocalIdentityStore::local_fetcher() const {
    return [this](const std::string& did) -> std::optional<DidDocument> {
        auto id = find(did);
        if (!id) return std::nullopt;
        return id->did_document;
    };
}

} // namespace anpwba
