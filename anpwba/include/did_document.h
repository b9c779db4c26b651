#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace anpwba {

class VerificationMethodNotFound : public std::runtime_error {
public:
    explicit VerificationMethodNotFound(const std::string& fragment)
        : std::runtime_error("Verification method not found: " + fragment), fragment_(fragment) {}

    const std::string& fragment() const { return fragment_; }

private:
    std::string fragment_;
};

struct VerificationMethod {
    std::string id;          // "<did>#key-1"
    std::string type;        // EcdsaSecp256k1VerificationKey2019, ...
    std::string controller;
    nlohmann::json public_key_jwk;
};

struct DidDocument {
    std::string id;
    std::vector<VerificationMethod> verification_methods;
    std::vector<std::string> authentication;
    nlohmann::json raw; // document as received
};

// Tolerant of unknown fields; requires "id" and at least one verification
// method that carries publicKeyJwk.
bool parse_did_document(const nlohmann::json& j, DidDocument* out, std::string* err = nullptr);

// Minimal document for one key: id, verificationMethod[0], authentication[0].
DidDocument make_did_document(const std::string& did,
                              const std::string& key_fragment,
                              const std::string& type,
                              const nlohmann::json& public_key_jwk);

// Entry whose id ends with "#<fragment>". Throws VerificationMethodNotFound.
const VerificationMethod& resolve_verification_method(const DidDocument& doc, const std::string& fragment);

// Only "did:wba:" identifiers are understood.
bool supports_method(const std::string& did);

/*
Parsed did:wba identifier.

Two spellings exist in the wild:
  colon form:      did:wba:localhost%3A9527:wba:user:27c0b1d11180f973
  underscore form: did:wba:localhost_9527_wba_user_27c0b1d11180f973

segments excludes the host part and includes unique_id as its last entry.
*/
struct ParsedDid {
    std::string method;
    std::string host;
    int port = 0;
    bool port_explicit = false;
    std::vector<std::string> segments;
    std::string unique_id;
};

std::optional<ParsedDid> parse_did(const std::string& did);

// http(s)://host:port/<segments...>/did.json
// Plain http for localhost, IP literals and any non-443 port.
std::string did_document_url(const ParsedDid& d);

// did:wba:localhost:* and did:wba:localhost%3A* are resolved without TLS.
bool is_insecure_local_did(const std::string& did);

// Resolves a DID to its document; nullopt when unknown/unreachable.
using DidFetcher = std::function<std::optional<DidDocument>(const std::string& did)>;

// In-memory DID -> document table. Thread-safe.
class DidDocumentRegistry {
public:
    void put(const DidDocument& doc);
    bool remove(const std::string& did);
    std::optional<DidDocument> find(const std::string& did) const;
    size_t size() const;

    // Fetcher bound to this registry; registry must outlive it.
    DidFetcher fetcher() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, DidDocument> docs_;
};

// GET did_document_url(did) with cpp-httplib.
DidFetcher http_did_fetcher(int timeout_sec);

// Try each fetcher in order; first hit wins.
DidFetcher chain_fetchers(std::vector<DidFetcher> fetchers);

} // namespace anpwba
