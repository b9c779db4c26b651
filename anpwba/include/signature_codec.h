#pragma once

#include <memory>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

namespace anpwba {

// Raised for unusable key material: bad PEM, unknown curve, wrong coordinate
// length, point not on curve. Verification callers fold this into "failed".
class KeyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Verification method types written into DID documents.
inline constexpr const char* kTypeSecp256k1 = "EcdsaSecp256k1VerificationKey2019";
inline constexpr const char* kTypeEd25519   = "Ed25519VerificationKey2018";
inline constexpr const char* kTypeJwk2020   = "JsonWebKey2020";

/*
SigningKey
==========

Private key used to sign DIDWba auth payloads.

Accepted keys (PEM, PKCS#8 or SEC1):
- EC: secp256k1, P-256, P-384, P-521
- Ed25519

Signature wire format:
- The signed message is the 32-byte SHA-256 of the canonical payload.
- EC keys sign that digest with ECDSA-SHA256; the DER signature is converted
  to fixed-width R||S.
- Ed25519 keys sign the same 32-byte digest directly.
- Result is base64url without padding.

Copies share the underlying EVP_PKEY (read-only after load).
*/
class SigningKey {
public:
    // Throws KeyError.
    static SigningKey from_pem(const std::string& pem);
    static SigningKey from_pem_file(const std::string& path);

    std::string sign(const std::string& payload) const;

    // {"kty":"EC","crv":...,"x":...,"y":...} or {"kty":"OKP","crv":"Ed25519","x":...}
    nlohmann::json public_jwk() const;

    // Verification method "type" matching this key.
    std::string verification_method_type() const;

    bool is_ed25519() const;

private:
    explicit SigningKey(EVP_PKEY* pkey);
    std::shared_ptr<EVP_PKEY> pkey_;
};

// Verify a base64url R||S (or Ed25519) signature over payload using a JWK.
//
// Returns false on signature mismatch or undecodable signature.
// Throws KeyError when the JWK itself is unusable.
bool verify_signature(const std::string& payload,
                      const std::string& signature_b64url,
                      const nlohmann::json& public_key_jwk);

// Raw 32-byte SHA-256 digest as a byte string.
std::string sha256_raw(const std::string& s);

// SHA-256 rendered as lowercase hex.
std::string sha256_hex(const std::string& s);

} // namespace anpwba
