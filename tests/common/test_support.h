// tests/common/test_support.h
//
// Shared helpers for the standalone test programs:
// - fresh EC / Ed25519 keys as PEM (OpenSSL 3)
// - a ready-made local identity (DID document + key)
// - a scratch directory under the system temp dir

#pragma once

#include <cstdio>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include "anpwba_util.h"
#include "did_document.h"
#include "signature_codec.h"

namespace testutil {

// "EC" + curve name ("secp256k1", "P-256"), or "ED25519" with curve "".
inline std::string generate_key_pem(const char* type = "EC", const char* curve = "secp256k1") {
    EVP_PKEY* pk = (curve && *curve) ? EVP_PKEY_Q_keygen(nullptr, nullptr, type, curve)
                                     : EVP_PKEY_Q_keygen(nullptr, nullptr, type);
    if (!pk) throw std::runtime_error("keygen failed");
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(pk, EVP_PKEY_free);

    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    if (!bio || PEM_write_bio_PrivateKey(bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr) != 1) {
        throw std::runtime_error("PEM_write_bio_PrivateKey failed");
    }
    char* data = nullptr;
    const long n = BIO_get_mem_data(bio.get(), &data);
    return std::string(data, (size_t)n);
}

struct TestIdentity {
    std::string did;
    std::string pem;
    anpwba::DidDocument doc;
};

inline TestIdentity make_identity(const std::string& did,
                                  const char* type = "EC",
                                  const char* curve = "secp256k1") {
    TestIdentity t;
    t.did = did;
    t.pem = generate_key_pem(type, curve);
    const anpwba::SigningKey key = anpwba::SigningKey::from_pem(t.pem);
    t.doc = anpwba::make_did_document(did, "key-1", key.verification_method_type(), key.public_jwk());
    return t;
}

// Removed on destruction.
struct ScratchDir {
    std::filesystem::path path;

    explicit ScratchDir(const std::string& tag) {
        path = std::filesystem::temp_directory_path() / ("anpwba_" + tag + "_" + anpwba::random_hex(6));
        std::filesystem::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    std::string file(const std::string& name) const { return (path / name).string(); }
};

} // namespace testutil

// Expectation helper: logs and counts, never aborts.
#define EXPECT_TRUE(tag, cond)                                                        \
    do {                                                                              \
        if (!(cond)) {                                                                \
            std::fprintf(stderr, "[%s] FAIL %s:%d: %s\n", tag, __FILE__, __LINE__, #cond); \
            failures++;                                                               \
        }                                                                             \
    } while (0)
