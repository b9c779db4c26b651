#include "signature_codec.h"

#include "anpwba_util.h"

#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include <sodium.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/params.h>
#include <openssl/pem.h>
#include <openssl/sha.h>

namespace anpwba {

/*
Signature codec
===============

Both directions go through the same two-stage digest:

    digest = SHA256(canonical_payload)            (32 bytes)
    sig    = ECDSA-SHA256(digest)                 (EC keys)
    sig    = Ed25519(digest)                      (Ed25519 keys)

Peers running the reference agent SDK hash before handing bytes to a
signer that hashes again, so the double SHA-256 is part of the wire format.

EC signatures travel as fixed-width R||S (not DER) in base64url/no-pad.
*/

namespace {

using BioPtr     = std::unique_ptr<BIO, decltype(&BIO_free)>;
using MdCtxPtr   = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using PkeyPtr    = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using BnPtr      = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using EcSigPtr   = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

struct CurveInfo {
    const char* jwk_crv;
    const char* ossl_group;
    size_t coord_len;
};

const CurveInfo kCurves[] = {
    {"secp256k1", "secp256k1",  32},
    {"P-256",     "prime256v1", 32},
    {"P-384",     "secp384r1",  48},
    {"P-521",     "secp521r1",  66},
};

const CurveInfo* curve_by_crv(const std::string& crv) {
    for (const auto& c : kCurves) {
        if (crv == c.jwk_crv) return &c;
    }
    return nullptr;
}

const CurveInfo* curve_by_group(const std::string& group) {
    for (const auto& c : kCurves) {
        if (group == c.ossl_group) return &c;
    }
    // OpenSSL may report the NIST alias for P-256
    if (group == "P-256") return &kCurves[1];
    return nullptr;
}

std::string group_name_of(EVP_PKEY* pkey) {
    char buf[80] = {0};
    size_t len = 0;
    if (EVP_PKEY_get_utf8_string_param(pkey, OSSL_PKEY_PARAM_GROUP_NAME,
                                       buf, sizeof(buf), &len) != 1) {
        throw KeyError("cannot read EC group name");
    }
    return std::string(buf, len);
}

std::vector<unsigned char> jwk_coord(const nlohmann::json& jwk, const char* k, size_t expect_len) {
    if (!jwk.contains(k) || !jwk[k].is_string())
        throw KeyError(std::string("jwk missing ") + k);

    std::vector<unsigned char> out;
    try {
        out = b64url_decode(jwk[k].get<std::string>());
    } catch (const std::exception& e) {
        throw KeyError(std::string("jwk ") + k + ": " + e.what());
    }
    if (out.size() != expect_len)
        throw KeyError(std::string("jwk ") + k + " has wrong length " + std::to_string(out.size()));
    return out;
}

PkeyPtr ec_public_from_jwk(const nlohmann::json& jwk, const CurveInfo& curve) {
    const auto x = jwk_coord(jwk, "x", curve.coord_len);
    const auto y = jwk_coord(jwk, "y", curve.coord_len);

    std::vector<unsigned char> point;
    point.reserve(1 + 2 * curve.coord_len);
    point.push_back(0x04);
    point.insert(point.end(), x.begin(), x.end());
    point.insert(point.end(), y.begin(), y.end());

    OSSL_PARAM params[3];
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                 const_cast<char*>(curve.ossl_group), 0);
    params[1] = OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
                                                  point.data(), point.size());
    params[2] = OSSL_PARAM_construct_end();

    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free);
    if (!ctx) throw KeyError("EVP_PKEY_CTX_new_from_name failed");

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_fromdata_init(ctx.get()) != 1 ||
        EVP_PKEY_fromdata(ctx.get(), &raw, EVP_PKEY_PUBLIC_KEY, params) != 1 ||
        raw == nullptr) {
        throw KeyError(std::string("invalid EC public key for ") + curve.jwk_crv);
    }
    return PkeyPtr(raw, EVP_PKEY_free);
}

// R||S (fixed width) -> DER ECDSA-Sig-Value
bool rs_to_der(const std::vector<unsigned char>& rs, size_t coord_len, std::vector<unsigned char>* der) {
    if (rs.size() != 2 * coord_len) return false;

    BnPtr r(BN_bin2bn(rs.data(), (int)coord_len, nullptr), BN_free);
    BnPtr s(BN_bin2bn(rs.data() + coord_len, (int)coord_len, nullptr), BN_free);
    if (!r || !s) return false;

    EcSigPtr sig(ECDSA_SIG_new(), ECDSA_SIG_free);
    if (!sig) return false;
    if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) return false;
    r.release();
    s.release();

    const int n = i2d_ECDSA_SIG(sig.get(), nullptr);
    if (n <= 0) return false;
    der->resize((size_t)n);
    unsigned char* p = der->data();
    return i2d_ECDSA_SIG(sig.get(), &p) == n;
}

std::vector<unsigned char> der_to_rs(const std::vector<unsigned char>& der, size_t coord_len) {
    const unsigned char* p = der.data();
    EcSigPtr sig(d2i_ECDSA_SIG(nullptr, &p, (long)der.size()), ECDSA_SIG_free);
    if (!sig) throw std::runtime_error("d2i_ECDSA_SIG failed");

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    std::vector<unsigned char> rs(2 * coord_len);
    if (BN_bn2binpad(r, rs.data(), (int)coord_len) != (int)coord_len ||
        BN_bn2binpad(s, rs.data() + coord_len, (int)coord_len) != (int)coord_len) {
        throw std::runtime_error("BN_bn2binpad failed");
    }
    return rs;
}

} // namespace

std::string sha256_raw(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
    return std::string(reinterpret_cast<const char*>(h), sizeof(h));
}

std::string sha256_hex(const std::string& s) {
    const std::string h = sha256_raw(s);
    return hex_lower(reinterpret_cast<const unsigned char*>(h.data()), h.size());
}

//------------------------------------------------------------------------------
// SigningKey
//------------------------------------------------------------------------------

SigningKey::SigningKey(EVP_PKEY* pkey)
    : pkey_(pkey, EVP_PKEY_free) {}

SigningKey SigningKey::from_pem(const std::string& pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), (int)pem.size()), BIO_free);
    if (!bio) throw KeyError("BIO_new_mem_buf failed");

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
    if (!pkey) throw KeyError("cannot parse PEM private key");

    SigningKey key(pkey);
    const int id = EVP_PKEY_get_base_id(pkey);
    if (id == EVP_PKEY_EC) {
        const std::string group = group_name_of(pkey);
        if (!curve_by_group(group)) throw KeyError("unsupported EC curve: " + group);
    } else if (id != EVP_PKEY_ED25519) {
        throw KeyError("unsupported private key type");
    }
    return key;
}

SigningKey SigningKey::from_pem_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) throw KeyError("cannot open private key: " + path);
    std::ostringstream ss;
    ss << f.rdbuf();
    return from_pem(ss.str());
}

bool SigningKey::is_ed25519() const {
    return EVP_PKEY_get_base_id(pkey_.get()) == EVP_PKEY_ED25519;
}

std::string SigningKey::verification_method_type() const {
    if (is_ed25519()) return kTypeEd25519;
    const CurveInfo* c = curve_by_group(group_name_of(pkey_.get()));
    if (c && std::strcmp(c->jwk_crv, "secp256k1") == 0) return kTypeSecp256k1;
    return kTypeJwk2020;
}

std::string SigningKey::sign(const std::string& payload) const {
    const std::string digest = sha256_raw(payload);
    const auto* tbs = reinterpret_cast<const unsigned char*>(digest.data());

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    if (is_ed25519()) {
        if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey_.get()) != 1)
            throw std::runtime_error("EVP_DigestSignInit (ed25519) failed");
        std::vector<unsigned char> sig(64);
        size_t sig_len = sig.size();
        if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, tbs, digest.size()) != 1)
            throw std::runtime_error("EVP_DigestSign (ed25519) failed");
        sig.resize(sig_len);
        return b64url_encode(sig);
    }

    const CurveInfo* curve = curve_by_group(group_name_of(pkey_.get()));
    if (!curve) throw KeyError("unsupported EC curve");

    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey_.get()) != 1)
        throw std::runtime_error("EVP_DigestSignInit failed");

    size_t der_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &der_len, tbs, digest.size()) != 1)
        throw std::runtime_error("EVP_DigestSign (size) failed");
    std::vector<unsigned char> der(der_len);
    if (EVP_DigestSign(ctx.get(), der.data(), &der_len, tbs, digest.size()) != 1)
        throw std::runtime_error("EVP_DigestSign failed");
    der.resize(der_len);

    return b64url_encode(der_to_rs(der, curve->coord_len));
}

nlohmann::json SigningKey::public_jwk() const {
    nlohmann::json jwk;

    if (is_ed25519()) {
        unsigned char pk[32];
        size_t len = sizeof(pk);
        if (EVP_PKEY_get_raw_public_key(pkey_.get(), pk, &len) != 1 || len != sizeof(pk))
            throw KeyError("cannot export Ed25519 public key");
        jwk["kty"] = "OKP";
        jwk["crv"] = "Ed25519";
        jwk["x"]   = b64url_encode(pk, len);
        return jwk;
    }

    const CurveInfo* curve = curve_by_group(group_name_of(pkey_.get()));
    if (!curve) throw KeyError("unsupported EC curve");

    BIGNUM* bx = nullptr;
    BIGNUM* by = nullptr;
    if (EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_EC_PUB_X, &bx) != 1 ||
        EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_EC_PUB_Y, &by) != 1) {
        BN_free(bx);
        BN_free(by);
        throw KeyError("cannot export EC public point");
    }
    BnPtr x(bx, BN_free);
    BnPtr y(by, BN_free);

    std::vector<unsigned char> xb(curve->coord_len), yb(curve->coord_len);
    if (BN_bn2binpad(x.get(), xb.data(), (int)xb.size()) != (int)xb.size() ||
        BN_bn2binpad(y.get(), yb.data(), (int)yb.size()) != (int)yb.size()) {
        throw KeyError("EC coordinate export failed");
    }

    jwk["kty"] = "EC";
    jwk["crv"] = curve->jwk_crv;
    jwk["x"]   = b64url_encode(xb);
    jwk["y"]   = b64url_encode(yb);
    return jwk;
}

//------------------------------------------------------------------------------
// Verification
//------------------------------------------------------------------------------

bool verify_signature(const std::string& payload,
                      const std::string& signature_b64url,
                      const nlohmann::json& jwk) {
    if (!jwk.is_object()) throw KeyError("jwk must be object");
    const std::string kty = (jwk.contains("kty") && jwk["kty"].is_string()) ? jwk["kty"].get<std::string>() : "";
    const std::string crv = (jwk.contains("crv") && jwk["crv"].is_string()) ? jwk["crv"].get<std::string>() : "";

    const std::string digest = sha256_raw(payload);
    const auto* tbs = reinterpret_cast<const unsigned char*>(digest.data());

    std::vector<unsigned char> sig;
    bool sig_decoded = true;
    try {
        sig = b64url_decode(signature_b64url);
    } catch (const std::exception&) {
        sig_decoded = false;
    }

    if (kty == "OKP") {
        if (crv != "Ed25519") throw KeyError("unsupported OKP curve: " + crv);
        const auto pk = jwk_coord(jwk, "x", crypto_sign_PUBLICKEYBYTES);
        if (!sig_decoded || sig.size() != crypto_sign_BYTES) return false;
        return crypto_sign_verify_detached(sig.data(), tbs, (unsigned long long)digest.size(), pk.data()) == 0;
    }

    if (kty != "EC") throw KeyError("unsupported kty: " + kty);

    const CurveInfo* curve = curve_by_crv(crv);
    if (!curve) throw KeyError("unsupported EC curve: " + crv);

    PkeyPtr pkey = ec_public_from_jwk(jwk, *curve);

    if (!sig_decoded) return false;
    std::vector<unsigned char> der;
    if (!rs_to_der(sig, curve->coord_len, &der)) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey.get()) != 1)
        throw KeyError("EVP_DigestVerifyInit failed");

    return EVP_DigestVerify(ctx.get(), der.data(), der.size(), tbs, digest.size()) == 1;
}

} // namespace anpwba
