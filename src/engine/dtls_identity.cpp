// MediaRelay - WebRTC SFU Signaling Server
// DTLS Identity Implementation (OpenSSL)

#include "mediarelay/engine/dtls_identity.hpp"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/x509.h>

#include <cstdio>

namespace mediarelay {
namespace engine {

namespace {

constexpr long CERTIFICATE_VALIDITY_SECONDS = 30L * 24 * 60 * 60;

std::string lastOpenSslError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "unknown OpenSSL error";
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return buffer;
}

EVP_PKEY* generateKey() {
    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (ctx == nullptr) {
        return nullptr;
    }

    EVP_PKEY* key = nullptr;
    if (EVP_PKEY_keygen_init(ctx) <= 0 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_X9_62_prime256v1) <= 0 ||
        EVP_PKEY_keygen(ctx, &key) <= 0) {
        key = nullptr;
    }
    EVP_PKEY_CTX_free(ctx);
    return key;
}

bool setRandomSerial(X509* certificate) {
    unsigned char bytes[8];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        return false;
    }
    bytes[0] &= 0x7f;  // keep the serial positive

    BIGNUM* serial = BN_bin2bn(bytes, sizeof(bytes), nullptr);
    if (serial == nullptr) {
        return false;
    }
    bool ok = BN_to_ASN1_INTEGER(serial, X509_get_serialNumber(certificate)) != nullptr;
    BN_free(serial);
    return ok;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

DtlsIdentity::DtlsIdentity(EVP_PKEY* key, X509* certificate, DtlsFingerprint fingerprint)
    : key_(key)
    , certificate_(certificate)
    , fingerprint_(std::move(fingerprint))
{
}

DtlsIdentity::~DtlsIdentity() {
    if (certificate_ != nullptr) {
        X509_free(certificate_);
    }
    if (key_ != nullptr) {
        EVP_PKEY_free(key_);
    }
}

core::Result<std::unique_ptr<DtlsIdentity>, DtlsIdentityError> DtlsIdentity::generate(
    const std::string& commonName
) {
    using R = core::Result<std::unique_ptr<DtlsIdentity>, DtlsIdentityError>;

    EVP_PKEY* key = generateKey();
    if (key == nullptr) {
        return R::error(DtlsIdentityError{DtlsIdentityError::Code::KeyGenerationFailed,
                                          "EC key generation failed: " + lastOpenSslError()});
    }

    X509* certificate = X509_new();
    if (certificate == nullptr) {
        EVP_PKEY_free(key);
        return R::error(DtlsIdentityError{DtlsIdentityError::Code::CertificateFailed,
                                          "X509_new failed: " + lastOpenSslError()});
    }

    bool ok = X509_set_version(certificate, 2) == 1 &&
              setRandomSerial(certificate) &&
              X509_gmtime_adj(X509_getm_notBefore(certificate), -24L * 60 * 60) != nullptr &&
              X509_gmtime_adj(X509_getm_notAfter(certificate), CERTIFICATE_VALIDITY_SECONDS) != nullptr &&
              X509_set_pubkey(certificate, key) == 1;

    if (ok) {
        X509_NAME* name = X509_get_subject_name(certificate);
        ok = X509_NAME_add_entry_by_txt(
                 name, "CN", MBSTRING_ASC,
                 reinterpret_cast<const unsigned char*>(commonName.c_str()), -1, -1, 0) == 1 &&
             X509_set_issuer_name(certificate, name) == 1 &&
             X509_sign(certificate, key, EVP_sha256()) > 0;
    }

    if (!ok) {
        std::string reason = lastOpenSslError();
        X509_free(certificate);
        EVP_PKEY_free(key);
        return R::error(DtlsIdentityError{DtlsIdentityError::Code::CertificateFailed,
                                          "Self-signed certificate creation failed: " + reason});
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    if (X509_digest(certificate, EVP_sha256(), digest, &digestLength) != 1) {
        std::string reason = lastOpenSslError();
        X509_free(certificate);
        EVP_PKEY_free(key);
        return R::error(DtlsIdentityError{DtlsIdentityError::Code::DigestFailed,
                                          "Certificate digest failed: " + reason});
    }

    std::string value;
    value.reserve(digestLength * 3);
    for (unsigned int i = 0; i < digestLength; ++i) {
        char hex[4];
        std::snprintf(hex, sizeof(hex), i == 0 ? "%02X" : ":%02X", digest[i]);
        value += hex;
    }

    return R::success(std::unique_ptr<DtlsIdentity>(
        new DtlsIdentity(key, certificate, DtlsFingerprint{"sha-256", value})));
}

std::string DtlsIdentity::certificatePem() const {
    BIO* bio = BIO_new(BIO_s_mem());
    if (bio == nullptr) {
        return "";
    }

    std::string pem;
    if (PEM_write_bio_X509(bio, certificate_) == 1) {
        char* data = nullptr;
        long length = BIO_get_mem_data(bio, &data);
        if (length > 0 && data != nullptr) {
            pem.assign(data, static_cast<size_t>(length));
        }
    }
    BIO_free(bio);
    return pem;
}

bool isSupportedFingerprintAlgorithm(const std::string& algorithm) {
    return algorithm == "sha-1" || algorithm == "sha-224" || algorithm == "sha-256" ||
           algorithm == "sha-384" || algorithm == "sha-512";
}

} // namespace engine
} // namespace mediarelay
