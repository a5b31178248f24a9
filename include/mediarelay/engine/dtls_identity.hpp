// MediaRelay - WebRTC SFU Signaling Server
// DTLS Identity - ephemeral certificate announced in DTLS parameters

#ifndef MEDIARELAY_ENGINE_DTLS_IDENTITY_HPP
#define MEDIARELAY_ENGINE_DTLS_IDENTITY_HPP

#include <memory>
#include <string>

#include "mediarelay/core/result.hpp"
#include "mediarelay/engine/rtp_capabilities.hpp"

// Forward declarations for OpenSSL types
typedef struct x509_st X509;
typedef struct evp_pkey_st EVP_PKEY;

namespace mediarelay {
namespace engine {

struct DtlsIdentityError {
    enum class Code {
        KeyGenerationFailed,
        CertificateFailed,
        DigestFailed
    };

    Code code;
    std::string message;

    DtlsIdentityError(Code c = Code::CertificateFailed, std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Self-signed P-256 certificate generated at startup.
 *
 * Browsers pin the certificate through the fingerprint in the transport's
 * DTLS parameters, so it never has to chain to a CA.
 */
class DtlsIdentity {
public:
    ~DtlsIdentity();

    DtlsIdentity(const DtlsIdentity&) = delete;
    DtlsIdentity& operator=(const DtlsIdentity&) = delete;

    /**
     * @brief Generate a key pair and a certificate valid for 30 days.
     *
     * @param commonName Subject and issuer CN
     */
    static core::Result<std::unique_ptr<DtlsIdentity>, DtlsIdentityError> generate(
        const std::string& commonName = "mediarelay"
    );

    /**
     * @brief SHA-256 fingerprint, colon separated upper-case hex.
     */
    [[nodiscard]] const DtlsFingerprint& fingerprint() const { return fingerprint_; }

    /**
     * @brief Certificate in PEM form.
     */
    [[nodiscard]] std::string certificatePem() const;

private:
    DtlsIdentity(EVP_PKEY* key, X509* certificate, DtlsFingerprint fingerprint);

    EVP_PKEY* key_;
    X509* certificate_;
    DtlsFingerprint fingerprint_;
};

/**
 * @brief Whether a fingerprint algorithm name is one browsers may send.
 */
bool isSupportedFingerprintAlgorithm(const std::string& algorithm);

} // namespace engine
} // namespace mediarelay

#endif // MEDIARELAY_ENGINE_DTLS_IDENTITY_HPP
