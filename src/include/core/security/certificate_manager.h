#pragma once

#include <core/model/security_context.h>
#include <filesystem>
#include <openssl/x509.h>
#include <string>
#include <string_view>

namespace lanbeam::core {

// Owns this device's self-signed certificate. The fingerprint announced to
// peers is the SHA-256 digest of the DER encoded public key, so it survives
// certificate renewal as long as the key pair is kept.
class CertificateManager {
public:
    explicit CertificateManager(const std::filesystem::path& cert_dir);

    // Loads the key pair and certificate from disk, generating and saving a
    // new one when none is usable.
    bool InitSecurityContext();

    const SecurityContext& security_context() const;

    const std::string& fingerprint() const;

    static std::string FingerprintOf(X509* certificate);

    static std::string FingerprintOfPem(std::string_view certificate_pem);

    // True when `presented` carries the key `peer_fingerprint` was derived
    // from. Comparison ignores hex digit case.
    static bool Verify(std::string_view peer_fingerprint, X509* presented);

private:
    bool generateSelfSignedCertificate();

    bool saveSecurityContext();

    bool loadSecurityContext();

    SecurityContext security_context_;
    std::filesystem::path certificate_dir_;

    static constexpr int kCertValidityDays = 3650;
};

} // namespace lanbeam::core
