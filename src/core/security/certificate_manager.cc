#include <boost/asio/ip/host_name.hpp>
#include <cctype>
#include <core/security/certificate_manager.h>
#include <core/security/file_hasher.h>
#include <core/security/open_ssl_provider.h>
#include <fstream>
#include <memory>
#include <spdlog/spdlog.h>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lanbeam::core {

namespace {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct X509Deleter {
    void operator()(X509* x509) const { X509_free(x509); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* pkey) const { EVP_PKEY_free(pkey); }
};
struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using X509Ptr = std::unique_ptr<X509, X509Deleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

std::string bioToString(BIO* bio) {
    char* buf = nullptr;
    long len = BIO_get_mem_data(bio, &buf);
    return std::string(buf, len);
}

std::string readFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::stringstream stream;
    stream << file.rdbuf();
    return stream.str();
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

CertificateManager::CertificateManager(const fs::path& cert_dir)
    : certificate_dir_(cert_dir) {
    OpenSSLProvider::InitOpenSSL();
}

bool CertificateManager::InitSecurityContext() {
    std::error_code ec;
    fs::create_directories(certificate_dir_, ec);
    if (ec) {
        spdlog::error("Failed to create certificate directory {}: {}",
                      certificate_dir_.string(),
                      ec.message());
        return false;
    }

    if (loadSecurityContext()) {
        spdlog::info("Loaded existing certificate with fingerprint: {}",
                     security_context_.fingerprint);
        return true;
    }

    if (generateSelfSignedCertificate()) {
        spdlog::info("Generated new self-signed certificate with fingerprint: {}",
                     security_context_.fingerprint);
        return saveSecurityContext();
    }

    return false;
}

const SecurityContext& CertificateManager::security_context() const {
    return security_context_;
}

const std::string& CertificateManager::fingerprint() const {
    return security_context_.fingerprint;
}

std::string CertificateManager::FingerprintOf(X509* certificate) {
    if (certificate == nullptr) {
        return {};
    }
    EVP_PKEY* pkey = X509_get0_pubkey(certificate);
    if (pkey == nullptr) {
        return {};
    }
    int len = i2d_PUBKEY(pkey, nullptr);
    if (len <= 0) {
        return {};
    }
    std::string der(static_cast<std::size_t>(len), '\0');
    auto* out = reinterpret_cast<unsigned char*>(der.data());
    if (i2d_PUBKEY(pkey, &out) != len) {
        return {};
    }
    return FileHasher::CalculateDataChecksum(der);
}

std::string CertificateManager::FingerprintOfPem(std::string_view certificate_pem) {
    BioPtr bio(BIO_new_mem_buf(certificate_pem.data(), static_cast<int>(certificate_pem.size())));
    if (!bio) {
        return {};
    }
    X509Ptr certificate(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr));
    return FingerprintOf(certificate.get());
}

bool CertificateManager::Verify(std::string_view peer_fingerprint, X509* presented) {
    std::string actual = FingerprintOf(presented);
    if (actual.empty() || peer_fingerprint.empty()) {
        return false;
    }
    if (!equalsIgnoreCase(actual, peer_fingerprint)) {
        spdlog::warn("Certificate fingerprint mismatch: announced {}, presented {}",
                     peer_fingerprint,
                     actual);
        return false;
    }
    return true;
}

bool CertificateManager::generateSelfSignedCertificate() {
    try {
        spdlog::info("Generating 2048-bit RSA key pair...");
        PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr));
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0) {
            throw std::runtime_error("Failed to initialize RSA key generation");
        }
        if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), 2048) <= 0) {
            throw std::runtime_error("Failed to set RSA key size");
        }
        EVP_PKEY* raw_pkey = nullptr;
        if (EVP_PKEY_keygen(ctx.get(), &raw_pkey) <= 0) {
            throw std::runtime_error("Failed to generate RSA key pair");
        }
        PkeyPtr pkey(raw_pkey);

        X509Ptr x509(X509_new());
        if (!x509) {
            throw std::runtime_error("Failed to allocate certificate");
        }
        X509_set_version(x509.get(), 2);
        ASN1_INTEGER_set(X509_get_serialNumber(x509.get()), 1);
        X509_gmtime_adj(X509_getm_notBefore(x509.get()), 0);
        X509_gmtime_adj(X509_getm_notAfter(x509.get()), 60L * 60 * 24 * kCertValidityDays);
        X509_set_pubkey(x509.get(), pkey.get());

        std::string hostname = boost::asio::ip::host_name();
        X509_NAME* name = X509_get_subject_name(x509.get());
        X509_NAME_add_entry_by_txt(name,
                                   "CN",
                                   MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>(hostname.c_str()),
                                   -1,
                                   -1,
                                   0);
        X509_NAME_add_entry_by_txt(name,
                                   "O",
                                   MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("LanBeam"),
                                   -1,
                                   -1,
                                   0);
        X509_set_issuer_name(x509.get(), name);

        if (X509_sign(x509.get(), pkey.get(), EVP_sha256()) == 0) {
            throw std::runtime_error("Failed to sign certificate");
        }

        BioPtr private_bio(BIO_new(BIO_s_mem()));
        BioPtr public_bio(BIO_new(BIO_s_mem()));
        BioPtr cert_bio(BIO_new(BIO_s_mem()));
        if (!private_bio || !public_bio || !cert_bio
            || !PEM_write_bio_PrivateKey(private_bio.get(),
                                         pkey.get(),
                                         nullptr,
                                         nullptr,
                                         0,
                                         nullptr,
                                         nullptr)
            || !PEM_write_bio_PUBKEY(public_bio.get(), pkey.get())
            || !PEM_write_bio_X509(cert_bio.get(), x509.get())) {
            throw std::runtime_error("Failed to encode key material");
        }

        security_context_.private_key_pem = bioToString(private_bio.get());
        security_context_.public_key_pem = bioToString(public_bio.get());
        security_context_.certificate_pem = bioToString(cert_bio.get());
        security_context_.fingerprint = FingerprintOf(x509.get());
        return !security_context_.fingerprint.empty();
    } catch (const std::exception& e) {
        spdlog::error("Certificate generation error: {}", e.what());
        return false;
    }
}

bool CertificateManager::saveSecurityContext() {
    auto write = [](const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << content;
        return static_cast<bool>(file);
    };

    auto private_key_path = certificate_dir_ / "private_key.pem";
    if (!write(private_key_path, security_context_.private_key_pem)
        || !write(certificate_dir_ / "public_key.pem", security_context_.public_key_pem)
        || !write(certificate_dir_ / "certificate.pem", security_context_.certificate_pem)) {
        spdlog::error("Failed to save security context to {}", certificate_dir_.string());
        return false;
    }

    std::error_code ec;
    fs::permissions(private_key_path,
                    fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace,
                    ec);
    if (ec) {
        spdlog::warn("Failed to restrict permissions of {}: {}",
                     private_key_path.string(),
                     ec.message());
    }
    return true;
}

bool CertificateManager::loadSecurityContext() {
    std::error_code ec;
    if (!fs::exists(certificate_dir_ / "private_key.pem", ec)
        || !fs::exists(certificate_dir_ / "public_key.pem", ec)
        || !fs::exists(certificate_dir_ / "certificate.pem", ec)) {
        return false;
    }

    security_context_.private_key_pem = readFile(certificate_dir_ / "private_key.pem");
    security_context_.public_key_pem = readFile(certificate_dir_ / "public_key.pem");
    security_context_.certificate_pem = readFile(certificate_dir_ / "certificate.pem");

    // recomputed so an edited file cannot announce a key it does not hold
    security_context_.fingerprint = FingerprintOfPem(security_context_.certificate_pem);

    if (security_context_.private_key_pem.empty() || security_context_.fingerprint.empty()) {
        spdlog::warn("Stored certificate in {} is unusable, regenerating",
                     certificate_dir_.string());
        return false;
    }
    return true;
}

} // namespace lanbeam::core
