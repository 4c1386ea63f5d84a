#pragma once

#include <filesystem>
#include <memory>
#include <openssl/evp.h>
#include <string>
#include <string_view>

namespace lanbeam::core {

// Incremental SHA-256; digests are lowercase hex.
class Sha256 {
public:
    Sha256();

    void Update(const void* data, std::size_t size);
    void Update(std::string_view data) { Update(data.data(), data.size()); }

    // Finishes the digest; the object must not be updated afterwards.
    std::string HexDigest();

private:
    struct ContextDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, ContextDeleter> context_;
};

class FileHasher {
public:
    static std::string CalculateFileChecksum(const std::filesystem::path& file_path);
    static std::string CalculateDataChecksum(std::string_view data);
};

} // namespace lanbeam::core
