#include <core/security/file_hasher.h>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace lanbeam::core {

Sha256::Sha256()
    : context_(EVP_MD_CTX_new()) {
    if (!context_ || EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA-256 context");
    }
}

void Sha256::Update(const void* data, std::size_t size) {
    if (size > 0 && EVP_DigestUpdate(context_.get(), data, size) != 1) {
        throw std::runtime_error("SHA-256 update failed");
    }
}

std::string Sha256::HexDigest() {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(context_.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("SHA-256 finalization failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; i++) {
        hex.push_back(kHex[hash[i] >> 4]);
        hex.push_back(kHex[hash[i] & 0x0F]);
    }
    return hex;
}

std::string FileHasher::CalculateFileChecksum(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open file for checksum calculation: "
                                 + file_path.string());
    }

    Sha256 sha;
    constexpr size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    while (file) {
        file.read(buffer.data(), buffer_size);
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read > 0) {
            sha.Update(buffer.data(), bytes_read);
        }
    }
    if (file.bad()) {
        throw std::runtime_error("Failed to read file for checksum calculation: "
                                 + file_path.string());
    }
    return sha.HexDigest();
}

std::string FileHasher::CalculateDataChecksum(std::string_view data) {
    Sha256 sha;
    sha.Update(data);
    return sha.HexDigest();
}

} // namespace lanbeam::core
