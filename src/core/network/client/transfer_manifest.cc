#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/constant/transfer.h>
#include <core/network/client/transfer_manifest.h>
#include <core/security/file_hasher.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lanbeam::core {

uint64_t TransferManifest::total_size() const {
    uint64_t total = 0;
    for (const auto& [id, file] : files_) {
        total += file.size;
    }
    return total;
}

std::unique_ptr<ByteSource> TransferManifest::Open(const FileDto& file) const {
    const Origin& origin = origins_.at(file.id);
    if (const auto* path = std::get_if<fs::path>(&origin)) {
        return std::make_unique<FileByteSource>(*path);
    }
    return std::make_unique<MemoryByteSource>(std::get<std::string>(origin));
}

TransferManifestBuilder::TransferManifestBuilder(bool with_checksums)
    : with_checksums_(with_checksums) {}

TransferManifestBuilder& TransferManifestBuilder::AddFile(const fs::path& path) {
    if (!fs::is_regular_file(path)) {
        throw std::runtime_error("Not a regular file: " + path.string());
    }
    addEntry(path, path.filename().string());
    return *this;
}

TransferManifestBuilder& TransferManifestBuilder::AddDirectory(const fs::path& dir) {
    if (!fs::is_directory(dir)) {
        throw std::runtime_error("Not a directory: " + dir.string());
    }
    fs::path root = fs::absolute(dir).lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    const fs::path base = root.parent_path();
    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        addEntry(entry.path(), entry.path().lexically_relative(base).generic_string());
    }
    return *this;
}

TransferManifestBuilder& TransferManifestBuilder::AddText(std::string text) {
    if (text.empty()) {
        spdlog::warn("Skipping empty text message");
        return *this;
    }
    FileDto file;
    file.id = newFileId();
    file.file_name = FileHasher::CalculateDataChecksum(text) + ".txt";
    file.size = text.size();
    file.file_type = FileType::kText;
    if (with_checksums_) {
        file.sha256 = FileHasher::CalculateDataChecksum(text);
    }
    if (text.size() < transfer::kMaxPreviewSize) {
        file.preview = text;
    }
    manifest_.origins_.emplace(file.id, std::move(text));
    manifest_.files_.emplace(file.id, std::move(file));
    return *this;
}

TransferManifestBuilder& TransferManifestBuilder::AddPath(const fs::path& path) {
    if (fs::is_directory(path)) {
        return AddDirectory(path);
    }
    return AddFile(path);
}

TransferManifest TransferManifestBuilder::Build() {
    return std::move(manifest_);
}

void TransferManifestBuilder::addEntry(const fs::path& path, std::string name) {
    uint64_t size = fs::file_size(path);
    if (size == 0) {
        spdlog::warn("Skipping empty file {}", path.string());
        return;
    }
    FileDto file;
    file.id = newFileId();
    file.file_type = GetFileType(name);
    file.file_name = std::move(name);
    file.size = size;
    if (with_checksums_) {
        file.sha256 = FileHasher::CalculateFileChecksum(path);
    }
    spdlog::debug("Manifest entry {} -> {} ({} bytes)", file.id, file.file_name, file.size);
    manifest_.origins_.emplace(file.id, path);
    manifest_.files_.emplace(file.id, std::move(file));
}

std::string TransferManifestBuilder::newFileId() {
    static thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace lanbeam::core
