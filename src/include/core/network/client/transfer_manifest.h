#pragma once

#include <core/model/dto/file_dto.h>
#include <core/network/client/byte_source.h>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace lanbeam::core {

// Files offered in one send, keyed by file id, plus where their bytes come
// from. Immutable once built.
class TransferManifest : public SourceProvider {
public:
    using Origin = std::variant<std::filesystem::path, std::string>;

    const std::map<std::string, FileDto>& files() const { return files_; }

    bool empty() const { return files_.empty(); }

    uint64_t total_size() const;

    // Throws std::out_of_range for an id not in the manifest and
    // std::runtime_error when the file can no longer be opened.
    std::unique_ptr<ByteSource> Open(const FileDto& file) const override;

private:
    friend class TransferManifestBuilder;

    std::map<std::string, FileDto> files_;
    std::map<std::string, Origin> origins_;
};

class TransferManifestBuilder {
public:
    explicit TransferManifestBuilder(bool with_checksums = false);

    // Throws std::runtime_error when `path` is not a regular file.
    TransferManifestBuilder& AddFile(const std::filesystem::path& path);

    // Adds every regular file below `dir`; names keep the directory itself as
    // their first component.
    TransferManifestBuilder& AddDirectory(const std::filesystem::path& dir);

    TransferManifestBuilder& AddText(std::string text);

    // Dispatches on what `path` is.
    TransferManifestBuilder& AddPath(const std::filesystem::path& path);

    TransferManifest Build();

private:
    void addEntry(const std::filesystem::path& path, std::string name);

    static std::string newFileId();

    bool with_checksums_;
    TransferManifest manifest_;
};

} // namespace lanbeam::core
