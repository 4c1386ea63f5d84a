#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace lanbeam::core {

struct FileDto;

// Sequential reader over the bytes of one file in a manifest.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Reads up to `size` bytes; returns 0 at the end. Throws on read errors.
    virtual std::size_t Read(char* data, std::size_t size) = 0;
};

class FileByteSource : public ByteSource {
public:
    explicit FileByteSource(const std::filesystem::path& path);

    std::size_t Read(char* data, std::size_t size) override;

private:
    std::filesystem::path path_;
    std::ifstream stream_;
};

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::string data);

    std::size_t Read(char* data, std::size_t size) override;

private:
    std::string data_;
    std::size_t offset_{0};
};

// Opens the bytes behind a file id the receiver accepted.
class SourceProvider {
public:
    virtual ~SourceProvider() = default;

    virtual std::unique_ptr<ByteSource> Open(const FileDto& file) const = 0;
};

} // namespace lanbeam::core
