#include <algorithm>
#include <core/network/client/byte_source.h>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace lanbeam::core {

FileByteSource::FileByteSource(const std::filesystem::path& path)
    : path_(path)
    , stream_(path, std::ios::binary) {
    if (!stream_.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }
}

std::size_t FileByteSource::Read(char* data, std::size_t size) {
    stream_.read(data, static_cast<std::streamsize>(size));
    if (stream_.bad()) {
        throw std::runtime_error("Failed to read file: " + path_.string());
    }
    return static_cast<std::size_t>(stream_.gcount());
}

MemoryByteSource::MemoryByteSource(std::string data)
    : data_(std::move(data)) {}

std::size_t MemoryByteSource::Read(char* data, std::size_t size) {
    std::size_t n = std::min(size, data_.size() - offset_);
    std::memcpy(data, data_.data() + offset_, n);
    offset_ += n;
    return n;
}

} // namespace lanbeam::core
