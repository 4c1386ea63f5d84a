#pragma once

#include <chrono>
#include <cstddef>

namespace lanbeam::core {

namespace transfer {

constexpr std::size_t kDefaultChunkSize = 64 * 1024; // 64 KiB
constexpr std::size_t kMaxJsonBodySize = 16 * 1024 * 1024;
constexpr std::size_t kMaxPreviewSize = 1024;
constexpr std::size_t kDefaultUploadConcurrency = 4;
constexpr std::size_t kProgressChannelCapacity = 256;

constexpr std::chrono::seconds kDefaultDecisionTimeout{60};
constexpr std::chrono::seconds kDefaultSessionTimeout{300};
constexpr std::chrono::seconds kSessionSweepInterval{10};
constexpr std::chrono::seconds kConnectTimeout{10};
constexpr std::chrono::seconds kIoTimeout{30};

} // namespace transfer

} // namespace lanbeam::core
