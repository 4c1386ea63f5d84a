#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace lanbeam::core {

namespace protocol {

inline constexpr std::string_view kVersion = "2.0";
inline constexpr std::string_view kFallbackVersion = "1.0";

inline constexpr std::string_view kDefaultMulticastGroup = "224.0.0.167";
inline constexpr uint16_t kDefaultMulticastPort = 53317;
inline constexpr uint16_t kDefaultHttpPort = 53317;

inline constexpr std::chrono::seconds kDefaultAnnounceInterval{5};
inline constexpr std::chrono::seconds kDefaultDeviceTtl{10};

inline constexpr std::size_t kMaxDatagramSize = 4096;

} // namespace protocol

} // namespace lanbeam::core
