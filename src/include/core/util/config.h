/*
    config.h
    Application settings backed by a TOML file.

    [setting]
    alias = "my-laptop"
    port = 53317
    https = true
    save-dir = "/home/me/Downloads"
    quick-save = false
    multicast-group = "224.0.0.167"
    multicast-port = 53317
    announce-interval = 5      # seconds
    device-ttl = 10            # seconds
    upload-concurrency = 4
    chunk-size = 65536         # bytes
    decision-timeout = 60      # seconds
    session-timeout = 300      # seconds
    device-type = "desktop"
    device-model = "Linux"
    certificate-dir = "/home/me/.local/share/lanbeam/certificates"

    Core components receive a copy of `Settings`; only the command line layer
    touches the global `settings` instance.
*/

#pragma once

#include "core/constant/path.h"
#include "core/constant/protocol.h"
#include "core/constant/transfer.h"
#include "core/model/device_type.h"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace lanbeam::core {

inline toml::table config;

struct Settings {
    std::string alias;        // Display name, hostname when empty
    std::string device_model; // Operating system name when empty
    DeviceType device_type{DeviceType::kHeadless};
    std::uint16_t port{protocol::kDefaultHttpPort};
    std::string multicast_group{protocol::kDefaultMulticastGroup};
    std::uint16_t multicast_port{protocol::kDefaultMulticastPort};
    bool https{true};
    std::filesystem::path save_dir{path::kSystemDownloadDir};
    bool quick_save{false};
    std::chrono::seconds announce_interval{protocol::kDefaultAnnounceInterval};
    std::chrono::seconds device_ttl{protocol::kDefaultDeviceTtl};
    std::size_t upload_concurrency{transfer::kDefaultUploadConcurrency};
    std::size_t chunk_size{transfer::kDefaultChunkSize};
    std::chrono::seconds decision_timeout{transfer::kDefaultDecisionTimeout};
    std::chrono::seconds session_timeout{transfer::kDefaultSessionTimeout};
    std::filesystem::path certificate_dir{path::kCertificateDir};
};

inline Settings settings;

// Loads `path` into `config` and `settings`. A missing file is created empty;
// a file that fails to parse is logged and leaves the defaults in place.
void LoadConfig(const std::filesystem::path& path = path::kConfigDir / "config.toml");

// Overrides every field of `target` that `table["setting"]` names. Values of
// the wrong type or out of range are logged and ignored.
void ApplyConfig(const toml::table& table, Settings& target);

} // namespace lanbeam::core
