#include <core/util/config.h>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lanbeam::core {

namespace {

template<typename T>
void loadInteger(const toml::table& setting, std::string_view key, T& field, T min, T max) {
    auto node = setting[key];
    if (!node) {
        return;
    }
    auto value = node.value<int64_t>();
    if (!value || *value < static_cast<int64_t>(min) || *value > static_cast<int64_t>(max)) {
        spdlog::warn("Ignoring setting \"{}\": expected an integer in [{}, {}]", key, min, max);
        return;
    }
    field = static_cast<T>(*value);
}

void loadSeconds(const toml::table& setting, std::string_view key, std::chrono::seconds& field) {
    int64_t count = field.count();
    loadInteger<int64_t>(setting, key, count, 1, 24 * 60 * 60);
    field = std::chrono::seconds(count);
}

void loadString(const toml::table& setting, std::string_view key, std::string& field) {
    auto node = setting[key];
    if (!node) {
        return;
    }
    if (auto value = node.value<std::string>()) {
        field = *value;
    } else {
        spdlog::warn("Ignoring setting \"{}\": expected a string", key);
    }
}

void loadBool(const toml::table& setting, std::string_view key, bool& field) {
    auto node = setting[key];
    if (!node) {
        return;
    }
    if (auto value = node.value<bool>()) {
        field = *value;
    } else {
        spdlog::warn("Ignoring setting \"{}\": expected a boolean", key);
    }
}

void loadPath(const toml::table& setting, std::string_view key, fs::path& field) {
    std::string value = field.string();
    loadString(setting, key, value);
    field = value;
}

} // namespace

void ApplyConfig(const toml::table& table, Settings& target) {
    const toml::table* setting = table["setting"].as_table();
    if (setting == nullptr) {
        return;
    }

    loadString(*setting, "alias", target.alias);
    loadString(*setting, "device-model", target.device_model);
    loadInteger<std::uint16_t>(*setting, "port", target.port, 1, 65535);
    loadString(*setting, "multicast-group", target.multicast_group);
    loadInteger<std::uint16_t>(*setting, "multicast-port", target.multicast_port, 1, 65535);
    loadBool(*setting, "https", target.https);
    loadPath(*setting, "save-dir", target.save_dir);
    loadBool(*setting, "quick-save", target.quick_save);
    loadSeconds(*setting, "announce-interval", target.announce_interval);
    loadSeconds(*setting, "device-ttl", target.device_ttl);
    loadInteger<std::size_t>(*setting, "upload-concurrency", target.upload_concurrency, 1, 64);
    loadInteger<std::size_t>(*setting,
                             "chunk-size",
                             target.chunk_size,
                             1024,
                             16 * 1024 * 1024);
    loadSeconds(*setting, "decision-timeout", target.decision_timeout);
    loadSeconds(*setting, "session-timeout", target.session_timeout);
    loadPath(*setting, "certificate-dir", target.certificate_dir);

    std::string device_type{DeviceTypeToString(target.device_type)};
    loadString(*setting, "device-type", device_type);
    if (auto type = DeviceTypeFromString(device_type)) {
        target.device_type = *type;
    } else {
        spdlog::warn("Ignoring unknown device type \"{}\"", device_type);
    }
}

void LoadConfig(const fs::path& path) {
    std::error_code ec;
    if (path.has_parent_path() && !fs::exists(path.parent_path(), ec)) {
        spdlog::info("Config directory does not exist, creating...");
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("Failed to create \"{}\": {}", path.parent_path().string(), ec.message());
        }
    }
    if (!fs::exists(path, ec)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    ApplyConfig(config, settings);
}

} // namespace lanbeam::core
