#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string_view>

namespace lanbeam::core {

enum class DeviceType {
    kMobile,
    kDesktop,
    kWeb,
    kHeadless,
    kServer,
};

NLOHMANN_JSON_SERIALIZE_ENUM(DeviceType,
                             {
                                 {DeviceType::kDesktop, "desktop"},
                                 {DeviceType::kMobile, "mobile"},
                                 {DeviceType::kWeb, "web"},
                                 {DeviceType::kHeadless, "headless"},
                                 {DeviceType::kServer, "server"},
                             })

inline std::string_view DeviceTypeToString(DeviceType type) {
    switch (type) {
    case DeviceType::kMobile:
        return "mobile";
    case DeviceType::kDesktop:
        return "desktop";
    case DeviceType::kWeb:
        return "web";
    case DeviceType::kHeadless:
        return "headless";
    case DeviceType::kServer:
        return "server";
    }
    return "desktop";
}

inline std::optional<DeviceType> DeviceTypeFromString(std::string_view name) {
    for (auto type : {DeviceType::kMobile,
                      DeviceType::kDesktop,
                      DeviceType::kWeb,
                      DeviceType::kHeadless,
                      DeviceType::kServer}) {
        if (DeviceTypeToString(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

} // namespace lanbeam::core
