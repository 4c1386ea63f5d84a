#pragma once

#include "core/model/device_info.h"
#include <nlohmann/json.hpp>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace lanbeam::core {

// Discovery datagram. `announce` separates a proactive broadcast from a
// direct reply.
struct MulticastDto {
    DeviceInfo device;
    bool announce{true};

    bool operator==(const MulticastDto&) const = default;

    std::string Serialize() const {
        nlohmann::json j = device;
        j["announce"] = announce;
        return j.dump();
    }

    // Returns std::nullopt for anything that is not a well formed announcement.
    static std::optional<MulticastDto> Parse(std::string_view data,
                                             const DeviceInfoDefaults& defaults) {
        try {
            auto j = nlohmann::json::parse(data);
            if (!j.is_object()) {
                return std::nullopt;
            }
            MulticastDto dto;
            dto.device = ParseDeviceInfo(j, defaults);
            // v1 peers send `announcement` instead
            if (auto it = j.find("announce"); it != j.end() && !it->is_null()) {
                dto.announce = it->get<bool>();
            } else if (auto it = j.find("announcement"); it != j.end() && !it->is_null()) {
                dto.announce = it->get<bool>();
            } else {
                dto.announce = false;
            }
            return dto;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
};

} // namespace lanbeam::core
