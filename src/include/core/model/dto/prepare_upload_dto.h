#pragma once

#include "core/model/device_info.h"
#include "file_dto.h"
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace lanbeam::core {

struct PrepareUploadRequestDto {
    DeviceInfo info;
    std::map<std::string, FileDto> files;

    bool operator==(const PrepareUploadRequestDto&) const = default;
};

inline void to_json(nlohmann::json& j, const PrepareUploadRequestDto& dto) {
    j = nlohmann::json{{"info", dto.info}, {"files", dto.files}};
}

inline PrepareUploadRequestDto ParsePrepareUploadRequest(const nlohmann::json& j,
                                                         const DeviceInfoDefaults& defaults) {
    PrepareUploadRequestDto dto;
    dto.info = ParseDeviceInfo(j.at("info"), defaults);
    for (const auto& [key, value] : j.at("files").items()) {
        FileDto file = value.get<FileDto>();
        if (file.id != key) {
            throw std::invalid_argument("file id does not match its key");
        }
        dto.files.emplace(key, std::move(file));
    }
    return dto;
}

inline void from_json(const nlohmann::json& j, PrepareUploadRequestDto& dto) {
    dto = ParsePrepareUploadRequest(j, DeviceInfoDefaults{});
}

struct PrepareUploadResponseDto {
    std::string session_id;
    std::map<std::string, std::string> files; // file id -> token

    bool operator==(const PrepareUploadResponseDto&) const = default;
};

inline void to_json(nlohmann::json& j, const PrepareUploadResponseDto& dto) {
    j = nlohmann::json{{"sessionId", dto.session_id}, {"files", dto.files}};
}

inline void from_json(const nlohmann::json& j, PrepareUploadResponseDto& dto) {
    dto.session_id = j.at("sessionId").get<std::string>();
    dto.files = j.at("files").get<std::map<std::string, std::string>>();
}

} // namespace lanbeam::core
