#pragma once

#include "../file_type.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace lanbeam::core {

struct FileDto {
    std::string id;        // unique inside one manifest
    std::string file_name; // may contain '/' for files sent as part of a directory
    uint64_t size{0};
    FileType file_type{FileType::kOther};
    std::optional<std::string> sha256;
    std::optional<std::string> preview;

    bool operator==(const FileDto&) const = default;
};

inline void to_json(nlohmann::json& j, const FileDto& file) {
    j = nlohmann::json{
        {"id", file.id},
        {"fileName", file.file_name},
        {"size", file.size},
        {"fileType", file.file_type},
    };
    if (file.sha256) {
        j["sha256"] = *file.sha256;
    }
    if (file.preview) {
        j["preview"] = *file.preview;
    }
}

inline void from_json(const nlohmann::json& j, FileDto& file) {
    file.id = j.at("id").get<std::string>();
    file.file_name = j.at("fileName").get<std::string>();
    file.size = j.at("size").get<uint64_t>();
    file.file_type = j.value("fileType", FileType::kOther);
    file.sha256.reset();
    file.preview.reset();
    if (auto it = j.find("sha256"); it != j.end() && !it->is_null()) {
        file.sha256 = it->get<std::string>();
    }
    if (auto it = j.find("preview"); it != j.end() && !it->is_null()) {
        file.preview = it->get<std::string>();
    }
    if (file.id.empty() || file.file_name.empty()) {
        throw std::invalid_argument("empty file id or name");
    }
}

} // namespace lanbeam::core
