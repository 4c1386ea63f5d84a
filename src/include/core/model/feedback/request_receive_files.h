#pragma once

#include "core/model/device_info.h"
#include "core/model/dto/file_dto.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <vector>

namespace lanbeam::core::feedback {

// A prepare-upload request waiting for a decision.
struct RequestReceiveFiles {
    DeviceInfo sender;
    std::vector<FileDto> files;
    uint64_t total_size = 0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(RequestReceiveFiles, sender, files, total_size);
};

} // namespace lanbeam::core::feedback
