#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace lanbeam::core::feedback {

struct FileReceivingProgress {
    std::string session_id;
    std::string filename;
    uint64_t bytes_received;
    uint64_t bytes_total;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(
        FileReceivingProgress, session_id, filename, bytes_received, bytes_total);
};

} // namespace lanbeam::core::feedback
