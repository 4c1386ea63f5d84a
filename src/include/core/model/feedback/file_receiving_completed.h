#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lanbeam::core::feedback {

struct FileReceivingCompleted {
    std::string session_id;
    std::string filename;
    std::string saved_path;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FileReceivingCompleted, session_id, filename, saved_path);
};

} // namespace lanbeam::core::feedback
