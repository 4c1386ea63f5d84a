#pragma once

#include <string_view>

namespace lanbeam::core {

class ApiRoute {
public:
    static constexpr std::string_view kPrepareUpload = "/api/localsend/v2/prepare-upload";
    static constexpr std::string_view kUpload = "/api/localsend/v2/upload";
    static constexpr std::string_view kCancel = "/api/localsend/v2/cancel";
};

} // namespace lanbeam::core
