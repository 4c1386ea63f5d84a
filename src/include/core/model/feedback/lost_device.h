#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace lanbeam::core::feedback {

struct LostDevice {
    std::string fingerprint;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(LostDevice, fingerprint);
};

} // namespace lanbeam::core::feedback
