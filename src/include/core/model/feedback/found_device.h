#pragma once

#include "core/model/device_info.h"

namespace lanbeam::core::feedback {

struct FoundDevice {
    DeviceInfo device_info;
    bool updated = false; // true when the fingerprint was known but stale

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(FoundDevice, device_info, updated);
};

} // namespace lanbeam::core::feedback
