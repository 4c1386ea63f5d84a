#pragma once

#include "core/model/session_status.h"
#include <nlohmann/json.hpp>
#include <string>

namespace lanbeam::core::feedback {

struct ReceiveSessionEnd {
    std::string session_id;
    std::string status; // SessionStatusToString of the final state
    bool cancelled_by_sender = false;
    std::string error;

    bool completed() const { return status == SessionStatusToString(SessionStatus::kCompleted); }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(ReceiveSessionEnd, session_id, status, cancelled_by_sender, error);
};

} // namespace lanbeam::core::feedback
