#pragma once

#include "feedback/feedback_type.h"
#include "feedback/file_receiving_completed.h"
#include "feedback/file_receiving_progress.h"
#include "feedback/found_device.h"
#include "feedback/lost_device.h"
#include "feedback/receive_session_end.h"
#include "feedback/request_receive_files.h"
#include <functional>
#include <nlohmann/json.hpp>

namespace lanbeam::core {

struct Feedback {
    FeedbackType type;
    nlohmann::json data;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Feedback, type, data);
};

// Called from whichever thread runs the reporting component; implementations
// must be cheap and must not block.
using FeedbackCallback = std::function<void(const Feedback&)>;

} // namespace lanbeam::core
