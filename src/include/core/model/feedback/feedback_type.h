#pragma once

#include <nlohmann/json.hpp>

namespace lanbeam::core {

enum class FeedbackType {
    kFoundDevice,             // a peer showed up or came back after going stale
    kLostDevice,              // a peer stopped announcing (fingerprint only)
    kRequestReceiveFiles,     // a prepare-upload request arrived
    kFileReceivingProgress,   // bytes written so far for one incoming file
    kFileReceivingCompleted,  // an incoming file was renamed into place
    kReceiveSessionEnded,     // an incoming session reached a terminal state
};

NLOHMANN_JSON_SERIALIZE_ENUM(FeedbackType,
                             {
                                 {FeedbackType::kFoundDevice, "FoundDevice"},
                                 {FeedbackType::kLostDevice, "LostDevice"},
                                 {FeedbackType::kRequestReceiveFiles, "RequestReceiveFiles"},
                                 {FeedbackType::kFileReceivingProgress, "FileReceivingProgress"},
                                 {FeedbackType::kFileReceivingCompleted, "FileReceivingCompleted"},
                                 {FeedbackType::kReceiveSessionEnded, "ReceiveSessionEnded"},
                             });

} // namespace lanbeam::core
