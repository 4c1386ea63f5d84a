#pragma once

#include <string_view>

namespace lanbeam::core {

enum class FileStatus {
    kQueued,
    kRejected, // left out of the receiver's token map
    kTransferring,
    kCompleted,
    kFailed,
    kCancelled,
};

inline bool IsTerminal(FileStatus status) {
    return status == FileStatus::kRejected || status == FileStatus::kCompleted
           || status == FileStatus::kFailed || status == FileStatus::kCancelled;
}

inline std::string_view FileStatusToString(FileStatus status) {
    switch (status) {
    case FileStatus::kQueued:
        return "Queued";
    case FileStatus::kRejected:
        return "Rejected";
    case FileStatus::kTransferring:
        return "Transferring";
    case FileStatus::kCompleted:
        return "Completed";
    case FileStatus::kFailed:
        return "Failed";
    case FileStatus::kCancelled:
        return "Cancelled";
    }
    return "Unknown";
}

} // namespace lanbeam::core
