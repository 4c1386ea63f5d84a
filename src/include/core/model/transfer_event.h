#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lanbeam::core {

enum class TransferEventKind {
    kProgress,
    kCompleted,
    kFailed,
    kCancelled,
    kRejected,
};

inline std::string_view TransferEventKindToString(TransferEventKind kind) {
    switch (kind) {
    case TransferEventKind::kProgress:
        return "Progress";
    case TransferEventKind::kCompleted:
        return "Completed";
    case TransferEventKind::kFailed:
        return "Failed";
    case TransferEventKind::kCancelled:
        return "Cancelled";
    case TransferEventKind::kRejected:
        return "Rejected";
    }
    return "Unknown";
}

// One entry of the sender's progress stream. Progress events carry the
// cumulative byte count; every file ends with exactly one terminal event.
struct TransferEvent {
    std::string session_id;
    std::string file_id;
    std::string file_name;
    TransferEventKind kind{TransferEventKind::kProgress};
    uint64_t bytes_transferred{0};
    uint64_t bytes_total{0};
    std::string error;

    bool IsTerminal() const { return kind != TransferEventKind::kProgress; }
};

} // namespace lanbeam::core
