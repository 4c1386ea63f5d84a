#pragma once

#include <string_view>

namespace lanbeam::core {

enum class SessionStatus {
    kNegotiating,  // prepare-upload sent or received, waiting for a decision
    kAccepted,     // tokens issued, no bytes moved yet
    kRejected,     // nothing accepted
    kTransferring, // at least one upload started
    kCompleted,
    kCancelled,
    kFailed,
};

inline bool IsTerminal(SessionStatus status) {
    return status == SessionStatus::kRejected || status == SessionStatus::kCompleted
           || status == SessionStatus::kCancelled || status == SessionStatus::kFailed;
}

// Session states only move forward: nothing returns to kNegotiating and a
// terminal state is never left.
inline bool CanTransition(SessionStatus from, SessionStatus to) {
    if (IsTerminal(from) || from == to) {
        return false;
    }
    switch (to) {
    case SessionStatus::kNegotiating:
        return false;
    case SessionStatus::kAccepted:
    case SessionStatus::kRejected:
        return from == SessionStatus::kNegotiating;
    case SessionStatus::kTransferring:
        return from == SessionStatus::kAccepted;
    case SessionStatus::kCompleted:
        return from == SessionStatus::kAccepted || from == SessionStatus::kTransferring;
    case SessionStatus::kCancelled:
    case SessionStatus::kFailed:
        return true;
    }
    return false;
}

inline std::string_view SessionStatusToString(SessionStatus status) {
    switch (status) {
    case SessionStatus::kNegotiating:
        return "Negotiating";
    case SessionStatus::kAccepted:
        return "Accepted";
    case SessionStatus::kRejected:
        return "Rejected";
    case SessionStatus::kTransferring:
        return "Transferring";
    case SessionStatus::kCompleted:
        return "Completed";
    case SessionStatus::kCancelled:
        return "Cancelled";
    case SessionStatus::kFailed:
        return "Failed";
    }
    return "Unknown";
}

} // namespace lanbeam::core
