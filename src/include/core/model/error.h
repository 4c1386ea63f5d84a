#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace lanbeam::core {

enum class ErrorCode {
    kDiscoveryTransient,     // dropped packet or socket hiccup, retried next cycle
    kNegotiationRejected,    // peer declined the request or every file in it
    kNegotiationUnreachable, // no response or timeout
    kMalformedPayload,       // request or response that does not fit its schema
    kTokenInvalid,           // unknown session, forged, expired or consumed token
    kFileInProgress,         // another upload already owns this file
    kAlreadyCompleted,       // file was written already
    kTransferIO,             // read or write failure mid-stream
    kCancelledByUser,
    kSizeMismatch, // received bytes disagree with the declared size
};

inline std::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
    case ErrorCode::kDiscoveryTransient:
        return "discovery transient";
    case ErrorCode::kNegotiationRejected:
        return "rejected";
    case ErrorCode::kNegotiationUnreachable:
        return "unreachable";
    case ErrorCode::kMalformedPayload:
        return "malformed payload";
    case ErrorCode::kTokenInvalid:
        return "invalid token";
    case ErrorCode::kFileInProgress:
        return "file in progress";
    case ErrorCode::kAlreadyCompleted:
        return "already completed";
    case ErrorCode::kTransferIO:
        return "transfer i/o error";
    case ErrorCode::kCancelledByUser:
        return "cancelled";
    case ErrorCode::kSizeMismatch:
        return "size mismatch";
    }
    return "unknown error";
}

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    explicit ProtocolError(ErrorCode code)
        : std::runtime_error(std::string(ErrorCodeToString(code)))
        , code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace lanbeam::core
