#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <core/model/device_info.h>
#include <core/model/dto/file_dto.h>
#include <core/network/client/transfer_manifest.h>
#include <core/util/cancellation.h>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace lanbeam::core {

// An accepted session as seen by the sender.
struct SessionHandle {
    std::string session_id;
    DeviceInfo peer;
    std::map<std::string, FileDto> files;       // everything that was offered
    std::map<std::string, std::string> tokens; // accepted file id -> token

    bool Accepted(const std::string& file_id) const { return tokens.contains(file_id); }
};

struct NegotiationError {
    enum class Kind {
        kRejected,
        kUnreachable,
        kUntrustedPeer, // certificate does not carry the announced fingerprint
        kMalformedResponse,
        kCancelled,
    };

    Kind kind;
    std::string message;
    std::optional<unsigned> status;
};

std::string_view NegotiationErrorKindToString(NegotiationError::Kind kind);

using NegotiationOutcome = std::variant<SessionHandle, NegotiationError>;

class SessionNegotiator {
public:
    SessionNegotiator(boost::asio::io_context& ioc, DeviceInfo local_device);

    // How long to wait for the receiver's answer; it may be waiting on a
    // person to accept.
    void set_response_timeout(std::chrono::seconds timeout) { response_timeout_ = timeout; }

    boost::asio::awaitable<NegotiationOutcome> Negotiate(const DeviceInfo& peer,
                                                         const TransferManifest& manifest,
                                                         CancellationSignal cancel = {});

    // Maps a prepare-upload response onto the outcome. Tokens for ids that
    // were never offered are dropped.
    static NegotiationOutcome InterpretResponse(const DeviceInfo& peer,
                                                const std::map<std::string, FileDto>& files,
                                                unsigned status,
                                                std::string_view body);

    // Best-effort notice that the sender abandoned `session_id`.
    static boost::asio::awaitable<bool> SendCancel(boost::asio::io_context& ioc,
                                                   DeviceInfo peer,
                                                   std::string session_id);

private:
    boost::asio::io_context& ioc_;
    DeviceInfo local_device_;
    std::chrono::seconds response_timeout_;
};

} // namespace lanbeam::core
