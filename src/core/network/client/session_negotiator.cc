#include <core/constant/route.h>
#include <core/constant/transfer.h>
#include <core/model/dto/prepare_upload_dto.h>
#include <core/network/client/http_client.h>
#include <core/network/client/session_negotiator.h>
#include <core/util/query_string.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace lanbeam::core {

using json = nlohmann::json;

std::string_view NegotiationErrorKindToString(NegotiationError::Kind kind) {
    switch (kind) {
    case NegotiationError::Kind::kRejected:
        return "rejected";
    case NegotiationError::Kind::kUnreachable:
        return "unreachable";
    case NegotiationError::Kind::kUntrustedPeer:
        return "untrusted peer";
    case NegotiationError::Kind::kMalformedResponse:
        return "malformed response";
    case NegotiationError::Kind::kCancelled:
        return "cancelled";
    }
    return "unknown";
}

SessionNegotiator::SessionNegotiator(net::io_context& ioc, DeviceInfo local_device)
    : ioc_(ioc)
    , local_device_(std::move(local_device))
    , response_timeout_(transfer::kDefaultDecisionTimeout + transfer::kIoTimeout) {}

net::awaitable<NegotiationOutcome> SessionNegotiator::Negotiate(const DeviceInfo& peer,
                                                                const TransferManifest& manifest,
                                                                CancellationSignal cancel) {
    using Kind = NegotiationError::Kind;
    if (cancel.IsCancelled()) {
        co_return NegotiationError{Kind::kCancelled, "cancelled before sending", std::nullopt};
    }
    if (manifest.empty()) {
        co_return NegotiationError{Kind::kRejected, "nothing to send", std::nullopt};
    }

    auto client = HttpClient::ForPeer(ioc_, peer);
    if (!co_await client->Connect(peer.ip, peer.port)) {
        if (client->verification_failed()) {
            co_return NegotiationError{Kind::kUntrustedPeer,
                                       "certificate does not match fingerprint " + peer.fingerprint,
                                       std::nullopt};
        }
        co_return NegotiationError{Kind::kUnreachable,
                                   fmt::format("cannot connect to {}:{}", peer.ip, peer.port),
                                   std::nullopt};
    }

    PrepareUploadRequestDto dto{local_device_, manifest.files()};
    auto req = client->CreateRequest<http::string_body>(http::verb::post,
                                                        std::string(ApiRoute::kPrepareUpload),
                                                        false);
    req.body() = json(dto).dump();
    req.prepare_payload();

    spdlog::info("Offering {} file(s) to {} ({}:{})",
                 manifest.files().size(),
                 peer.alias,
                 peer.ip,
                 peer.port);

    ClientResponse res;
    std::string failure;
    try {
        res = co_await client->SendRequest(req, response_timeout_);
    } catch (const std::exception& e) {
        failure = e.what();
    }
    co_await client->Disconnect();
    if (!failure.empty()) {
        spdlog::warn("Prepare-upload to {} failed: {}", peer.alias, failure);
        co_return NegotiationError{Kind::kUnreachable, failure, std::nullopt};
    }

    auto outcome = InterpretResponse(peer, manifest.files(), res.result_int(), res.body());
    if (cancel.IsCancelled()) {
        if (const auto* handle = std::get_if<SessionHandle>(&outcome)) {
            co_await SendCancel(ioc_, peer, handle->session_id);
        }
        co_return NegotiationError{Kind::kCancelled, "cancelled during negotiation", std::nullopt};
    }
    co_return outcome;
}

NegotiationOutcome SessionNegotiator::InterpretResponse(const DeviceInfo& peer,
                                                        const std::map<std::string, FileDto>& files,
                                                        unsigned status,
                                                        std::string_view body) {
    using Kind = NegotiationError::Kind;
    if (status == static_cast<unsigned>(http::status::no_content)) {
        return NegotiationError{Kind::kRejected, "receiver accepted no files", status};
    }
    if (status != static_cast<unsigned>(http::status::ok)) {
        std::string message = body.empty() ? fmt::format("HTTP {}", status)
                                           : fmt::format("HTTP {}: {}", status, body);
        return NegotiationError{Kind::kRejected, std::move(message), status};
    }

    PrepareUploadResponseDto response;
    try {
        response = json::parse(body).get<PrepareUploadResponseDto>();
    } catch (const std::exception& e) {
        spdlog::warn("Malformed prepare-upload response from {}: {}", peer.alias, e.what());
        return NegotiationError{Kind::kMalformedResponse, e.what(), status};
    }
    if (response.session_id.empty()) {
        return NegotiationError{Kind::kMalformedResponse, "empty session id", status};
    }

    SessionHandle handle{response.session_id, peer, files, {}};
    for (auto& [file_id, token] : response.files) {
        if (!files.contains(file_id)) {
            spdlog::warn("Receiver issued a token for unknown file {}", file_id);
            continue;
        }
        handle.tokens.emplace(file_id, std::move(token));
    }
    if (handle.tokens.empty()) {
        return NegotiationError{Kind::kRejected, "receiver accepted no files", status};
    }
    spdlog::info("Session {} accepted {} of {} file(s)",
                 handle.session_id,
                 handle.tokens.size(),
                 files.size());
    return handle;
}

net::awaitable<bool> SessionNegotiator::SendCancel(net::io_context& ioc,
                                                   DeviceInfo peer,
                                                   std::string session_id) {
    auto client = HttpClient::ForPeer(ioc, peer);
    if (!co_await client->Connect(peer.ip, peer.port)) {
        co_return false;
    }
    auto req = client->CreateRequest<http::string_body>(http::verb::post,
                                                        BuildTarget(ApiRoute::kCancel,
                                                                    {{"sessionId", session_id}}),
                                                        false);
    req.prepare_payload();

    bool ok = false;
    try {
        auto res = co_await client->SendRequest(req, transfer::kIoTimeout);
        ok = res.result() == http::status::ok;
    } catch (const std::exception& e) {
        spdlog::debug("Cancel notice for session {} failed: {}", session_id, e.what());
    }
    co_await client->Disconnect();
    if (ok) {
        spdlog::info("Receiver acknowledged cancel of session {}", session_id);
    } else {
        spdlog::warn("Cancel notice for session {} not acknowledged", session_id);
    }
    co_return ok;
}

} // namespace lanbeam::core
