#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/client/send_session_manager.h>
#include <exception>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace lanbeam::core {

SendSessionManager::SendSessionManager(net::io_context& ioc,
                                       DeviceInfo local_device,
                                       ProgressChannel& channel,
                                       TransferOptions options)
    : ioc_(ioc)
    , negotiator_(ioc, std::move(local_device))
    , executor_(ioc, channel, options) {}

net::awaitable<SendResult> SendSessionManager::Send(
    DeviceInfo peer, std::shared_ptr<const TransferManifest> manifest) {
    CancellationSignal cancel;
    std::string pending_key;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_key = fmt::format("pending-{}", ++next_pending_id_);
    }
    addSend(pending_key, ActiveSend{peer, cancel, false});

    NegotiationOutcome negotiated = co_await negotiator_.Negotiate(peer, *manifest, cancel);
    removeSend(pending_key);
    if (auto* error = std::get_if<NegotiationError>(&negotiated)) {
        spdlog::warn("Send to {} not started: {} ({})",
                     peer.alias,
                     NegotiationErrorKindToString(error->kind),
                     error->message);
        co_return *error;
    }

    SessionHandle handle = std::get<SessionHandle>(std::move(negotiated));
    addSend(handle.session_id, ActiveSend{peer, cancel, true});

    // file tasks share the strand so Run can track them without locks
    SessionOutcome outcome = co_await net::co_spawn(net::make_strand(ioc_),
                                                    executor_.Run(handle, *manifest, cancel),
                                                    net::use_awaitable);
    removeSend(handle.session_id);
    co_return outcome;
}

void SendSessionManager::SendFiles(DeviceInfo peer,
                                   std::shared_ptr<const TransferManifest> manifest,
                                   SendCallback on_done) {
    net::co_spawn(ioc_,
                  Send(std::move(peer), std::move(manifest)),
                  [on_done = std::move(on_done)](std::exception_ptr error, SendResult result) {
                      if (error) {
                          try {
                              std::rethrow_exception(error);
                          } catch (const std::exception& e) {
                              spdlog::error("Send failed: {}", e.what());
                          }
                          return;
                      }
                      if (on_done) {
                          on_done(result);
                      }
                  });
}

void SendSessionManager::CancelSend(const std::string& session_id) {
    DeviceInfo peer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sends_.find(session_id);
        if (it == sends_.end()) {
            spdlog::debug("No running send with session id {}", session_id);
            return;
        }
        it->second.cancel.Cancel();
        if (!it->second.negotiated) {
            return;
        }
        peer = it->second.peer;
    }
    spdlog::info("Cancelling send session {}", session_id);
    net::co_spawn(ioc_, SessionNegotiator::SendCancel(ioc_, peer, session_id), net::detached);
}

void SendSessionManager::CancelAll() {
    for (const auto& session_id : ActiveSessions()) {
        CancelSend(session_id);
    }
}

std::vector<std::string> SendSessionManager::ActiveSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sends_.size());
    for (const auto& [key, send] : sends_) {
        ids.push_back(key);
    }
    return ids;
}

void SendSessionManager::addSend(const std::string& key, ActiveSend send) {
    std::lock_guard<std::mutex> lock(mutex_);
    sends_.insert_or_assign(key, std::move(send));
}

void SendSessionManager::removeSend(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    sends_.erase(key);
}

} // namespace lanbeam::core
