#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/model/device_info.h>
#include <core/network/client/session_negotiator.h>
#include <core/network/client/transfer_executor.h>
#include <core/network/client/transfer_manifest.h>
#include <core/util/cancellation.h>
#include <core/util/progress_channel.h>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace lanbeam::core {

using SendResult = std::variant<NegotiationError, SessionOutcome>;
using SendCallback = std::function<void(const SendResult&)>;

// Runs sends from negotiation to the last file and keeps each one
// cancellable by the session id the receiver assigned.
class SendSessionManager {
public:
    SendSessionManager(boost::asio::io_context& ioc,
                       DeviceInfo local_device,
                       ProgressChannel& channel,
                       TransferOptions options);
    ~SendSessionManager() = default;
    SendSessionManager(const SendSessionManager&) = delete;
    SendSessionManager& operator=(const SendSessionManager&) = delete;

    SessionNegotiator& negotiator() { return negotiator_; }

    boost::asio::awaitable<SendResult> Send(DeviceInfo peer,
                                            std::shared_ptr<const TransferManifest> manifest);

    void SendFiles(DeviceInfo peer,
                   std::shared_ptr<const TransferManifest> manifest,
                   SendCallback on_done = nullptr);

    // Stops every upload of the session at its next chunk and tells the
    // receiver to drop partial files.
    void CancelSend(const std::string& session_id);

    // Also stops sends that are still negotiating.
    void CancelAll();

    std::vector<std::string> ActiveSessions() const;

private:
    struct ActiveSend {
        DeviceInfo peer;
        CancellationSignal cancel;
        bool negotiated;
    };

    void addSend(const std::string& key, ActiveSend send);

    void removeSend(const std::string& key);

    boost::asio::io_context& ioc_;
    SessionNegotiator negotiator_;
    TransferExecutor executor_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ActiveSend> sends_;
    std::size_t next_pending_id_{0};
};

} // namespace lanbeam::core
