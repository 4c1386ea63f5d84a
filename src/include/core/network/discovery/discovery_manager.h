#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/model.h>
#include <core/network/discovery/device_registry.h>
#include <core/util/config.h>
#include <optional>
#include <string>
#include <string_view>

namespace lanbeam::core {

// Announces this device on the multicast group and feeds announcements from
// peers into a DeviceRegistry. One socket bound to the multicast port is used
// for sending and receiving, so unicast replies reach the same listener.
class DiscoveryManager {
public:
    DiscoveryManager(boost::asio::io_context& ioc,
                     DeviceRegistry& registry,
                     const Settings& settings,
                     DeviceInfo local_device,
                     FeedbackCallback callback = nullptr);
    ~DiscoveryManager();

    // Opens the socket and spawns the announce, listen and prune loops.
    // Returns false when the socket cannot be set up.
    bool Start();
    void Stop();

    void SetFeedbackCallback(FeedbackCallback callback);

    // When disabled, incoming announcements update the registry but are not
    // answered.
    void set_answer_announcements(bool answer) { answer_announcements_ = answer; }

    // The datagram broadcast every cycle.
    std::string Announcement() const;

    // Processes one received datagram from `source_ip`. Returns the reply to
    // unicast back to the sender, if one is due.
    std::optional<std::string> HandleDatagram(std::string_view data, const std::string& source_ip);

    const DeviceInfo& local_device() const { return local_device_; }

private:
    boost::asio::awaitable<void> announcer();
    boost::asio::awaitable<void> listener();
    boost::asio::awaitable<void> pruner();

    void emit(FeedbackType type, nlohmann::json data);

    boost::asio::io_context& io_context_;
    DeviceRegistry& registry_;
    Settings settings_;
    DeviceInfo local_device_;
    FeedbackCallback feedback_callback_;
    bool answer_announcements_{true};

    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint multicast_endpoint_;
    boost::asio::steady_timer announce_timer_;
    boost::asio::steady_timer prune_timer_;
};

} // namespace lanbeam::core
