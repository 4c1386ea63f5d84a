#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <algorithm>
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/discovery/discovery_manager.h>
#include <spdlog/spdlog.h>

using namespace boost::asio;

namespace lanbeam::core {

DiscoveryManager::DiscoveryManager(io_context& ioc,
                                   DeviceRegistry& registry,
                                   const Settings& settings,
                                   DeviceInfo local_device,
                                   FeedbackCallback callback)
    : io_context_(ioc)
    , registry_(registry)
    , settings_(settings)
    , local_device_(std::move(local_device))
    , feedback_callback_(std::move(callback))
    , socket_(ioc)
    , announce_timer_(ioc)
    , prune_timer_(ioc) {}

DiscoveryManager::~DiscoveryManager() {
    Stop();
}

bool DiscoveryManager::Start() {
    try {
        auto group = ip::make_address(settings_.multicast_group);
        multicast_endpoint_ = ip::udp::endpoint(group, settings_.multicast_port);

        ip::udp::endpoint listen_endpoint(ip::address_v4::any(), settings_.multicast_port);
        socket_.open(listen_endpoint.protocol());
        socket_.set_option(socket_base::reuse_address(true));
        socket_.bind(listen_endpoint);
        socket_.set_option(ip::multicast::join_group(group));
        socket_.set_option(ip::multicast::enable_loopback(true));
    } catch (const std::exception& e) {
        spdlog::error("Failed to set up discovery on {}:{}: {}",
                      settings_.multicast_group,
                      settings_.multicast_port,
                      e.what());
        boost::system::error_code ignored;
        socket_.close(ignored);
        return false;
    }

    spdlog::info("Discovery started on {}:{} as \"{}\" ({})",
                 settings_.multicast_group,
                 settings_.multicast_port,
                 local_device_.alias,
                 local_device_.fingerprint);

    co_spawn(io_context_, announcer(), detached);
    co_spawn(io_context_, listener(), detached);
    co_spawn(io_context_, pruner(), detached);
    return true;
}

void DiscoveryManager::Stop() {
    boost::system::error_code ec;
    if (socket_.is_open()) {
        socket_.close(ec);
        spdlog::info("Discovery stopped");
    }
    announce_timer_.cancel();
    prune_timer_.cancel();
}

void DiscoveryManager::SetFeedbackCallback(FeedbackCallback callback) {
    feedback_callback_ = std::move(callback);
}

void DiscoveryManager::emit(FeedbackType type, nlohmann::json data) {
    if (feedback_callback_) {
        feedback_callback_(Feedback{type, std::move(data)});
    }
}

std::string DiscoveryManager::Announcement() const {
    return MulticastDto{local_device_, true}.Serialize();
}

std::optional<std::string> DiscoveryManager::HandleDatagram(std::string_view data,
                                                            const std::string& source_ip) {
    DeviceInfoDefaults defaults{local_device_.port, local_device_.https};
    auto dto = MulticastDto::Parse(data, defaults);
    if (!dto) {
        spdlog::debug("Dropped malformed datagram from {}", source_ip);
        return std::nullopt;
    }
    if (dto->device.fingerprint == local_device_.fingerprint) {
        return std::nullopt;
    }

    dto->device.ip = source_ip;
    auto result = registry_.Upsert(dto->device);
    if (result != DeviceRegistry::UpsertResult::kRefreshed) {
        spdlog::info("Found device \"{}\" at {}:{}",
                     dto->device.alias,
                     dto->device.ip,
                     dto->device.port);
        emit(FeedbackType::kFoundDevice,
             feedback::FoundDevice{dto->device,
                                   result == DeviceRegistry::UpsertResult::kRevived});
    }

    if (dto->announce && answer_announcements_) {
        return MulticastDto{local_device_, false}.Serialize();
    }
    return std::nullopt;
}

awaitable<void> DiscoveryManager::announcer() {
    const std::string data = Announcement();
    while (socket_.is_open()) {
        boost::system::error_code ec;
        co_await socket_.async_send_to(buffer(data),
                                       multicast_endpoint_,
                                       redirect_error(use_awaitable, ec));
        if (ec == error::operation_aborted) {
            break;
        }
        if (ec) {
            spdlog::warn("Announcement failed, retrying next cycle: {}", ec.message());
        }

        announce_timer_.expires_after(settings_.announce_interval);
        co_await announce_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (ec == error::operation_aborted) {
            break;
        }
    }
}

awaitable<void> DiscoveryManager::listener() {
    std::array<char, protocol::kMaxDatagramSize> recv_buffer;
    ip::udp::endpoint sender_endpoint;

    while (socket_.is_open()) {
        boost::system::error_code ec;
        std::size_t bytes_received = co_await socket_.async_receive_from(
            buffer(recv_buffer), sender_endpoint, redirect_error(use_awaitable, ec));
        if (ec == error::operation_aborted || !socket_.is_open()) {
            break;
        }
        if (ec) {
            spdlog::debug("Discovery receive error: {}", ec.message());
            continue;
        }

        auto reply = HandleDatagram(std::string_view(recv_buffer.data(), bytes_received),
                                    sender_endpoint.address().to_string());
        if (!reply) {
            continue;
        }
        co_await socket_.async_send_to(buffer(*reply),
                                       sender_endpoint,
                                       redirect_error(use_awaitable, ec));
        if (ec && ec != error::operation_aborted) {
            spdlog::debug("Reply to {} failed: {}", sender_endpoint.address().to_string(), ec.message());
        }
    }
}

awaitable<void> DiscoveryManager::pruner() {
    auto interval = std::max<std::chrono::seconds>(settings_.device_ttl / 2, std::chrono::seconds(1));
    while (socket_.is_open()) {
        boost::system::error_code ec;
        prune_timer_.expires_after(interval);
        co_await prune_timer_.async_wait(redirect_error(use_awaitable, ec));
        if (ec == error::operation_aborted) {
            break;
        }
        for (auto& fingerprint : registry_.Prune()) {
            spdlog::info("Lost device {}", fingerprint);
            emit(FeedbackType::kLostDevice, feedback::LostDevice{fingerprint});
        }
    }
}

} // namespace lanbeam::core
