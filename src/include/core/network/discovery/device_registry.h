#pragma once

#include <chrono>
#include <core/constant/protocol.h>
#include <core/model/device_info.h>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lanbeam::core {

struct DeviceEntry {
    DeviceInfo device;
    std::chrono::steady_clock::time_point last_seen;
};

// Peers seen on the network, keyed by fingerprint. An entry older than the
// liveness window is stale: it stays in the table but is hidden from lookups
// until it is renewed or pruned at twice the window.
class DeviceRegistry {
public:
    using Clock = std::chrono::steady_clock;

    enum class UpsertResult {
        kInserted,  // fingerprint was unknown
        kRevived,   // fingerprint was known but stale
        kRefreshed, // fingerprint was live; info and timestamp replaced
    };

    explicit DeviceRegistry(std::chrono::seconds ttl = protocol::kDefaultDeviceTtl);

    UpsertResult Upsert(const DeviceInfo& device, Clock::time_point now = Clock::now());

    bool Remove(const std::string& fingerprint);

    std::optional<DeviceInfo> GetDevice(const std::string& fingerprint,
                                        Clock::time_point now = Clock::now()) const;

    // First live device whose alias matches exactly, ignoring case.
    std::optional<DeviceInfo> FindByAlias(std::string_view alias,
                                          Clock::time_point now = Clock::now()) const;

    // Live devices only, ordered by alias.
    std::vector<DeviceInfo> GetDevices(Clock::time_point now = Clock::now()) const;

    // Drops entries unseen for twice the liveness window and returns their
    // fingerprints.
    std::vector<std::string> Prune(Clock::time_point now = Clock::now());

    std::size_t size() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    bool isLive(const DeviceEntry& entry, Clock::time_point now) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, DeviceEntry> devices_;
    std::chrono::seconds ttl_;
};

} // namespace lanbeam::core
