#include <algorithm>
#include <cctype>
#include <core/network/discovery/device_registry.h>

namespace lanbeam::core {

DeviceRegistry::DeviceRegistry(std::chrono::seconds ttl)
    : ttl_(ttl) {}

bool DeviceRegistry::isLive(const DeviceEntry& entry, Clock::time_point now) const {
    return now - entry.last_seen <= ttl_;
}

DeviceRegistry::UpsertResult DeviceRegistry::Upsert(const DeviceInfo& device,
                                                    Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(device.fingerprint);
    if (it == devices_.end()) {
        devices_.emplace(device.fingerprint, DeviceEntry{device, now});
        return UpsertResult::kInserted;
    }
    bool was_live = isLive(it->second, now);
    it->second.device = device;
    it->second.last_seen = std::max(it->second.last_seen, now);
    return was_live ? UpsertResult::kRefreshed : UpsertResult::kRevived;
}

bool DeviceRegistry::Remove(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.erase(fingerprint) > 0;
}

std::optional<DeviceInfo> DeviceRegistry::GetDevice(const std::string& fingerprint,
                                                    Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(fingerprint);
    if (it == devices_.end() || !isLive(it->second, now)) {
        return std::nullopt;
    }
    return it->second.device;
}

std::optional<DeviceInfo> DeviceRegistry::FindByAlias(std::string_view alias,
                                                      Clock::time_point now) const {
    auto same = [alias](const std::string& other) {
        return std::equal(alias.begin(),
                          alias.end(),
                          other.begin(),
                          other.end(),
                          [](unsigned char a, unsigned char b) {
                              return std::tolower(a) == std::tolower(b);
                          });
    };
    for (auto& device : GetDevices(now)) {
        if (same(device.alias)) {
            return device;
        }
    }
    return std::nullopt;
}

std::vector<DeviceInfo> DeviceRegistry::GetDevices(Clock::time_point now) const {
    std::vector<DeviceInfo> devices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [fingerprint, entry] : devices_) {
            if (isLive(entry, now)) {
                devices.push_back(entry.device);
            }
        }
    }
    std::sort(devices.begin(), devices.end(), [](const DeviceInfo& a, const DeviceInfo& b) {
        return a.alias < b.alias || (a.alias == b.alias && a.fingerprint < b.fingerprint);
    });
    return devices;
}

std::vector<std::string> DeviceRegistry::Prune(Clock::time_point now) {
    std::vector<std::string> removed;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = devices_.begin(); it != devices_.end();) {
        if (now - it->second.last_seen > 2 * ttl_) {
            removed.push_back(it->first);
            it = devices_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

} // namespace lanbeam::core
