#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/model.h>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lanbeam::core {

struct ReceiveRequest {
    DeviceInfo sender;
    std::map<std::string, FileDto> files;
    std::filesystem::path destination;
};

// Ids of the files to accept; std::nullopt declines the whole request.
using Decision = std::optional<std::set<std::string>>;

// Decides what an incoming prepare-upload request may transfer.
class DecisionProvider {
public:
    virtual ~DecisionProvider() = default;

    // Must complete within `timeout`; an undecided request is declined.
    virtual boost::asio::awaitable<Decision> Decide(const ReceiveRequest& request,
                                                    std::chrono::seconds timeout)
        = 0;
};

// Accepts every file unless the same name with the same size already sits in
// the destination directory.
class QuickSaveDecisionProvider : public DecisionProvider {
public:
    boost::asio::awaitable<Decision> Decide(const ReceiveRequest& request,
                                            std::chrono::seconds timeout) override;

    static bool IsDuplicate(const std::filesystem::path& destination, const FileDto& file);
};

// Parks each request until someone calls Resolve() for it, e.g. a prompt on
// another thread, or until the timeout passes.
class PromptDecisionProvider : public DecisionProvider {
public:
    struct PendingRequest {
        uint64_t id;
        ReceiveRequest request;
    };
    using PromptCallback = std::function<void(const PendingRequest&)>;

    explicit PromptDecisionProvider(PromptCallback on_request = nullptr);

    void SetPromptCallback(PromptCallback on_request);

    boost::asio::awaitable<Decision> Decide(const ReceiveRequest& request,
                                            std::chrono::seconds timeout) override;

    // Returns false when `id` is not waiting any more.
    bool Resolve(uint64_t id, Decision decision);

    std::vector<uint64_t> PendingIds() const;

private:
    struct Slot {
        ReceiveRequest request;
        std::optional<Decision> decision;
    };

    mutable std::mutex mutex_;
    PromptCallback on_request_;
    std::map<uint64_t, Slot> pending_;
    uint64_t next_id_{1};

    static constexpr std::chrono::milliseconds kPollInterval{50};
};

} // namespace lanbeam::core
