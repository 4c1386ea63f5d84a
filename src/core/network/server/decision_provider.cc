#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/server/decision_provider.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;
namespace fs = std::filesystem;

namespace lanbeam::core {

bool QuickSaveDecisionProvider::IsDuplicate(const fs::path& destination, const FileDto& file) {
    std::error_code ec;
    auto target = destination / fs::path(file.file_name);
    if (!fs::is_regular_file(target, ec)) {
        return false;
    }
    auto size = fs::file_size(target, ec);
    return !ec && size == file.size;
}

net::awaitable<Decision> QuickSaveDecisionProvider::Decide(const ReceiveRequest& request,
                                                           std::chrono::seconds) {
    std::set<std::string> accepted;
    for (const auto& [id, file] : request.files) {
        if (IsDuplicate(request.destination, file)) {
            spdlog::info("Skipping \"{}\": already received", file.file_name);
            continue;
        }
        accepted.insert(id);
    }
    co_return accepted;
}

PromptDecisionProvider::PromptDecisionProvider(PromptCallback on_request)
    : on_request_(std::move(on_request)) {}

void PromptDecisionProvider::SetPromptCallback(PromptCallback on_request) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_request_ = std::move(on_request);
}

net::awaitable<Decision> PromptDecisionProvider::Decide(const ReceiveRequest& request,
                                                        std::chrono::seconds timeout) {
    uint64_t id;
    PromptCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        pending_.emplace(id, Slot{request, std::nullopt});
        callback = on_request_;
    }
    if (callback) {
        callback(PendingRequest{id, request});
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    net::steady_timer timer(co_await net::this_coro::executor);
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it->second.decision) {
                Decision decision = std::move(*it->second.decision);
                pending_.erase(it);
                co_return decision;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                pending_.erase(it);
                spdlog::info("No answer for request #{} within {}s, declining",
                             id,
                             timeout.count());
                co_return std::nullopt;
            }
        }
        timer.expires_after(kPollInterval);
        co_await timer.async_wait(net::use_awaitable);
    }
}

bool PromptDecisionProvider::Resolve(uint64_t id, Decision decision) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end() || it->second.decision) {
        return false;
    }
    it->second.decision = std::move(decision);
    return true;
}

std::vector<uint64_t> PromptDecisionProvider::PendingIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint64_t> ids;
    for (const auto& [id, slot] : pending_) {
        if (!slot.decision) {
            ids.push_back(id);
        }
    }
    return ids;
}

} // namespace lanbeam::core
