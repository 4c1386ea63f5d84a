#include <algorithm>
#include <iterator>
#include <core/util/progress_channel.h>

namespace lanbeam::core {

ProgressChannel::ProgressChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

void ProgressChannel::Push(TransferEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        if (events_.size() >= capacity_) {
            auto oldest_progress = std::find_if(events_.begin(),
                                                events_.end(),
                                                [](const TransferEvent& e) {
                                                    return !e.IsTerminal();
                                                });
            if (oldest_progress != events_.end()) {
                events_.erase(oldest_progress);
                ++dropped_;
            } else if (!event.IsTerminal()) {
                ++dropped_;
                return;
            }
        }
        events_.emplace_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<TransferEvent> ProgressChannel::Poll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    TransferEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<TransferEvent> ProgressChannel::WaitPop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) {
        return std::nullopt;
    }
    TransferEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<TransferEvent> ProgressChannel::Drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TransferEvent> events(std::make_move_iterator(events_.begin()),
                                      std::make_move_iterator(events_.end()));
    events_.clear();
    return events;
}

void ProgressChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t ProgressChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

std::size_t ProgressChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace lanbeam::core
