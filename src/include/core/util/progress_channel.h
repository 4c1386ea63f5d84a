#pragma once

#include "core/model/transfer_event.h"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace lanbeam::core {

// One-way event queue between transfer tasks and whoever displays progress.
// Push never blocks. When the queue is full the oldest progress event is
// dropped; terminal events are always kept so every file still ends with
// exactly one Completed/Failed/Cancelled/Rejected event.
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity);

    void Push(TransferEvent event);

    std::optional<TransferEvent> Poll();
    std::optional<TransferEvent> WaitPop(std::chrono::milliseconds timeout);
    std::vector<TransferEvent> Drain();

    // Wakes waiting consumers; later pushes are ignored.
    void Close();
    bool closed() const;

    std::size_t size() const;
    std::size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<TransferEvent> events_;
    std::size_t capacity_;
    std::size_t dropped_{0};
    bool closed_{false};
};

} // namespace lanbeam::core
