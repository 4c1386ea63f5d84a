#pragma once

#include <atomic>
#include <memory>

namespace lanbeam::core {

// Shared cancel flag. Copies observe the same state; once set it stays set.
class CancellationSignal {
public:
    CancellationSignal()
        : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void Cancel() noexcept { cancelled_->store(true, std::memory_order_release); }

    bool IsCancelled() const noexcept { return cancelled_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace lanbeam::core
