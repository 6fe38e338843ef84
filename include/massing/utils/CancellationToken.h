#pragma once

#include <atomic>

namespace massing {

// Shared stop flag polled between units of work (candidates, lots)
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace massing
