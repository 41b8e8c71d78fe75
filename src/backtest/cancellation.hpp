#pragma once

#include <atomic>

// ---------------------------------------------------------------------------
// CancellationToken — shared stop flag polled at bar boundaries
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    void cancel() { flag_.store(true, std::memory_order_release); }
    bool cancelled() const { return flag_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> flag_{false};
};
