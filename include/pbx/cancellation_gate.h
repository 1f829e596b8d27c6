// =============================================================================
// FILE: include/pbx/cancellation_gate.h
// =============================================================================
#ifndef PBX_CANCELLATION_GATE_H
#define PBX_CANCELLATION_GATE_H

#include "common/types.h"
#include <atomic>
#include <condition_variable>
#include <mutex>

namespace asterisk_live {

// Single-fire cooperative cancellation flag. signal() opens the gate once;
// later calls are no-ops. Nothing is interrupted: work observes the gate only
// where it chooses to check it.
class CancellationGate {
public:
    CancellationGate() = default;

    // Returns true for the call that opened the gate
    bool signal() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (cancelled_.load(std::memory_order_acquire)) return false;
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
        return true;
    }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // True if the gate opened within timeout
    bool wait_for(Millisecs timeout) {
        std::unique_lock<std::mutex> lk(mu_);
        return cv_.wait_for(lk, timeout, [this] { return cancelled_.load(); });
    }

    CancellationGate(const CancellationGate&) = delete;
    CancellationGate& operator=(const CancellationGate&) = delete;

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
};

} // namespace asterisk_live
#endif // PBX_CANCELLATION_GATE_H
