#include "monitor/StopSignal.hpp"

namespace resetwatch::monitor {

bool StopSignal::set() {
    {
        std::lock_guard lock(mutex_);
        if (set_.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
    }
    cv_.notify_all();
    return true;
}

void StopSignal::reset() {
    std::lock_guard lock(mutex_);
    set_.store(false, std::memory_order_release);
}

bool StopSignal::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return set_.load(std::memory_order_acquire); });
}

} // namespace resetwatch::monitor
