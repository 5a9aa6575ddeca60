#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace resetwatch::monitor {

/**
 * @brief Run-wide cooperative cancellation flag.
 *
 * Set once per run and observed by every monitor thread and the reporter.
 * Sleeping on the signal with waitFor() returns as soon as it is set, so a
 * pause never delays shutdown.
 */
class StopSignal {
public:
    /**
     * @brief Sets the signal and wakes every waiter.
     * @return True if this call set it, false if it was already set.
     */
    bool set();

    /**
     * @brief Clears the signal for a new run.
     *
     * Only valid while no thread is observing the signal.
     */
    void reset();

    [[nodiscard]] bool isSet() const { return set_.load(std::memory_order_acquire); }

    /**
     * @brief Sleeps for up to @p duration or until the signal is set.
     * @param duration Maximum time to wait.
     * @return True if the signal is set.
     */
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::atomic<bool> set_{false};
};

} // namespace resetwatch::monitor
