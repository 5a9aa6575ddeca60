#pragma once

#include "core/services/IStatusListener.hpp"
#include "monitor/DownHostRegistry.hpp"
#include "monitor/StopSignal.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace resetwatch::monitor {

/**
 * @brief Emits a registry digest on a fixed cadence.
 *
 * Read-only with respect to the registry. Exits as soon as the stop signal
 * is set; the final digest is the supervisor's job.
 */
class StatusReporter {
public:
    StatusReporter(const DownHostRegistry& registry, core::IStatusListener& listener,
                   std::chrono::milliseconds interval, const StopSignal& stop);

    /**
     * @brief Emits a Periodic report every interval until stopped.
     */
    void run();

    /**
     * @brief Builds a Periodic report from the current registry contents.
     */
    [[nodiscard]] core::StatusReport makeReport() const;

    [[nodiscard]] uint64_t reportsEmitted() const { return reportsEmitted_.load(); }

private:
    const DownHostRegistry& registry_;
    core::IStatusListener& listener_;
    std::chrono::milliseconds interval_;
    const StopSignal& stop_;
    std::atomic<uint64_t> reportsEmitted_{0};
};

} // namespace resetwatch::monitor
