#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "core/types/HostTemplate.hpp"
#include "monitor/DownHostRegistry.hpp"
#include "monitor/MonitorSettings.hpp"
#include "monitor/StopSignal.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace resetwatch::monitor {

/**
 * @brief Polls one host template across every team until stopped.
 *
 * Each cycle probes the template's concrete host for every team in
 * increasing order and records the outcome in the registry. Probe faults
 * count as unreachable and are retried after a back-off; other faults
 * restart the cycle after the same back-off. run() only returns once the
 * stop signal is set.
 */
class TemplateMonitor {
public:
    /**
     * @brief Constructs a monitor for one inventory entry.
     * @param hostTemplate Template to substitute teams into.
     * @param ports Candidate ports for the template.
     * @param settings Team range and timing.
     * @param probe Reachability check shared by all monitors.
     * @param registry Registry receiving the outcomes.
     * @param stop Run-wide stop signal.
     */
    TemplateMonitor(core::HostTemplate hostTemplate, std::vector<uint16_t> ports,
                    const MonitorSettings& settings, core::IReachabilityProbe& probe,
                    DownHostRegistry& registry, const StopSignal& stop);

    TemplateMonitor(const TemplateMonitor&) = delete;
    TemplateMonitor& operator=(const TemplateMonitor&) = delete;

    /**
     * @brief Runs cycles until the stop signal is set.
     */
    void run();

    /**
     * @brief Probes every team once.
     * @return True if the cycle completed, false if it was abandoned because
     *         the stop signal was set or the team range is empty.
     */
    bool runCycle();

    [[nodiscard]] const core::HostTemplate& hostTemplate() const { return hostTemplate_; }
    [[nodiscard]] const std::vector<uint16_t>& ports() const { return ports_; }
    [[nodiscard]] uint64_t completedCycles() const { return completedCycles_.load(); }
    [[nodiscard]] uint64_t probeFaults() const { return probeFaults_.load(); }

private:
    core::HostTemplate hostTemplate_;
    std::vector<uint16_t> ports_;
    const MonitorSettings& settings_;
    core::IReachabilityProbe& probe_;
    DownHostRegistry& registry_;
    const StopSignal& stop_;

    std::atomic<uint64_t> completedCycles_{0};
    std::atomic<uint64_t> probeFaults_{0};
};

} // namespace resetwatch::monitor
