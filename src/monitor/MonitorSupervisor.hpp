#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "core/services/IStatusListener.hpp"
#include "core/types/HostInventory.hpp"
#include "monitor/DownHostRegistry.hpp"
#include "monitor/MonitorSettings.hpp"
#include "monitor/StatusReporter.hpp"
#include "monitor/StopSignal.hpp"
#include "monitor/TemplateMonitor.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace resetwatch::monitor {

/**
 * @brief Lifecycle states of a monitoring run.
 */
enum class SupervisorState : int {
    Idle = 0,     ///< Constructed, never started
    Running = 1,  ///< Monitors and reporter are active
    Stopping = 2, ///< Stop signal set, units being awaited
    Stopped = 3   ///< Every unit awaited; may be started again
};

/**
 * @brief Outcome of a shutdown.
 */
struct ShutdownSummary {
    std::string reason;                 ///< Why the run stopped
    std::vector<std::string> anomalies; ///< Unexpected exits and join timeouts
    std::size_t unitsJoined{0};         ///< Units that finished in time
    std::size_t unitsTimedOut{0};       ///< Units still running at the join deadline
};

/**
 * @brief Owns the monitor and reporter threads of a monitoring run.
 *
 * start() launches one TemplateMonitor thread per inventory entry plus a
 * StatusReporter thread. run() then polls on the calling thread: it wakes
 * every poll interval, when a unit exits, or when requestStop() is called,
 * checks that no unit has died, and prints an interim status while hosts
 * are down. A stop request or a dead unit leads to shutdown(), which sets
 * the stop signal, emits the final status and awaits every unit with a
 * bounded timeout.
 *
 * Units that miss their join deadline are kept and joined before the next
 * start() or on destruction; they are bounded by the probe timeout.
 *
 * @note requestStop() is safe to call from any thread. Every other method
 *       must be called from the supervising thread.
 */
class MonitorSupervisor {
public:
    /**
     * @brief Constructs an idle supervisor.
     * @param inventory Templates to monitor.
     * @param settings Team range and timing for each run.
     * @param probe Reachability check shared by every monitor.
     * @param listener Receiver for transitions and digests.
     */
    MonitorSupervisor(core::HostInventory inventory, MonitorSettings settings,
                      core::IReachabilityProbe& probe, core::IStatusListener& listener);

    /**
     * @brief Shuts down a running session and joins every thread.
     */
    ~MonitorSupervisor();

    MonitorSupervisor(const MonitorSupervisor&) = delete;
    MonitorSupervisor& operator=(const MonitorSupervisor&) = delete;

    /**
     * @brief Starts a run: clears the registry and launches all units.
     *
     * Has no effect if a run is already active.
     *
     * @throws std::invalid_argument if the inventory is empty or the
     *         settings are invalid.
     */
    void start();

    /**
     * @brief Starts a run and supervises it until it stops.
     * @return Summary of the shutdown.
     */
    ShutdownSummary run();

    /**
     * @brief Asks run() to shut down.
     *
     * A request made before run() is honoured as soon as the run starts.
     * The request is cleared when shutdown() completes.
     *
     * @param reason Logged as the shutdown reason.
     */
    void requestStop(const std::string& reason);

    /**
     * @brief Looks for units that ended while the run is active.
     * @return Description of the first anomaly, or nullopt if all units are alive.
     */
    std::optional<std::string> checkHealth();

    /**
     * @brief Emits an Interim report if any host is down.
     * @return True if a report was emitted.
     */
    bool emitInterimStatus();

    /**
     * @brief Stops the active run.
     * @param reason Logged as the shutdown reason.
     * @return Summary of the shutdown; empty if no run was active.
     */
    ShutdownSummary shutdown(const std::string& reason);

    [[nodiscard]] SupervisorState state() const { return state_.load(); }
    [[nodiscard]] const DownHostRegistry& registry() const { return registry_; }
    [[nodiscard]] const std::vector<std::unique_ptr<TemplateMonitor>>& monitors() const {
        return monitors_;
    }
    [[nodiscard]] bool isStopRequested() const;

    static std::string stateToString(SupervisorState state);

private:
    struct Unit {
        std::string name;
        std::thread thread;
        std::future<void> done;
        bool finished{false};
    };

    void launchUnit(std::string name, std::function<void()> body);
    void notifyUnitExited();
    std::optional<std::string> collectOutcome(Unit& unit);
    void joinStragglers();

    core::HostInventory inventory_;
    MonitorSettings settings_;
    core::IReachabilityProbe& probe_;
    core::IStatusListener& listener_;
    DownHostRegistry registry_;
    StopSignal stopSignal_;

    std::vector<std::unique_ptr<TemplateMonitor>> monitors_;
    std::unique_ptr<StatusReporter> reporter_;
    std::vector<std::unique_ptr<Unit>> units_;
    std::vector<std::unique_ptr<Unit>> stragglers_;
    std::vector<std::string> anomalies_;

    std::atomic<SupervisorState> state_{SupervisorState::Idle};

    mutable std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
    bool stopRequested_{false};
    bool unitExited_{false};
    std::string stopReason_;
};

} // namespace resetwatch::monitor
