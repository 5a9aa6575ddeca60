#include "monitor/MonitorSupervisor.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace resetwatch::monitor {

MonitorSupervisor::MonitorSupervisor(core::HostInventory inventory, MonitorSettings settings,
                                     core::IReachabilityProbe& probe,
                                     core::IStatusListener& listener)
    : inventory_(std::move(inventory)), settings_(std::move(settings)), probe_(probe),
      listener_(listener),
      registry_([this](const core::StatusEvent& event) { listener_.onStatusEvent(event); }) {}

MonitorSupervisor::~MonitorSupervisor() {
    if (state_ == SupervisorState::Running) {
        shutdown("Supervisor destroyed");
    }
    joinStragglers();
}

std::string MonitorSupervisor::stateToString(SupervisorState state) {
    switch (state) {
    case SupervisorState::Idle:
        return "Idle";
    case SupervisorState::Running:
        return "Running";
    case SupervisorState::Stopping:
        return "Stopping";
    case SupervisorState::Stopped:
        return "Stopped";
    }
    return "Unknown";
}

void MonitorSupervisor::start() {
    auto current = state_.load();
    if (current == SupervisorState::Running || current == SupervisorState::Stopping) {
        spdlog::warn("Monitoring already {}", stateToString(current));
        return;
    }

    if (inventory_.empty()) {
        throw std::invalid_argument("inventory contains no host templates");
    }

    auto problems = settings_.validate();
    if (!problems.empty()) {
        std::string joined;
        for (const auto& problem : problems) {
            if (!joined.empty()) {
                joined += "; ";
            }
            joined += problem;
        }
        throw std::invalid_argument("invalid monitor settings: " + joined);
    }

    // Leftovers from a previous run still reference the monitors and the
    // stop signal.
    joinStragglers();

    stopSignal_.reset();
    registry_.clear();
    anomalies_.clear();
    {
        // A stop requested before start() is kept so run() honours it.
        std::lock_guard lock(wakeMutex_);
        unitExited_ = false;
    }

    monitors_.clear();
    for (const auto& entry : inventory_.entries()) {
        monitors_.push_back(std::make_unique<TemplateMonitor>(
            entry.hostTemplate, entry.ports, settings_, probe_, registry_, stopSignal_));
    }
    reporter_ = std::make_unique<StatusReporter>(registry_, listener_, settings_.reportInterval,
                                                 stopSignal_);

    state_ = SupervisorState::Running;

    for (auto& monitor : monitors_) {
        auto* raw = monitor.get();
        launchUnit("monitor " + raw->hostTemplate().pattern(), [raw] { raw->run(); });
    }
    auto* reporter = reporter_.get();
    launchUnit("status reporter", [reporter] { reporter->run(); });

    spdlog::info("Started {} monitoring threads + 1 reporter thread", monitors_.size());
    spdlog::info("Teams {}-{}, status reports every {} s", settings_.teams.start,
                 settings_.teams.end,
                 std::chrono::duration_cast<std::chrono::seconds>(settings_.reportInterval).count());
}

ShutdownSummary MonitorSupervisor::run() {
    start();

    std::string reason;
    while (true) {
        {
            std::unique_lock lock(wakeMutex_);
            wakeCv_.wait_for(lock, settings_.pollInterval,
                             [this] { return stopRequested_ || unitExited_; });
            if (stopRequested_) {
                reason = stopReason_;
                break;
            }
            unitExited_ = false;
        }

        if (auto anomaly = checkHealth()) {
            reason = *anomaly;
            break;
        }
        emitInterimStatus();
    }

    return shutdown(reason);
}

void MonitorSupervisor::requestStop(const std::string& reason) {
    {
        std::lock_guard lock(wakeMutex_);
        if (stopRequested_) {
            return;
        }
        stopRequested_ = true;
        stopReason_ = reason;
    }
    spdlog::info("Stop requested: {}", reason);
    wakeCv_.notify_all();
}

bool MonitorSupervisor::isStopRequested() const {
    std::lock_guard lock(wakeMutex_);
    return stopRequested_;
}

std::optional<std::string> MonitorSupervisor::checkHealth() {
    if (state_ != SupervisorState::Running) {
        return std::nullopt;
    }

    std::optional<std::string> first;
    std::size_t finishedCount = 0;

    for (auto& unit : units_) {
        if (unit->finished ||
            unit->done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            continue;
        }

        auto fault = collectOutcome(*unit);
        ++finishedCount;

        auto message = fault ? unit->name + " terminated unexpectedly: " + *fault
                             : unit->name + " exited without a stop request";
        spdlog::error("{}", message);
        anomalies_.push_back(message);
        if (!first) {
            first = message;
        }
    }

    if (finishedCount > 0) {
        spdlog::warn("{} threads finished unexpectedly", finishedCount);
    }
    return first;
}

bool MonitorSupervisor::emitInterimStatus() {
    auto downHosts = registry_.snapshot();
    if (downHosts.empty()) {
        return false;
    }

    listener_.onStatusReport(core::StatusReport::capture(core::ReportKind::Interim,
                                                         std::move(downHosts)));
    return true;
}

ShutdownSummary MonitorSupervisor::shutdown(const std::string& reason) {
    ShutdownSummary summary;
    summary.reason = reason;

    auto expected = SupervisorState::Running;
    if (!state_.compare_exchange_strong(expected, SupervisorState::Stopping)) {
        spdlog::warn("Shutdown ignored, supervisor is {}", stateToString(expected));
        return summary;
    }

    spdlog::info("Stopping all monitoring threads due to: {}", reason);
    stopSignal_.set();

    listener_.onStatusReport(
        core::StatusReport::capture(core::ReportKind::Final, registry_.snapshot()));

    spdlog::info("Waiting for {} threads to complete...", units_.size());
    for (auto& unit : units_) {
        if (unit->finished) {
            ++summary.unitsJoined;
            continue;
        }

        if (unit->done.wait_for(settings_.joinTimeout) == std::future_status::ready) {
            if (auto fault = collectOutcome(*unit)) {
                auto message = unit->name + " shutdown error: " + *fault;
                spdlog::error("{}", message);
                anomalies_.push_back(message);
            }
            ++summary.unitsJoined;
        } else {
            auto message = unit->name + " did not stop within " +
                           std::to_string(settings_.joinTimeout.count()) + " ms";
            spdlog::warn("{}", message);
            anomalies_.push_back(message);
            ++summary.unitsTimedOut;
            stragglers_.push_back(std::move(unit));
        }
    }
    units_.clear();

    summary.anomalies = std::move(anomalies_);
    anomalies_.clear();
    {
        std::lock_guard lock(wakeMutex_);
        stopRequested_ = false;
        stopReason_.clear();
    }

    state_ = SupervisorState::Stopped;
    spdlog::info("All threads stopped ({} joined, {} timed out)", summary.unitsJoined,
                 summary.unitsTimedOut);
    return summary;
}

void MonitorSupervisor::launchUnit(std::string name, std::function<void()> body) {
    auto unit = std::make_unique<Unit>();
    unit->name = std::move(name);

    std::promise<void> promise;
    unit->done = promise.get_future();
    unit->thread =
        std::thread([this, body = std::move(body), promise = std::move(promise)]() mutable {
            try {
                body();
                promise.set_value();
            } catch (...) {
                // Handed to the supervisor through the future.
                promise.set_exception(std::current_exception());
            }
            notifyUnitExited();
        });

    units_.push_back(std::move(unit));
}

void MonitorSupervisor::notifyUnitExited() {
    {
        std::lock_guard lock(wakeMutex_);
        unitExited_ = true;
    }
    wakeCv_.notify_all();
}

std::optional<std::string> MonitorSupervisor::collectOutcome(Unit& unit) {
    std::optional<std::string> fault;
    try {
        unit.done.get();
    } catch (const std::exception& e) {
        fault = e.what();
    } catch (...) {
        fault = "non-standard exception";
    }

    if (unit.thread.joinable()) {
        unit.thread.join();
    }
    unit.finished = true;
    return fault;
}

void MonitorSupervisor::joinStragglers() {
    for (auto& unit : stragglers_) {
        spdlog::debug("Joining late thread: {}", unit->name);
        if (auto fault = collectOutcome(*unit)) {
            spdlog::error("{} ended with: {}", unit->name, *fault);
        }
    }
    stragglers_.clear();
}

} // namespace resetwatch::monitor
