#include "monitor/TemplateMonitor.hpp"

#include <spdlog/spdlog.h>

namespace resetwatch::monitor {

TemplateMonitor::TemplateMonitor(core::HostTemplate hostTemplate, std::vector<uint16_t> ports,
                                 const MonitorSettings& settings, core::IReachabilityProbe& probe,
                                 DownHostRegistry& registry, const StopSignal& stop)
    : hostTemplate_(std::move(hostTemplate)), ports_(std::move(ports)), settings_(settings),
      probe_(probe), registry_(registry), stop_(stop) {}

void TemplateMonitor::run() {
    spdlog::debug("Monitor for {} started ({} ports, teams {}-{})", hostTemplate_.pattern(),
                  ports_.size(), settings_.teams.start, settings_.teams.end);

    while (!stop_.isSet()) {
        try {
            if (!runCycle()) {
                break;
            }
        } catch (const std::exception& e) {
            spdlog::error("Error checking host {}: {}", hostTemplate_.pattern(), e.what());
            if (stop_.waitFor(settings_.errorBackoff)) {
                break;
            }
            continue;
        }

        if (stop_.waitFor(settings_.cyclePause)) {
            break;
        }
    }

    spdlog::debug("Monitor for {} stopped after {} cycles", hostTemplate_.pattern(),
                  completedCycles_.load());
}

bool TemplateMonitor::runCycle() {
    const auto& teams = settings_.teams;
    if (!teams.isValid()) {
        return false;
    }

    // Stops at the last team instead of incrementing past it, so a range
    // ending at INT_MAX terminates.
    int team = teams.start;
    while (true) {
        if (stop_.isSet()) {
            return false;
        }

        const auto host = hostTemplate_.substitute(team);

        bool reachable = false;
        try {
            reachable = probe_.probe(host, ports_, settings_.probeTimeout);
        } catch (const std::exception& e) {
            ++probeFaults_;
            spdlog::warn("Probe of team {} host {} failed: {}", team, host, e.what());
            registry_.report(team, host, false);

            if (stop_.waitFor(settings_.errorBackoff)) {
                return false;
            }
            continue; // retry the same team
        }

        registry_.report(team, host, reachable);
        if (team == teams.end) {
            break;
        }
        ++team;
    }

    ++completedCycles_;
    return true;
}

} // namespace resetwatch::monitor
