#include <catch2/catch_test_macros.hpp>

#include "monitor/TemplateMonitor.hpp"
#include "support/TestDoubles.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <string>
#include <thread>

using namespace resetwatch::core;
using namespace resetwatch::monitor;
using resetwatch::test::ScriptedProbe;
using namespace std::chrono_literals;

namespace {

MonitorSettings threeTeams() {
    MonitorSettings settings;
    settings.teams = TeamRange{1, 3};
    settings.probeTimeout = 50ms;
    settings.cyclePause = 1ms;
    settings.errorBackoff = 0ms;
    return settings;
}

HostTemplate sshTemplate() {
    return *HostTemplate::parse("10.{team}.1.5");
}

} // namespace

TEST_CASE("TemplateMonitor single cycle", "[TemplateMonitor]") {
    auto settings = threeTeams();
    ScriptedProbe probe;
    std::vector<StatusEvent> events;
    DownHostRegistry registry([&events](const StatusEvent& event) { events.push_back(event); });
    StopSignal stop;
    TemplateMonitor monitor(sshTemplate(), {22}, settings, probe, registry, stop);

    probe.setReachable("10.2.1.5", false);

    SECTION("Unreachable team is recorded after one cycle") {
        REQUIRE(monitor.runCycle());

        REQUIRE(probe.probedHosts() ==
                std::vector<std::string>{"10.1.1.5", "10.2.1.5", "10.3.1.5"});
        REQUIRE(registry.snapshot() == std::vector<DownEntry>{{2, "10.2.1.5"}});
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == StatusEventType::PossibleReset);
        REQUIRE(monitor.completedCycles() == 1);
    }

    SECTION("Recovery on the next cycle") {
        REQUIRE(monitor.runCycle());
        probe.setReachable("10.2.1.5", true);
        REQUIRE(monitor.runCycle());

        REQUIRE(registry.empty());
        REQUIRE(events.size() == 2);
        REQUIRE(events[1].type == StatusEventType::Recovered);
        REQUIRE(events[1].team == 2);
        REQUIRE(events[1].host == "10.2.1.5");
    }

    SECTION("Probe receives the template's ports and the timeout") {
        REQUIRE(monitor.runCycle());
        REQUIRE(probe.lastPorts() == std::vector<uint16_t>{22});
        REQUIRE(probe.lastTimeout() == 50ms);
    }
}

TEST_CASE("TemplateMonitor stop handling", "[TemplateMonitor]") {
    auto settings = threeTeams();
    ScriptedProbe probe;
    DownHostRegistry registry;
    StopSignal stop;
    TemplateMonitor monitor(sshTemplate(), {22}, settings, probe, registry, stop);

    SECTION("Stop during a cycle abandons the remaining teams") {
        probe.setOnProbe([&stop](const std::string& host) {
            if (host == "10.1.1.5") {
                stop.set();
            }
        });

        monitor.run();

        REQUIRE(probe.probedHosts() == std::vector<std::string>{"10.1.1.5"});
        REQUIRE(monitor.completedCycles() == 0);
    }

    SECTION("Stopped monitor probes nothing") {
        stop.set();
        monitor.run();
        REQUIRE(probe.callCount() == 0);
        REQUIRE_FALSE(monitor.runCycle());
    }

    SECTION("Runs repeated cycles until stopped") {
        std::thread worker([&monitor] { monitor.run(); });
        std::this_thread::sleep_for(50ms);
        stop.set();
        worker.join();

        REQUIRE(monitor.completedCycles() >= 2);
        REQUIRE(probe.callCount() >= 6);
    }
}

TEST_CASE("TemplateMonitor probe faults", "[TemplateMonitor]") {
    auto settings = threeTeams();
    ScriptedProbe probe;
    std::vector<StatusEvent> events;
    DownHostRegistry registry([&events](const StatusEvent& event) { events.push_back(event); });
    StopSignal stop;
    TemplateMonitor monitor(sshTemplate(), {22}, settings, probe, registry, stop);

    probe.failNext("10.2.1.5", 1);

    SECTION("Fault counts as unreachable and the team is retried") {
        REQUIRE(monitor.runCycle());

        REQUIRE(monitor.probeFaults() == 1);
        REQUIRE(probe.probedHosts() ==
                std::vector<std::string>{"10.1.1.5", "10.2.1.5", "10.2.1.5", "10.3.1.5"});
        REQUIRE(events.size() == 2);
        REQUIRE(events[0].type == StatusEventType::PossibleReset);
        REQUIRE(events[1].type == StatusEventType::Recovered);
        REQUIRE(registry.empty());
    }

    SECTION("Later cycles still run") {
        REQUIRE(monitor.runCycle());
        REQUIRE(monitor.runCycle());
        REQUIRE(monitor.completedCycles() == 2);

        auto hosts = probe.probedHosts();
        REQUIRE(std::count(hosts.begin(), hosts.end(), "10.2.1.5") == 3);
    }

    SECTION("Stop during the back-off ends the cycle") {
        settings.errorBackoff = 10s;
        std::thread stopper([&stop] {
            std::this_thread::sleep_for(50ms);
            stop.set();
        });

        auto start = std::chrono::steady_clock::now();
        bool completed = monitor.runCycle();
        auto elapsed = std::chrono::steady_clock::now() - start;
        stopper.join();

        REQUIRE_FALSE(completed);
        REQUIRE(elapsed < 5s);
        REQUIRE(registry.contains(2, "10.2.1.5"));
    }
}

TEST_CASE("TemplateMonitor team range bounds", "[TemplateMonitor]") {
    constexpr int kLastTeam = std::numeric_limits<int>::max();
    auto settings = threeTeams();
    settings.teams = TeamRange{kLastTeam - 1, kLastTeam};
    ScriptedProbe probe;
    DownHostRegistry registry;
    StopSignal stop;
    TemplateMonitor monitor(sshTemplate(), {22}, settings, probe, registry, stop);

    const auto lastHost = "10." + std::to_string(kLastTeam) + ".1.5";

    SECTION("Cycle ending at INT_MAX stops after the last team") {
        REQUIRE(monitor.runCycle());
        REQUIRE(probe.probedHosts() ==
                std::vector<std::string>{"10." + std::to_string(kLastTeam - 1) + ".1.5", lastHost});
        REQUIRE(monitor.completedCycles() == 1);
    }

    SECTION("Fault on the last team retries it without overflowing") {
        probe.failNext(lastHost, 1);
        REQUIRE(monitor.runCycle());

        auto hosts = probe.probedHosts();
        REQUIRE(hosts.size() == 3);
        REQUIRE(hosts[1] == lastHost);
        REQUIRE(hosts[2] == lastHost);
        REQUIRE(monitor.probeFaults() == 1);
    }

    SECTION("Empty range probes nothing") {
        settings.teams = TeamRange{3, 1};
        REQUIRE_FALSE(monitor.runCycle());
        REQUIRE(probe.callCount() == 0);
    }
}
