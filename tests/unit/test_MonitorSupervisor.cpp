#include <catch2/catch_test_macros.hpp>

#include "monitor/MonitorSupervisor.hpp"
#include "support/TestDoubles.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace resetwatch::core;
using namespace resetwatch::monitor;
using resetwatch::test::RecordingListener;
using resetwatch::test::ScriptedProbe;
using namespace std::chrono_literals;

namespace {

MonitorSettings fastSettings() {
    MonitorSettings settings;
    settings.teams = TeamRange{1, 2};
    settings.probeTimeout = 50ms;
    settings.cyclePause = 1ms;
    settings.errorBackoff = 1ms;
    settings.reportInterval = 20ms;
    settings.pollInterval = 20ms;
    settings.joinTimeout = 2s;
    return settings;
}

HostInventory twoTemplates() {
    HostInventory inventory;
    inventory.add(*HostTemplate::parse("10.{team}.1.5"), {22});
    inventory.add(*HostTemplate::parse("10.{team}.1.9"), {80, 443});
    return inventory;
}

// Throws something that is not a std::exception, which no worker loop catches.
class FatalProbe : public IReachabilityProbe {
public:
    bool probe(const std::string& host, const std::vector<uint16_t>&,
               std::chrono::milliseconds) override {
        if (host == "10.1.1.9") {
            throw 42;
        }
        return true;
    }
};

// Ignores the stop signal for a fixed time, like a connect stuck in the kernel.
class SlowProbe : public IReachabilityProbe {
public:
    explicit SlowProbe(std::chrono::milliseconds delay) : delay_(delay) {}

    bool probe(const std::string&, const std::vector<uint16_t>&,
               std::chrono::milliseconds) override {
        entered = true;
        std::this_thread::sleep_for(delay_);
        return true;
    }

    std::atomic<bool> entered{false};

private:
    std::chrono::milliseconds delay_;
};

// Stops a run still in progress when a failed assertion unwinds the test.
class StopGuard {
public:
    explicit StopGuard(MonitorSupervisor& supervisor) : supervisor_(supervisor) {}
    ~StopGuard() { supervisor_.requestStop("test finished"); }

private:
    MonitorSupervisor& supervisor_;
};

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

TEST_CASE("MonitorSupervisor start validation", "[MonitorSupervisor]") {
    ScriptedProbe probe;
    RecordingListener listener;

    SECTION("Empty inventory is rejected") {
        MonitorSupervisor supervisor(HostInventory{}, fastSettings(), probe, listener);
        REQUIRE_THROWS_AS(supervisor.start(), std::invalid_argument);
        REQUIRE(supervisor.state() == SupervisorState::Idle);
    }

    SECTION("Invalid team range is rejected") {
        auto settings = fastSettings();
        settings.teams = TeamRange{4, 2};
        MonitorSupervisor supervisor(twoTemplates(), settings, probe, listener);
        REQUIRE_THROWS_AS(supervisor.start(), std::invalid_argument);
    }

    SECTION("Non-positive report interval is rejected") {
        auto settings = fastSettings();
        settings.reportInterval = 0ms;
        MonitorSupervisor supervisor(twoTemplates(), settings, probe, listener);
        REQUIRE_THROWS_AS(supervisor.start(), std::invalid_argument);
    }
}

TEST_CASE("MonitorSupervisor lifecycle", "[MonitorSupervisor]") {
    ScriptedProbe probe;
    RecordingListener listener;
    probe.setReachable("10.2.1.9", false);

    MonitorSupervisor supervisor(twoTemplates(), fastSettings(), probe, listener);
    REQUIRE(supervisor.state() == SupervisorState::Idle);

    SECTION("One monitor per template plus the reporter") {
        supervisor.start();
        REQUIRE(supervisor.state() == SupervisorState::Running);
        REQUIRE(supervisor.monitors().size() == 2);

        auto summary = supervisor.shutdown("test over");
        REQUIRE(summary.reason == "test over");
        REQUIRE(summary.unitsJoined == 3);
        REQUIRE(summary.unitsTimedOut == 0);
        REQUIRE(summary.anomalies.empty());
        REQUIRE(supervisor.state() == SupervisorState::Stopped);
    }

    SECTION("Second start while running is ignored") {
        supervisor.start();
        supervisor.start();
        REQUIRE(supervisor.monitors().size() == 2);
        REQUIRE(supervisor.shutdown("done").unitsJoined == 3);
    }

    SECTION("Shutdown without a run does nothing") {
        auto summary = supervisor.shutdown("nothing to stop");
        REQUIRE(summary.unitsJoined == 0);
        REQUIRE(supervisor.state() == SupervisorState::Idle);
    }

    SECTION("Operator stop ends run() with a final report") {
        auto result = std::async(std::launch::async, [&supervisor] { return supervisor.run(); });
        StopGuard guard(supervisor);

        REQUIRE(listener.waitForEvents(1, 5s));
        REQUIRE(eventually([&] { return !listener.reportsOfKind(ReportKind::Interim).empty(); }));
        REQUIRE(eventually([&] { return !listener.reportsOfKind(ReportKind::Periodic).empty(); }));

        supervisor.requestStop("User interruption");
        REQUIRE(result.wait_for(5s) == std::future_status::ready);
        auto summary = result.get();

        REQUIRE(summary.reason == "User interruption");
        REQUIRE(summary.anomalies.empty());
        REQUIRE(summary.unitsJoined == 3);

        auto events = listener.events();
        REQUIRE(events[0].type == StatusEventType::PossibleReset);
        REQUIRE(events[0].team == 2);
        REQUIRE(events[0].host == "10.2.1.9");

        auto interim = listener.reportsOfKind(ReportKind::Interim);
        REQUIRE(interim.front().downHosts == std::vector<DownEntry>{{2, "10.2.1.9"}});

        auto finals = listener.reportsOfKind(ReportKind::Final);
        REQUIRE(finals.size() == 1);
        REQUIRE(finals[0].downHosts == std::vector<DownEntry>{{2, "10.2.1.9"}});
        REQUIRE(listener.reports().back().kind == ReportKind::Final);
    }

    SECTION("Stop requested before run() is honoured") {
        supervisor.requestStop("early");
        REQUIRE(supervisor.isStopRequested());

        auto result = std::async(std::launch::async, [&supervisor] { return supervisor.run(); });

        StopGuard guard(supervisor);
        REQUIRE(result.wait_for(5s) == std::future_status::ready);
        REQUIRE(result.get().reason == "early");
        REQUIRE_FALSE(supervisor.isStopRequested());
    }

    SECTION("Restart clears the registry") {
        supervisor.start();
        REQUIRE(listener.waitForEvents(1, 5s));
        supervisor.shutdown("first run");
        REQUIRE_FALSE(supervisor.registry().empty());

        probe.setReachable("10.2.1.9", true);
        supervisor.start();
        REQUIRE(supervisor.state() == SupervisorState::Running);
        supervisor.shutdown("second run");

        // The host came back between runs, so the new run saw no transition.
        for (const auto& event : listener.events()) {
            REQUIRE(event.type == StatusEventType::PossibleReset);
        }
    }
}

TEST_CASE("MonitorSupervisor detects a dead monitor", "[MonitorSupervisor]") {
    FatalProbe probe;
    RecordingListener listener;
    auto settings = fastSettings();
    settings.pollInterval = 1h;

    MonitorSupervisor supervisor(twoTemplates(), settings, probe, listener);

    auto result = std::async(std::launch::async, [&supervisor] { return supervisor.run(); });

    StopGuard guard(supervisor);
    REQUIRE(result.wait_for(5s) == std::future_status::ready);
    auto summary = result.get();

    REQUIRE(summary.reason.find("monitor 10.{team}.1.9") != std::string::npos);
    REQUIRE(summary.reason.find("terminated unexpectedly") != std::string::npos);
    REQUIRE_FALSE(summary.anomalies.empty());
    REQUIRE(summary.unitsJoined == 3);
    REQUIRE(supervisor.state() == SupervisorState::Stopped);
}

TEST_CASE("MonitorSupervisor bounded join", "[MonitorSupervisor]") {
    SlowProbe probe(300ms);
    RecordingListener listener;
    auto settings = fastSettings();
    settings.teams = TeamRange{1, 1};
    settings.joinTimeout = 20ms;

    HostInventory inventory;
    inventory.add(*HostTemplate::parse("10.{team}.1.5"), {22});

    MonitorSupervisor supervisor(std::move(inventory), settings, probe, listener);
    supervisor.start();
    REQUIRE(eventually([&] { return probe.entered.load(); }));

    auto start = std::chrono::steady_clock::now();
    auto summary = supervisor.shutdown("slow probe");
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(summary.unitsTimedOut == 1);
    REQUIRE(summary.unitsJoined == 1);
    REQUIRE(summary.anomalies.size() == 1);
    REQUIRE(summary.anomalies[0].find("did not stop within 20 ms") != std::string::npos);
    REQUIRE(elapsed < 250ms);

    // The late monitor is joined before the next run starts.
    supervisor.start();
    REQUIRE(supervisor.state() == SupervisorState::Running);
    supervisor.shutdown("second run");
}
