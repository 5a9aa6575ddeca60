#include <catch2/catch_test_macros.hpp>

#include "infrastructure/output/ConsoleStatusListener.hpp"

#include <sstream>
#include <thread>
#include <vector>

using namespace resetwatch::core;
using namespace resetwatch::infra;

namespace {

StatusReport makeReport(ReportKind kind, std::vector<DownEntry> downHosts) {
    return StatusReport::capture(kind, std::move(downHosts));
}

} // namespace

TEST_CASE("ConsoleStatusListener event lines", "[ConsoleStatusListener]") {
    StatusEvent event;
    event.team = 4;
    event.host = "10.4.1.5";

    event.type = StatusEventType::PossibleReset;
    REQUIRE(ConsoleStatusListener::formatEvent(event) ==
            "TEAM 4 - HOST 10.4.1.5 - POSSIBLE BOX RESET");

    event.type = StatusEventType::Recovered;
    REQUIRE(ConsoleStatusListener::formatEvent(event) == "TEAM 4 - HOST 10.4.1.5 - RECOVERED");
}

TEST_CASE("ConsoleStatusListener report lines", "[ConsoleStatusListener]") {
    SECTION("Periodic with every host up") {
        auto report = makeReport(ReportKind::Periodic, {});
        auto lines = ConsoleStatusListener::formatReport(report);
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0] ==
                "=== STATUS REPORT [" + report.formattedTimestamp() + "]: All hosts are UP ===");
    }

    SECTION("Periodic digest lists entries and a footer") {
        auto report = makeReport(ReportKind::Periodic, {{1, "10.1.1.5"}, {3, "10.3.1.9"}});
        auto lines = ConsoleStatusListener::formatReport(report);
        REQUIRE(lines.size() == 4);
        REQUIRE(lines[0] == "=== STATUS REPORT [" + report.formattedTimestamp() +
                                "]: 2 hosts currently down ===");
        REQUIRE(lines[1] == "  TEAM 1 - 10.1.1.5");
        REQUIRE(lines[2] == "  TEAM 3 - 10.3.1.9");
        REQUIRE(lines[3] == std::string(50, '='));
    }

    SECTION("Interim status") {
        auto lines =
            ConsoleStatusListener::formatReport(makeReport(ReportKind::Interim, {{2, "10.2.1.5"}}));
        REQUIRE(lines == std::vector<std::string>{"---------- HOSTS DOWN STATUS ----------",
                                                  "  TEAM 2 - 10.2.1.5"});
    }

    SECTION("Final status only when hosts are down") {
        REQUIRE(ConsoleStatusListener::formatReport(makeReport(ReportKind::Final, {})).empty());

        auto lines =
            ConsoleStatusListener::formatReport(makeReport(ReportKind::Final, {{2, "10.2.1.5"}}));
        REQUIRE(lines == std::vector<std::string>{"FINAL STATUS: 1 hosts were down at shutdown:",
                                                  "  TEAM 2 - 10.2.1.5"});
    }
}

TEST_CASE("ConsoleStatusListener output", "[ConsoleStatusListener]") {
    std::ostringstream out;
    ConsoleStatusListener listener(out);

    SECTION("Writes whole lines") {
        StatusEvent event{StatusEventType::PossibleReset, 2, "10.2.1.5", {}};
        listener.onStatusEvent(event);
        listener.onStatusReport(makeReport(ReportKind::Final, {}));
        REQUIRE(out.str() == "TEAM 2 - HOST 10.2.1.5 - POSSIBLE BOX RESET\n");
    }

    SECTION("Concurrent writers never split a line") {
        constexpr int kThreads = 4;
        constexpr int kEvents = 100;

        std::vector<std::thread> threads;
        for (int t = 0; t < kThreads; ++t) {
            threads.emplace_back([&listener, t] {
                for (int i = 0; i < kEvents; ++i) {
                    StatusEvent event{StatusEventType::Recovered, t, "10.0.0." + std::to_string(i),
                                      {}};
                    listener.onStatusEvent(event);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        std::istringstream in(out.str());
        std::string line;
        int count = 0;
        while (std::getline(in, line)) {
            ++count;
            REQUIRE(line.rfind("TEAM ", 0) == 0);
            REQUIRE(line.size() > 12);
            REQUIRE(line.substr(line.size() - 12) == " - RECOVERED");
        }
        REQUIRE(count == kThreads * kEvents);
    }
}
