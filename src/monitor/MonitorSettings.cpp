#include "monitor/MonitorSettings.hpp"

#include <spdlog/fmt/fmt.h>

namespace resetwatch::monitor {

std::vector<std::string> MonitorSettings::validate() const {
    std::vector<std::string> problems;

    if (!teams.isValid()) {
        problems.push_back(
            fmt::format("team range start {} is after end {}", teams.start, teams.end));
    }
    if (teams.start < 0) {
        problems.push_back(fmt::format("team range start {} is negative", teams.start));
    }

    auto requirePositive = [&problems](const char* name, std::chrono::milliseconds value) {
        if (value.count() <= 0) {
            problems.push_back(fmt::format("{} must be positive (got {} ms)", name, value.count()));
        }
    };
    requirePositive("probe timeout", probeTimeout);
    requirePositive("report interval", reportInterval);
    requirePositive("poll interval", pollInterval);
    requirePositive("join timeout", joinTimeout);

    if (cyclePause.count() < 0) {
        problems.push_back("cycle pause must not be negative");
    }
    if (errorBackoff.count() < 0) {
        problems.push_back("error backoff must not be negative");
    }

    return problems;
}

} // namespace resetwatch::monitor
