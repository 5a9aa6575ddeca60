#include "infrastructure/output/ConsoleStatusListener.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace resetwatch::infra {

namespace {

constexpr std::size_t kFooterWidth = 50;

std::string entryLine(const core::DownEntry& entry) {
    return fmt::format("  TEAM {} - {}", entry.team, entry.host);
}

} // namespace

ConsoleStatusListener::ConsoleStatusListener(std::ostream& out) : out_(out) {}

std::string ConsoleStatusListener::formatEvent(const core::StatusEvent& event) {
    switch (event.type) {
        case core::StatusEventType::PossibleReset:
            return fmt::format("TEAM {} - HOST {} - POSSIBLE BOX RESET", event.team, event.host);
        case core::StatusEventType::Recovered:
            return fmt::format("TEAM {} - HOST {} - RECOVERED", event.team, event.host);
    }
    return {};
}

std::vector<std::string> ConsoleStatusListener::formatReport(const core::StatusReport& report) {
    std::vector<std::string> lines;

    switch (report.kind) {
        case core::ReportKind::Periodic:
            if (report.allHostsUp()) {
                lines.push_back(fmt::format("=== STATUS REPORT [{}]: All hosts are UP ===",
                                            report.formattedTimestamp()));
                break;
            }
            lines.push_back(fmt::format("=== STATUS REPORT [{}]: {} hosts currently down ===",
                                        report.formattedTimestamp(), report.downCount()));
            for (const auto& entry : report.downHosts) {
                lines.push_back(entryLine(entry));
            }
            lines.emplace_back(kFooterWidth, '=');
            break;

        case core::ReportKind::Interim:
            lines.emplace_back("---------- HOSTS DOWN STATUS ----------");
            for (const auto& entry : report.downHosts) {
                lines.push_back(entryLine(entry));
            }
            break;

        case core::ReportKind::Final:
            if (report.allHostsUp()) {
                break;
            }
            lines.push_back(
                fmt::format("FINAL STATUS: {} hosts were down at shutdown:", report.downCount()));
            for (const auto& entry : report.downHosts) {
                lines.push_back(entryLine(entry));
            }
            break;
    }

    return lines;
}

void ConsoleStatusListener::onStatusEvent(const core::StatusEvent& event) {
    auto line = formatEvent(event);
    {
        std::lock_guard lock(mutex_);
        out_ << line << std::endl;
    }
    spdlog::debug("{}", line);
}

void ConsoleStatusListener::onStatusReport(const core::StatusReport& report) {
    auto lines = formatReport(report);
    if (lines.empty()) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        for (const auto& line : lines) {
            out_ << line << '\n';
        }
        out_.flush();
    }
    spdlog::debug("{} report with {} down hosts", report.kindToString(), report.downCount());
}

} // namespace resetwatch::infra
