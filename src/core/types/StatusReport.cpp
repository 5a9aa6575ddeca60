#include "core/types/StatusReport.hpp"

#include <ctime>

namespace resetwatch::core {

StatusReport StatusReport::capture(ReportKind kind, std::vector<DownEntry> downHosts) {
    StatusReport report;
    report.kind = kind;
    report.timestamp = std::chrono::system_clock::now();
    report.downHosts = std::move(downHosts);
    return report;
}

std::string StatusReport::formattedTimestamp() const {
    auto t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm local{};
    localtime_r(&t, &local);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return buf;
}

std::string StatusReport::kindToString() const {
    switch (kind) {
    case ReportKind::Periodic:
        return "Periodic";
    case ReportKind::Interim:
        return "Interim";
    case ReportKind::Final:
        return "Final";
    }
    return "Unknown";
}

} // namespace resetwatch::core
