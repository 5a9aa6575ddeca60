#include "monitor/StatusReporter.hpp"

#include <spdlog/spdlog.h>

namespace resetwatch::monitor {

StatusReporter::StatusReporter(const DownHostRegistry& registry, core::IStatusListener& listener,
                               std::chrono::milliseconds interval, const StopSignal& stop)
    : registry_(registry), listener_(listener), interval_(interval), stop_(stop) {}

void StatusReporter::run() {
    spdlog::debug("Status reporter started, interval {} ms", interval_.count());

    while (!stop_.waitFor(interval_)) {
        listener_.onStatusReport(makeReport());
        ++reportsEmitted_;
    }

    spdlog::debug("Status reporter stopped after {} reports", reportsEmitted_.load());
}

core::StatusReport StatusReporter::makeReport() const {
    return core::StatusReport::capture(core::ReportKind::Periodic, registry_.snapshot());
}

} // namespace resetwatch::monitor
