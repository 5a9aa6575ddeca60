#pragma once

#include "core/services/IStatusListener.hpp"

#include <iostream>
#include <mutex>
#include <ostream>

namespace resetwatch::infra {

/**
 * @brief Writes alerts and status digests for the operator.
 *
 * Every event and report is written as whole lines under one mutex, so
 * output from concurrent monitor threads never interleaves. Each message
 * is also logged at debug level.
 */
class ConsoleStatusListener : public core::IStatusListener {
public:
    explicit ConsoleStatusListener(std::ostream& out = std::cout);

    void onStatusEvent(const core::StatusEvent& event) override;
    void onStatusReport(const core::StatusReport& report) override;

    /**
     * @brief Renders an event as its single alert line.
     */
    static std::string formatEvent(const core::StatusEvent& event);

    /**
     * @brief Renders a report, one string per output line.
     *
     * A final report with no down hosts renders as nothing.
     */
    static std::vector<std::string> formatReport(const core::StatusReport& report);

private:
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace resetwatch::infra
