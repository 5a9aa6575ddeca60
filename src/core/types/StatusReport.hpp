/**
 * @file StatusReport.hpp
 * @brief Point-in-time digests of the down-host registry.
 */

#pragma once

#include "core/types/DownEntry.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace resetwatch::core {

/**
 * @brief Why a report was produced.
 */
enum class ReportKind : int {
    Periodic = 0, ///< Regular digest from the status reporter
    Interim = 1,  ///< Supervisor health poll while hosts are down
    Final = 2     ///< Snapshot taken when monitoring stops
};

/**
 * @brief Snapshot of every down host at one moment.
 */
struct StatusReport {
    ReportKind kind{ReportKind::Periodic};
    std::chrono::system_clock::time_point timestamp;
    std::vector<DownEntry> downHosts; ///< Ordered by team, then host

    /**
     * @brief Creates a report stamped with the current wall-clock time.
     * @param kind Report kind.
     * @param downHosts Registry snapshot, already ordered.
     */
    static StatusReport capture(ReportKind kind, std::vector<DownEntry> downHosts);

    [[nodiscard]] bool allHostsUp() const { return downHosts.empty(); }
    [[nodiscard]] std::size_t downCount() const { return downHosts.size(); }

    /**
     * @brief Formats the timestamp as local "YYYY-mm-dd HH:MM:SS".
     */
    [[nodiscard]] std::string formattedTimestamp() const;

    [[nodiscard]] std::string kindToString() const;

    bool operator==(const StatusReport& other) const = default;
};

} // namespace resetwatch::core
