#pragma once

#include "core/types/HostTemplate.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace resetwatch::monitor {

/**
 * @brief Team range and timing for one monitoring run.
 */
struct MonitorSettings {
    core::TeamRange teams;                             ///< Teams probed each cycle
    std::chrono::milliseconds probeTimeout{3000};      ///< Per-port connect timeout
    std::chrono::milliseconds cyclePause{100};         ///< Pause between full cycles
    std::chrono::milliseconds errorBackoff{1000};      ///< Pause after a fault
    std::chrono::milliseconds reportInterval{30000};   ///< Periodic digest cadence
    std::chrono::milliseconds pollInterval{30000};     ///< Supervisor health poll cadence
    std::chrono::milliseconds joinTimeout{5000};       ///< Per-unit shutdown wait

    /**
     * @brief Lists every invalid setting.
     * @return Human-readable problems, empty if the settings are usable.
     */
    [[nodiscard]] std::vector<std::string> validate() const;

    [[nodiscard]] bool isValid() const { return validate().empty(); }
};

} // namespace resetwatch::monitor
