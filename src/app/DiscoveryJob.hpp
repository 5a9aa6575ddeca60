#pragma once

#include "core/services/IDiscoveryScanner.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/config/InventoryStore.hpp"

namespace resetwatch::app {

/**
 * @brief Builds the inventory by scanning the reference team.
 *
 * Sweeps the reference team's subnet for live hosts, turns each host into
 * a template, scans the hosts for open ports and writes both the hosts
 * file and the ports file.
 */
class DiscoveryJob {
public:
    DiscoveryJob(const infra::AppConfig& config, core::IDiscoveryScanner& scanner,
                 const infra::InventoryStore& store);

    /**
     * @brief Runs discovery and writes the inventory files.
     * @return True if an inventory with at least one template was written.
     */
    bool run();

private:
    const infra::AppConfig& config_;
    core::IDiscoveryScanner& scanner_;
    const infra::InventoryStore& store_;
};

} // namespace resetwatch::app
