#include "app/DiscoveryJob.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace resetwatch::app {

DiscoveryJob::DiscoveryJob(const infra::AppConfig& config, core::IDiscoveryScanner& scanner,
                           const infra::InventoryStore& store)
    : config_(config), scanner_(scanner), store_(store) {}

bool DiscoveryJob::run() {
    auto subnetTemplate = core::HostTemplate::parse(config_.hostPattern, config_.placeholder);
    if (!subnetTemplate) {
        spdlog::error("Host pattern \"{}\" must contain {} exactly once", config_.hostPattern,
                      core::HostTemplate::tokenFor(config_.placeholder));
        return false;
    }

    auto subnet = subnetTemplate->substitute(config_.referenceTeam);
    spdlog::info("Discovering hosts on {} (team {})", subnet, config_.referenceTeam);

    auto discovered = scanner_.scanSubnet(subnet, config_.discoveryPorts);
    if (discovered.empty()) {
        spdlog::error("No hosts discovered on {}", subnet);
        return false;
    }

    std::vector<std::string> hosts;
    std::vector<core::HostTemplate> templates;
    for (const auto& host : discovered) {
        auto hostTemplate = core::HostTemplate::fromConcreteHost(
            host, config_.hostPattern, config_.referenceTeam, config_.placeholder);
        if (!hostTemplate) {
            spdlog::error("Cannot derive a template from {} with pattern {}", host,
                          config_.hostPattern);
            continue;
        }
        if (std::find(templates.begin(), templates.end(), *hostTemplate) != templates.end()) {
            continue;
        }
        hosts.push_back(host);
        templates.push_back(*hostTemplate);
    }

    if (templates.empty()) {
        spdlog::error("None of the {} discovered hosts matches {}", discovered.size(),
                      config_.hostPattern);
        return false;
    }

    if (!store_.saveHosts(templates)) {
        return false;
    }

    auto openPorts = scanner_.scanHosts(hosts, config_.scanPorts);

    core::HostInventory inventory;
    for (const auto& [host, ports] : openPorts) {
        auto hostTemplate = core::HostTemplate::fromConcreteHost(
            host, config_.hostPattern, config_.referenceTeam, config_.placeholder);
        if (!hostTemplate) {
            spdlog::error("Cannot derive a template from {} with pattern {}", host,
                          config_.hostPattern);
            continue;
        }
        if (!inventory.add(*hostTemplate, ports)) {
            spdlog::warn("Skipping {}: no usable open ports", host);
        }
    }

    if (inventory.empty()) {
        spdlog::error("No open ports found on any discovered host");
        return false;
    }

    if (!store_.savePorts(inventory)) {
        return false;
    }

    spdlog::info("Discovery complete: {} templates with open ports", inventory.size());
    return true;
}

} // namespace resetwatch::app
