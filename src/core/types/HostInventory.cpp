#include "core/types/HostInventory.hpp"

#include <algorithm>

namespace resetwatch::core {

bool HostInventory::isValidPortSet(const std::vector<uint16_t>& ports) {
    return !ports.empty() &&
           std::none_of(ports.begin(), ports.end(), [](uint16_t port) { return port == 0; });
}

bool HostInventory::add(HostTemplate hostTemplate, std::vector<uint16_t> ports) {
    if (!isValidPortSet(ports)) {
        return false;
    }

    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const InventoryEntry& entry) {
        return entry.hostTemplate.pattern() == hostTemplate.pattern();
    });

    if (it != entries_.end()) {
        it->ports = std::move(ports);
    } else {
        entries_.push_back(InventoryEntry{std::move(hostTemplate), std::move(ports)});
    }
    return true;
}

std::optional<std::vector<uint16_t>> HostInventory::portsFor(const std::string& pattern) const {
    for (const auto& entry : entries_) {
        if (entry.hostTemplate.pattern() == pattern) {
            return entry.ports;
        }
    }
    return std::nullopt;
}

} // namespace resetwatch::core
