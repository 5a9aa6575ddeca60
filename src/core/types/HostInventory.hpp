/**
 * @file HostInventory.hpp
 * @brief Host templates and the ports known to be open on them.
 */

#pragma once

#include "core/types/HostTemplate.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace resetwatch::core {

/**
 * @brief One inventory line: a host template and its candidate ports.
 */
struct InventoryEntry {
    HostTemplate hostTemplate;   ///< Template shared by every team
    std::vector<uint16_t> ports; ///< Ports tried in order when probing

    bool operator==(const InventoryEntry& other) const = default;
};

/**
 * @brief Static set of templates to monitor, loaded once before a run.
 *
 * Entries keep their insertion order. Adding a template that is already
 * present replaces its port list.
 */
class HostInventory {
public:
    /**
     * @brief Adds or replaces a template.
     * @param hostTemplate Template to monitor.
     * @param ports Candidate ports; must be non-empty and contain no port 0.
     * @return False if the port list is rejected.
     */
    bool add(HostTemplate hostTemplate, std::vector<uint16_t> ports);

    /**
     * @brief Looks up the ports for a template pattern.
     * @param pattern Template pattern as written in the inventory.
     * @return Ports if the template is known, nullopt otherwise.
     */
    [[nodiscard]] std::optional<std::vector<uint16_t>> portsFor(const std::string& pattern) const;

    [[nodiscard]] const std::vector<InventoryEntry>& entries() const { return entries_; }
    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    /**
     * @brief Validates a candidate port list.
     * @return True if non-empty and every port is in 1-65535.
     */
    static bool isValidPortSet(const std::vector<uint16_t>& ports);

private:
    std::vector<InventoryEntry> entries_;
};

} // namespace resetwatch::core
