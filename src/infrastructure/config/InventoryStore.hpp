#pragma once

#include "core/types/HostInventory.hpp"
#include "core/types/HostTemplate.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace resetwatch::infra {

/**
 * @brief Reads and writes the discovered inventory files.
 *
 * The hosts file lists one template per line. The ports file is a JSON
 * object mapping each template to its open ports, and is the inventory
 * the monitor runs from.
 */
class InventoryStore {
public:
    InventoryStore(std::filesystem::path hostsFile, std::filesystem::path portsFile,
                   std::string placeholder = core::HostTemplate::kDefaultPlaceholder);

    /**
     * @brief Writes templates to the hosts file, one per line.
     * @return True on success.
     */
    bool saveHosts(const std::vector<core::HostTemplate>& templates) const;

    /**
     * @brief Reads the hosts file.
     *
     * Blank lines and lines starting with '#' are skipped.
     *
     * @return Templates in file order, or nullopt if the file is missing
     *         or contains an invalid template.
     */
    std::optional<std::vector<core::HostTemplate>> loadHosts() const;

    /**
     * @brief Writes the inventory to the ports file as indented JSON.
     * @return True on success.
     */
    bool savePorts(const core::HostInventory& inventory) const;

    /**
     * @brief Reads and validates the ports file.
     * @return The inventory, or nullopt if the file is missing, malformed or
     *         has any invalid template or port list.
     */
    std::optional<core::HostInventory> loadPorts() const;

    /**
     * @brief Lists hosts-file templates that have no entry in @p inventory.
     *
     * These are hosts found live during discovery that showed no open port,
     * so monitoring will not cover them.
     *
     * @return Templates in hosts-file order, or nullopt if the hosts file is
     *         missing or invalid.
     */
    std::optional<std::vector<core::HostTemplate>>
    templatesWithoutPorts(const core::HostInventory& inventory) const;

    /**
     * @brief Renames an existing file to "<file>.backup".
     *
     * An older backup is replaced. Does nothing if @p file does not exist.
     *
     * @return False only if an existing file could not be moved.
     */
    static bool backupExisting(const std::filesystem::path& file);

    const std::filesystem::path& hostsFile() const { return hostsFile_; }
    const std::filesystem::path& portsFile() const { return portsFile_; }

private:
    std::filesystem::path hostsFile_;
    std::filesystem::path portsFile_;
    std::string placeholder_;
};

} // namespace resetwatch::infra
