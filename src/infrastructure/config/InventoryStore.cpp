#include "infrastructure/config/InventoryStore.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>

namespace resetwatch::infra {

InventoryStore::InventoryStore(std::filesystem::path hostsFile, std::filesystem::path portsFile,
                               std::string placeholder)
    : hostsFile_(std::move(hostsFile)),
      portsFile_(std::move(portsFile)),
      placeholder_(std::move(placeholder)) {}

bool InventoryStore::backupExisting(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::exists(file, ec)) {
        return true;
    }

    auto backup = file;
    backup += ".backup";
    std::filesystem::remove(backup, ec);
    std::filesystem::rename(file, backup, ec);
    if (ec) {
        spdlog::error("Failed to back up {}: {}", file.string(), ec.message());
        return false;
    }

    spdlog::info("Backed up {} to {}", file.string(), backup.string());
    return true;
}

bool InventoryStore::saveHosts(const std::vector<core::HostTemplate>& templates) const {
    if (!backupExisting(hostsFile_)) {
        return false;
    }

    std::ofstream file(hostsFile_);
    if (!file) {
        spdlog::error("Failed to open hosts file for writing: {}", hostsFile_.string());
        return false;
    }

    for (const auto& hostTemplate : templates) {
        file << hostTemplate.pattern() << '\n';
    }

    if (!file) {
        spdlog::error("Failed to write hosts file: {}", hostsFile_.string());
        return false;
    }

    spdlog::info("Wrote {} host templates to {}", templates.size(), hostsFile_.string());
    return true;
}

std::optional<std::vector<core::HostTemplate>> InventoryStore::loadHosts() const {
    std::ifstream file(hostsFile_);
    if (!file) {
        spdlog::error("Failed to open hosts file: {}", hostsFile_.string());
        return std::nullopt;
    }

    std::vector<core::HostTemplate> templates;
    std::string line;
    int lineNumber = 0;

    while (std::getline(file, line)) {
        ++lineNumber;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        auto last = line.find_last_not_of(" \t\r");
        auto text = line.substr(first, last - first + 1);

        auto hostTemplate = core::HostTemplate::parse(text, placeholder_);
        if (!hostTemplate) {
            spdlog::error("{}:{}: invalid host template \"{}\"", hostsFile_.string(), lineNumber,
                          text);
            return std::nullopt;
        }
        templates.push_back(*hostTemplate);
    }

    return templates;
}

std::optional<std::vector<core::HostTemplate>>
InventoryStore::templatesWithoutPorts(const core::HostInventory& inventory) const {
    auto templates = loadHosts();
    if (!templates) {
        return std::nullopt;
    }

    std::vector<core::HostTemplate> missing;
    for (const auto& hostTemplate : *templates) {
        if (!inventory.portsFor(hostTemplate.pattern())) {
            missing.push_back(hostTemplate);
        }
    }
    return missing;
}

bool InventoryStore::savePorts(const core::HostInventory& inventory) const {
    if (!backupExisting(portsFile_)) {
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::object();
        for (const auto& entry : inventory.entries()) {
            j[entry.hostTemplate.pattern()] = entry.ports;
        }

        std::ofstream file(portsFile_);
        if (!file) {
            spdlog::error("Failed to open ports file for writing: {}", portsFile_.string());
            return false;
        }

        file << j.dump(2) << '\n';
        spdlog::info("Wrote {} templates to {}", inventory.size(), portsFile_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save ports file: {}", e.what());
        return false;
    }
}

std::optional<core::HostInventory> InventoryStore::loadPorts() const {
    try {
        std::ifstream file(portsFile_);
        if (!file) {
            spdlog::error("Failed to open ports file: {}", portsFile_.string());
            return std::nullopt;
        }

        nlohmann::json j;
        file >> j;
        if (!j.is_object()) {
            spdlog::error("{} must contain a JSON object", portsFile_.string());
            return std::nullopt;
        }

        core::HostInventory inventory;
        for (const auto& item : j.items()) {
            const auto& pattern = item.key();
            const auto& portList = item.value();
            auto hostTemplate = core::HostTemplate::parse(pattern, placeholder_);
            if (!hostTemplate) {
                spdlog::error("{}: invalid host template \"{}\"", portsFile_.string(), pattern);
                return std::nullopt;
            }

            if (!portList.is_array()) {
                spdlog::error("{}: ports for \"{}\" must be an array", portsFile_.string(),
                              pattern);
                return std::nullopt;
            }

            std::vector<uint16_t> ports;
            for (const auto& value : portList) {
                if (!value.is_number_integer()) {
                    spdlog::error("{}: non-integer port for \"{}\"", portsFile_.string(), pattern);
                    return std::nullopt;
                }
                auto port = value.get<int64_t>();
                if (port < 1 || port > 65535) {
                    spdlog::error("{}: port {} for \"{}\" is out of range", portsFile_.string(),
                                  port, pattern);
                    return std::nullopt;
                }
                ports.push_back(static_cast<uint16_t>(port));
            }

            if (!inventory.add(*hostTemplate, ports)) {
                spdlog::error("{}: no ports listed for \"{}\"", portsFile_.string(), pattern);
                return std::nullopt;
            }
        }

        spdlog::info("Loaded {} templates from {}", inventory.size(), portsFile_.string());
        return inventory;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load ports file: {}", e.what());
        return std::nullopt;
    }
}

} // namespace resetwatch::infra
