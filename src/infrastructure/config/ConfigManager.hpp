#pragma once

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace resetwatch::infra {

/**
 * @brief Application configuration settings.
 *
 * Contains the host pattern and team range, discovery scanner options,
 * probe and monitor timing, and logging preferences.
 */
struct AppConfig {
    // Hosts
    std::string hostPattern{"10.{team}.1.0/24"}; ///< Subnet pattern with the team token.
    int teamStart{1};                            ///< First team (inclusive).
    int teamEnd{1};                              ///< Last team (inclusive).
    int referenceTeam{1};                        ///< Team scanned during discovery.
    std::string placeholder{"team"};             ///< Placeholder name inside braces.
    std::string hostsFile{"hosts.txt"};          ///< Discovered host templates.

    // Discovery scanner
    std::vector<uint16_t> discoveryPorts{22, 80, 443, 3389}; ///< Ports for the subnet sweep.
    std::vector<uint16_t> scanPorts;                         ///< Ports per host; empty for --top.
    std::string portsFile{"ports.json"};                     ///< Template to ports inventory.
    std::string scannerPath{"./scanning/rustscan-linux"};    ///< RustScan binary.
    int scanTimeoutSeconds{300};                             ///< Limit per scanner run.

    // Port checker
    int probeTimeoutMs{3000}; ///< Connect timeout per port.

    // Monitor
    int reportIntervalSeconds{30}; ///< Periodic status report cadence.
    int pollIntervalSeconds{30};   ///< Supervisor health poll cadence.
    int cyclePauseMs{100};         ///< Pause between full team cycles.
    int errorBackoffMs{1000};      ///< Pause after a probe fault.
    int joinTimeoutSeconds{5};     ///< Wait per thread at shutdown.
    int ioThreads{4};              ///< Threads running the I/O context.

    // Logging
    std::string logLevel{"info"}; ///< spdlog level name.
    std::string logFile;          ///< Rotating log file; empty disables it.
};

/**
 * @brief Manages application configuration persistence.
 *
 * Loads and saves AppConfig as JSON. Keys missing from the file keep
 * their defaults.
 */
class ConfigManager {
public:
    /**
     * @brief Constructs a ConfigManager for the specified config file.
     * @param configPath Path to the JSON configuration file.
     */
    explicit ConfigManager(std::filesystem::path configPath);

    /**
     * @brief Loads configuration from disk.
     * @return True if loaded successfully, false if the file is missing or malformed.
     */
    bool load();

    /**
     * @brief Saves configuration to disk.
     * @return True if saved successfully, false otherwise.
     */
    bool save() const;

    /**
     * @brief Checks the loaded values for consistency.
     * @return Human-readable problems, empty if the configuration is usable.
     */
    [[nodiscard]] std::vector<std::string> validate() const;

    AppConfig& config() { return config_; }
    const AppConfig& config() const { return config_; }

    /**
     * @brief Returns the path to the configuration file.
     */
    const std::filesystem::path& configPath() const { return configPath_; }

    nlohmann::json toJson() const;

    /**
     * @brief Applies the sections present in @p j over the current values.
     * @throws std::out_of_range if a port list holds a value outside 1-65535.
     * @throws std::invalid_argument if a port list is not an array of integers.
     */
    void fromJson(const nlohmann::json& j);

private:
    std::filesystem::path configPath_;
    AppConfig config_;
};

} // namespace resetwatch::infra
