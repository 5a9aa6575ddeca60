#pragma once

#include "app/CommandLine.hpp"
#include "core/types/HostInventory.hpp"
#include "infrastructure/config/ConfigManager.hpp"
#include "infrastructure/config/InventoryStore.hpp"
#include "infrastructure/network/AsioContext.hpp"
#include "monitor/MonitorSettings.hpp"

#include <spdlog/common.h>

#include <memory>
#include <optional>
#include <string>

namespace resetwatch::app {

/**
 * @brief Top-level command dispatcher.
 *
 * Loads the configuration, sets up logging and the I/O context, and runs
 * the requested commands in order: discovery first, then monitoring.
 */
class Application {
public:
    /// Exit status of a check that found at least one host down.
    static constexpr int kExitHostsDown = 2;

    explicit Application(CommandLineOptions options);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Runs the requested commands.
     * @return Process exit status.
     */
    int run();

    /**
     * @brief Installs the default "resetwatch" logger.
     * @param level Console level.
     * @param logFile Rotating log file; empty for console only.
     */
    static void initializeLogging(spdlog::level::level_enum level, const std::string& logFile);

    /**
     * @brief Converts configured timings to monitor settings.
     */
    static monitor::MonitorSettings makeSettings(const infra::AppConfig& config);

private:
    int initConfig();
    bool loadConfig();
    bool discover();
    int resetCheck();
    int checkOnce();
    std::optional<core::HostInventory> loadInventory() const;
    infra::AsioContext& asioContext();

    CommandLineOptions options_;
    std::unique_ptr<infra::ConfigManager> config_;
    std::unique_ptr<infra::InventoryStore> store_;
    std::unique_ptr<infra::AsioContext> asioContext_;
};

} // namespace resetwatch::app
