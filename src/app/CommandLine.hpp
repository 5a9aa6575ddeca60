#pragma once

#include <string>
#include <vector>

namespace resetwatch::app {

/**
 * @brief Parsed command-line options.
 */
struct CommandLineOptions {
    std::string configPath{"resetwatch.json"}; ///< -c / --config
    bool discover{false};                      ///< -d / --discover-and-scan
    bool resetCheck{false};                    ///< -r / --reset-check
    bool checkOnce{false};                     ///< -o / --check-once
    bool initConfig{false};                    ///< --init-config
    bool verbose{false};                       ///< -v / --verbose
    bool help{false};                          ///< -h / --help
    std::vector<std::string> errors;           ///< Unknown or incomplete options

    /**
     * @brief True if at least one command was requested.
     */
    [[nodiscard]] bool hasCommand() const {
        return discover || resetCheck || checkOnce || initConfig;
    }
};

/**
 * @brief Parses arguments, not including the program name.
 * @param args Arguments in order.
 * @return Options; problems are collected in CommandLineOptions::errors.
 */
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

/**
 * @brief Usage text printed for --help and on argument errors.
 * @param program Program name shown in the first line.
 */
std::string usageText(const std::string& program);

} // namespace resetwatch::app
