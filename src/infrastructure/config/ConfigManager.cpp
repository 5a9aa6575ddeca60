#include "infrastructure/config/ConfigManager.hpp"

#include "core/types/HostTemplate.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace resetwatch::infra {

namespace {

// Element-wise read: a plain get<uint16_t> would wrap 70000 to 4464.
std::vector<uint16_t> readPortList(const nlohmann::json& section, const char* key,
                                   const char* name, const std::vector<uint16_t>& fallback) {
    if (!section.contains(key)) {
        return fallback;
    }

    const auto& list = section[key];
    if (!list.is_array()) {
        throw std::invalid_argument(fmt::format("{} must be an array of ports", name));
    }

    std::vector<uint16_t> ports;
    for (const auto& value : list) {
        if (!value.is_number_integer()) {
            throw std::invalid_argument(fmt::format("{} contains a non-integer port", name));
        }
        auto port = value.get<int64_t>();
        if (port < 1 || port > 65535) {
            throw std::out_of_range(fmt::format("{}: port {} is out of range", name, port));
        }
        ports.push_back(static_cast<uint16_t>(port));
    }
    return ports;
}

} // namespace

ConfigManager::ConfigManager(std::filesystem::path configPath)
    : configPath_(std::move(configPath)) {}

bool ConfigManager::load() {
    if (!std::filesystem::exists(configPath_)) {
        spdlog::error("Config file not found: {} (use --init-config to create one)",
                      configPath_.string());
        return false;
    }

    try {
        std::ifstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file: {}", configPath_.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        fromJson(j);

        spdlog::info("Loaded configuration from {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config: {}", e.what());
        return false;
    }
}

bool ConfigManager::save() const {
    try {
        auto j = toJson();

        std::ofstream file(configPath_);
        if (!file) {
            spdlog::error("Failed to open config file for writing: {}", configPath_.string());
            return false;
        }

        file << j.dump(2) << '\n';
        spdlog::debug("Saved configuration to {}", configPath_.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config: {}", e.what());
        return false;
    }
}

std::vector<std::string> ConfigManager::validate() const {
    std::vector<std::string> problems;
    const auto& c = config_;

    if (c.teamStart > c.teamEnd) {
        problems.push_back(
            fmt::format("hosts.teams.start ({}) is greater than hosts.teams.end ({})",
                        c.teamStart, c.teamEnd));
    }
    if (c.teamStart < 0) {
        problems.push_back(fmt::format("hosts.teams.start ({}) is negative", c.teamStart));
    }
    if (c.referenceTeam < 0) {
        problems.push_back(
            fmt::format("hosts.reference_team ({}) is negative", c.referenceTeam));
    }
    if (c.placeholder.empty()) {
        problems.emplace_back("hosts.placeholder is empty");
    }
    if (c.hostPattern.empty()) {
        problems.emplace_back("hosts.host_pattern is empty");
    } else if (!c.placeholder.empty() &&
               !core::HostTemplate::parse(c.hostPattern, c.placeholder)) {
        problems.push_back(fmt::format("hosts.host_pattern \"{}\" must contain {} exactly once",
                                       c.hostPattern,
                                       core::HostTemplate::tokenFor(c.placeholder)));
    }

    auto requirePositive = [&problems](const char* key, int value) {
        if (value <= 0) {
            problems.push_back(fmt::format("{} must be positive (got {})", key, value));
        }
    };
    auto requireNonNegative = [&problems](const char* key, int value) {
        if (value < 0) {
            problems.push_back(fmt::format("{} must not be negative (got {})", key, value));
        }
    };

    requirePositive("scan.timeout_seconds", c.scanTimeoutSeconds);
    requirePositive("port_checker.timeout_ms", c.probeTimeoutMs);
    requirePositive("monitor.report_interval_seconds", c.reportIntervalSeconds);
    requirePositive("monitor.poll_interval_seconds", c.pollIntervalSeconds);
    requirePositive("monitor.join_timeout_seconds", c.joinTimeoutSeconds);
    requirePositive("monitor.io_threads", c.ioThreads);
    requireNonNegative("monitor.cycle_pause_ms", c.cyclePauseMs);
    requireNonNegative("monitor.error_backoff_ms", c.errorBackoffMs);

    for (uint16_t port : c.discoveryPorts) {
        if (port == 0) {
            problems.emplace_back("scan.discovery_ports contains port 0");
            break;
        }
    }
    for (uint16_t port : c.scanPorts) {
        if (port == 0) {
            problems.emplace_back("scan.ports contains port 0");
            break;
        }
    }

    if (spdlog::level::from_str(c.logLevel) == spdlog::level::off && c.logLevel != "off") {
        problems.push_back(fmt::format("logging.level \"{}\" is not a known level", c.logLevel));
    }

    return problems;
}

nlohmann::json ConfigManager::toJson() const {
    nlohmann::json j;

    // Hosts
    j["hosts"]["host_pattern"] = config_.hostPattern;
    j["hosts"]["teams"]["start"] = config_.teamStart;
    j["hosts"]["teams"]["end"] = config_.teamEnd;
    j["hosts"]["reference_team"] = config_.referenceTeam;
    j["hosts"]["placeholder"] = config_.placeholder;
    j["hosts"]["file"] = config_.hostsFile;

    // Discovery scanner
    j["scan"]["discovery_ports"] = config_.discoveryPorts;
    j["scan"]["ports"] = config_.scanPorts;
    j["scan"]["file"] = config_.portsFile;
    j["scan"]["scanner_path"] = config_.scannerPath;
    j["scan"]["timeout_seconds"] = config_.scanTimeoutSeconds;

    // Port checker
    j["port_checker"]["timeout_ms"] = config_.probeTimeoutMs;

    // Monitor
    j["monitor"]["report_interval_seconds"] = config_.reportIntervalSeconds;
    j["monitor"]["poll_interval_seconds"] = config_.pollIntervalSeconds;
    j["monitor"]["cycle_pause_ms"] = config_.cyclePauseMs;
    j["monitor"]["error_backoff_ms"] = config_.errorBackoffMs;
    j["monitor"]["join_timeout_seconds"] = config_.joinTimeoutSeconds;
    j["monitor"]["io_threads"] = config_.ioThreads;

    // Logging
    j["logging"]["level"] = config_.logLevel;
    j["logging"]["file"] = config_.logFile;

    return j;
}

void ConfigManager::fromJson(const nlohmann::json& j) {
    const AppConfig defaults;

    // Hosts
    if (j.contains("hosts")) {
        const auto& h = j["hosts"];
        config_.hostPattern = h.value("host_pattern", defaults.hostPattern);
        if (h.contains("teams")) {
            const auto& t = h["teams"];
            config_.teamStart = t.value("start", defaults.teamStart);
            config_.teamEnd = t.value("end", defaults.teamEnd);
        }
        config_.referenceTeam = h.value("reference_team", defaults.referenceTeam);
        config_.placeholder = h.value("placeholder", defaults.placeholder);
        config_.hostsFile = h.value("file", defaults.hostsFile);
    }

    // Discovery scanner
    if (j.contains("scan")) {
        const auto& s = j["scan"];
        config_.discoveryPorts = readPortList(s, "discovery_ports", "scan.discovery_ports",
                                              defaults.discoveryPorts);
        config_.scanPorts = readPortList(s, "ports", "scan.ports", defaults.scanPorts);
        config_.portsFile = s.value("file", defaults.portsFile);
        config_.scannerPath = s.value("scanner_path", defaults.scannerPath);
        config_.scanTimeoutSeconds = s.value("timeout_seconds", defaults.scanTimeoutSeconds);
    }

    // Port checker
    if (j.contains("port_checker")) {
        const auto& p = j["port_checker"];
        config_.probeTimeoutMs = p.value("timeout_ms", defaults.probeTimeoutMs);
    }

    // Monitor
    if (j.contains("monitor")) {
        const auto& m = j["monitor"];
        config_.reportIntervalSeconds =
            m.value("report_interval_seconds", defaults.reportIntervalSeconds);
        config_.pollIntervalSeconds =
            m.value("poll_interval_seconds", defaults.pollIntervalSeconds);
        config_.cyclePauseMs = m.value("cycle_pause_ms", defaults.cyclePauseMs);
        config_.errorBackoffMs = m.value("error_backoff_ms", defaults.errorBackoffMs);
        config_.joinTimeoutSeconds = m.value("join_timeout_seconds", defaults.joinTimeoutSeconds);
        config_.ioThreads = m.value("io_threads", defaults.ioThreads);
    }

    // Logging
    if (j.contains("logging")) {
        const auto& l = j["logging"];
        config_.logLevel = l.value("level", defaults.logLevel);
        config_.logFile = l.value("file", defaults.logFile);
    }
}

} // namespace resetwatch::infra
