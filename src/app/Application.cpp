#include "app/Application.hpp"

#include "app/DiscoveryJob.hpp"
#include "infrastructure/network/RustScanDiscovery.hpp"
#include "infrastructure/network/TcpReachabilityProbe.hpp"
#include "infrastructure/output/ConsoleStatusListener.hpp"
#include "monitor/DownHostRegistry.hpp"
#include "monitor/MonitorSupervisor.hpp"
#include "monitor/StopSignal.hpp"
#include "monitor/TemplateMonitor.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <future>

namespace resetwatch::app {

namespace {

constexpr const char* kVersion = "1.0.0";

std::string joinProblems(const std::vector<std::string>& problems) {
    std::string joined;
    for (const auto& problem : problems) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += problem;
    }
    return joined;
}

} // namespace

Application::Application(CommandLineOptions options) : options_(std::move(options)) {
    initializeLogging(options_.verbose ? spdlog::level::debug : spdlog::level::info, {});
    config_ = std::make_unique<infra::ConfigManager>(options_.configPath);
}

Application::~Application() {
    if (asioContext_) {
        asioContext_->stop();
    }
}

void Application::initializeLogging(spdlog::level::level_enum level, const std::string& logFile) {
    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    consoleSink->set_level(level);

    std::vector<spdlog::sink_ptr> sinks{consoleSink};
    if (!logFile.empty()) {
        auto fileSink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 5 * 1024 * 1024, 3);
        fileSink->set_level(spdlog::level::debug);
        sinks.push_back(fileSink);
    }

    auto logger = std::make_shared<spdlog::logger>("resetwatch", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    spdlog::set_default_logger(logger);
}

monitor::MonitorSettings Application::makeSettings(const infra::AppConfig& config) {
    monitor::MonitorSettings settings;
    settings.teams = core::TeamRange{config.teamStart, config.teamEnd};
    settings.probeTimeout = std::chrono::milliseconds(config.probeTimeoutMs);
    settings.cyclePause = std::chrono::milliseconds(config.cyclePauseMs);
    settings.errorBackoff = std::chrono::milliseconds(config.errorBackoffMs);
    settings.reportInterval = std::chrono::seconds(config.reportIntervalSeconds);
    settings.pollInterval = std::chrono::seconds(config.pollIntervalSeconds);
    settings.joinTimeout = std::chrono::seconds(config.joinTimeoutSeconds);
    return settings;
}

int Application::run() {
    if (options_.initConfig) {
        return initConfig();
    }

    if (!loadConfig()) {
        return 1;
    }

    spdlog::info("ResetWatch {} (teams {}-{}, pattern {})", kVersion, config_->config().teamStart,
                 config_->config().teamEnd, config_->config().hostPattern);

    if (options_.discover && !discover()) {
        return 1;
    }
    if (options_.resetCheck) {
        return resetCheck();
    }
    if (options_.checkOnce) {
        return checkOnce();
    }
    return 0;
}

int Application::initConfig() {
    if (std::filesystem::exists(config_->configPath())) {
        spdlog::error("{} already exists, not overwriting", config_->configPath().string());
        return 1;
    }
    if (!config_->save()) {
        return 1;
    }
    spdlog::info("Wrote default configuration to {}", config_->configPath().string());
    return 0;
}

bool Application::loadConfig() {
    if (!config_->load()) {
        return false;
    }

    auto problems = config_->validate();
    if (!problems.empty()) {
        spdlog::error("Invalid configuration: {}", joinProblems(problems));
        return false;
    }

    const auto& cfg = config_->config();
    auto level = options_.verbose ? spdlog::level::debug : spdlog::level::from_str(cfg.logLevel);
    initializeLogging(level, cfg.logFile);
    if (!cfg.logFile.empty()) {
        spdlog::info("Log file: {}", cfg.logFile);
    }

    store_ = std::make_unique<infra::InventoryStore>(cfg.hostsFile, cfg.portsFile, cfg.placeholder);
    return true;
}

infra::AsioContext& Application::asioContext() {
    if (!asioContext_) {
        asioContext_ = std::make_unique<infra::AsioContext>(
            static_cast<std::size_t>(config_->config().ioThreads));
        asioContext_->start();
    }
    return *asioContext_;
}

bool Application::discover() {
    const auto& cfg = config_->config();
    infra::RustScanDiscovery scanner(cfg.scannerPath, std::chrono::seconds(cfg.scanTimeoutSeconds));
    DiscoveryJob job(cfg, scanner, *store_);

    if (!job.run()) {
        spdlog::error("Discovery and scan failed");
        return false;
    }
    return true;
}

std::optional<core::HostInventory> Application::loadInventory() const {
    auto inventory = store_->loadPorts();
    if (!inventory) {
        spdlog::error("No usable inventory in {} (run --discover-and-scan first)",
                      store_->portsFile().string());
        return std::nullopt;
    }
    if (inventory->empty()) {
        spdlog::error("{} lists no host templates", store_->portsFile().string());
        return std::nullopt;
    }

    if (std::filesystem::exists(store_->hostsFile())) {
        auto unmonitored = store_->templatesWithoutPorts(*inventory);
        if (!unmonitored) {
            spdlog::warn("Skipping consistency check against {}", store_->hostsFile().string());
        } else {
            for (const auto& hostTemplate : *unmonitored) {
                spdlog::warn("{} is listed in {} but has no open ports in {}; not monitored",
                             hostTemplate.pattern(), store_->hostsFile().string(),
                             store_->portsFile().string());
            }
        }
    }
    return inventory;
}

int Application::resetCheck() {
    auto inventory = loadInventory();
    if (!inventory) {
        return 1;
    }

    auto& io = asioContext();
    infra::TcpReachabilityProbe probe(io);
    infra::ConsoleStatusListener listener;
    monitor::MonitorSupervisor supervisor(std::move(*inventory), makeSettings(config_->config()),
                                          probe, listener);

    asio::signal_set signals(io.getContext(), SIGINT, SIGTERM);
    signals.async_wait([&supervisor](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, stopping", signalNumber);
        supervisor.requestStop("User interruption");
    });

    auto summary = supervisor.run();

    asio::error_code ignored;
    signals.cancel(ignored);

    spdlog::info("Monitoring stopped: {} ({} threads joined, {} timed out)", summary.reason,
                 summary.unitsJoined, summary.unitsTimedOut);
    for (const auto& anomaly : summary.anomalies) {
        spdlog::warn("  {}", anomaly);
    }
    return summary.anomalies.empty() ? 0 : 1;
}

int Application::checkOnce() {
    auto inventory = loadInventory();
    if (!inventory) {
        return 1;
    }

    auto settings = makeSettings(config_->config());
    auto& io = asioContext();
    infra::TcpReachabilityProbe probe(io);
    infra::ConsoleStatusListener listener;
    monitor::StopSignal stop;
    monitor::DownHostRegistry registry(
        [&listener](const core::StatusEvent& event) { listener.onStatusEvent(event); });

    asio::signal_set signals(io.getContext(), SIGINT, SIGTERM);
    signals.async_wait([&stop](const asio::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, abandoning check", signalNumber);
        stop.set();
    });

    std::vector<std::unique_ptr<monitor::TemplateMonitor>> monitors;
    for (const auto& entry : inventory->entries()) {
        monitors.push_back(std::make_unique<monitor::TemplateMonitor>(
            entry.hostTemplate, entry.ports, settings, probe, registry, stop));
    }

    spdlog::info("Checking {} templates across {} teams", monitors.size(),
                 settings.teams.count());

    std::vector<std::future<bool>> cycles;
    for (auto& templateMonitor : monitors) {
        cycles.push_back(std::async(std::launch::async, [&templateMonitor]() {
            return templateMonitor->runCycle();
        }));
    }

    bool complete = true;
    for (auto& cycle : cycles) {
        complete = cycle.get() && complete;
    }

    asio::error_code ignored;
    signals.cancel(ignored);

    auto report = core::StatusReport::capture(core::ReportKind::Final, registry.snapshot());
    listener.onStatusReport(report);

    if (!complete) {
        spdlog::warn("Check interrupted before every team was probed");
        return 1;
    }
    if (!report.allHostsUp()) {
        return kExitHostsDown;
    }

    spdlog::info("All hosts are up");
    return 0;
}

} // namespace resetwatch::app
