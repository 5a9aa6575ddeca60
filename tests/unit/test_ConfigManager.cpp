#include <catch2/catch_test_macros.hpp>

#include "infrastructure/config/ConfigManager.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

using namespace resetwatch::infra;

namespace {

class TestConfigDir {
public:
    TestConfigDir()
        : configDir_(std::filesystem::temp_directory_path() / "resetwatch_config_test") {
        cleanup();
        std::filesystem::create_directories(configDir_);
    }

    ~TestConfigDir() { cleanup(); }

    std::filesystem::path file(const std::string& name) const { return configDir_ / name; }

private:
    void cleanup() {
        if (std::filesystem::exists(configDir_)) {
            std::filesystem::remove_all(configDir_);
        }
    }

    std::filesystem::path configDir_;
};

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

TEST_CASE("AppConfig defaults", "[ConfigManager]") {
    AppConfig config;

    REQUIRE(config.hostPattern == "10.{team}.1.0/24");
    REQUIRE(config.teamStart == 1);
    REQUIRE(config.teamEnd == 1);
    REQUIRE(config.referenceTeam == 1);
    REQUIRE(config.placeholder == "team");
    REQUIRE(config.hostsFile == "hosts.txt");
    REQUIRE(config.discoveryPorts == std::vector<uint16_t>{22, 80, 443, 3389});
    REQUIRE(config.scanPorts.empty());
    REQUIRE(config.portsFile == "ports.json");
    REQUIRE(config.scannerPath == "./scanning/rustscan-linux");
    REQUIRE(config.scanTimeoutSeconds == 300);
    REQUIRE(config.probeTimeoutMs == 3000);
    REQUIRE(config.reportIntervalSeconds == 30);
    REQUIRE(config.pollIntervalSeconds == 30);
    REQUIRE(config.cyclePauseMs == 100);
    REQUIRE(config.errorBackoffMs == 1000);
    REQUIRE(config.joinTimeoutSeconds == 5);
    REQUIRE(config.ioThreads == 4);
    REQUIRE(config.logLevel == "info");
    REQUIRE(config.logFile.empty());
}

TEST_CASE("ConfigManager load and save", "[ConfigManager]") {
    TestConfigDir testDir;

    SECTION("Missing file fails to load") {
        ConfigManager manager(testDir.file("missing.json"));
        REQUIRE_FALSE(manager.load());
    }

    SECTION("Malformed JSON fails to load") {
        writeFile(testDir.file("broken.json"), "{ not json");
        ConfigManager manager(testDir.file("broken.json"));
        REQUIRE_FALSE(manager.load());
    }

    SECTION("Saved values load back") {
        ConfigManager writer(testDir.file("config.json"));
        writer.config().hostPattern = "172.16.{team}.0/24";
        writer.config().teamStart = 2;
        writer.config().teamEnd = 12;
        writer.config().scanPorts = {22, 8080};
        writer.config().probeTimeoutMs = 1500;
        writer.config().logFile = "resetwatch.log";
        REQUIRE(writer.save());

        ConfigManager reader(testDir.file("config.json"));
        REQUIRE(reader.load());
        REQUIRE(reader.config().hostPattern == "172.16.{team}.0/24");
        REQUIRE(reader.config().teamStart == 2);
        REQUIRE(reader.config().teamEnd == 12);
        REQUIRE(reader.config().scanPorts == std::vector<uint16_t>{22, 8080});
        REQUIRE(reader.config().probeTimeoutMs == 1500);
        REQUIRE(reader.config().logFile == "resetwatch.log");
    }

    SECTION("Missing keys keep their defaults") {
        writeFile(testDir.file("partial.json"),
                  R"({"hosts": {"teams": {"end": 20}}, "monitor": {"report_interval_seconds": 10}})");
        ConfigManager manager(testDir.file("partial.json"));
        REQUIRE(manager.load());

        REQUIRE(manager.config().teamStart == 1);
        REQUIRE(manager.config().teamEnd == 20);
        REQUIRE(manager.config().reportIntervalSeconds == 10);
        REQUIRE(manager.config().pollIntervalSeconds == 30);
        REQUIRE(manager.config().hostPattern == "10.{team}.1.0/24");
    }

    SECTION("JSON layout uses nested sections") {
        ConfigManager manager(testDir.file("layout.json"));
        auto j = manager.toJson();
        REQUIRE(j["hosts"]["teams"]["start"] == 1);
        REQUIRE(j["scan"]["discovery_ports"].size() == 4);
        REQUIRE(j["port_checker"]["timeout_ms"] == 3000);
        REQUIRE(j["monitor"]["io_threads"] == 4);
        REQUIRE(j["logging"]["level"] == "info");
    }
}

TEST_CASE("ConfigManager port lists", "[ConfigManager]") {
    TestConfigDir testDir;
    ConfigManager manager(testDir.file("resetwatch.json"));

    SECTION("Port out of range") {
        writeFile(testDir.file("resetwatch.json"), R"({"scan": {"discovery_ports": [22, 70000]}})");
        REQUIRE_FALSE(manager.load());
        REQUIRE(manager.config().discoveryPorts == AppConfig{}.discoveryPorts);

        writeFile(testDir.file("resetwatch.json"), R"({"scan": {"ports": [-1]}})");
        REQUIRE_FALSE(manager.load());

        writeFile(testDir.file("resetwatch.json"), R"({"scan": {"ports": [0]}})");
        REQUIRE_FALSE(manager.load());
    }

    SECTION("fromJson reports the offending list") {
        auto j = nlohmann::json::parse(R"({"scan": {"ports": [22, 65536]}})");
        REQUIRE_THROWS_AS(manager.fromJson(j), std::out_of_range);

        j = nlohmann::json::parse(R"({"scan": {"ports": ["ssh"]}})");
        REQUIRE_THROWS_AS(manager.fromJson(j), std::invalid_argument);
    }

    SECTION("Boundary ports load") {
        writeFile(testDir.file("resetwatch.json"), R"({"scan": {"ports": [1, 65535]}})");
        REQUIRE(manager.load());
        REQUIRE(manager.config().scanPorts == std::vector<uint16_t>{1, 65535});
    }
}

TEST_CASE("ConfigManager validation", "[ConfigManager]") {
    ConfigManager manager("unused.json");

    SECTION("Defaults are valid") {
        REQUIRE(manager.validate().empty());
    }

    SECTION("Team start after end") {
        manager.config().teamStart = 5;
        manager.config().teamEnd = 3;
        REQUIRE(manager.validate().size() == 1);
    }

    SECTION("Negative teams") {
        manager.config().teamStart = -1;
        REQUIRE(manager.validate().size() == 1);

        manager.config().teamStart = 1;
        manager.config().referenceTeam = -3;
        REQUIRE(manager.validate().size() == 1);
    }

    SECTION("Team range ending at INT_MAX") {
        manager.config().teamStart = std::numeric_limits<int>::max() - 1;
        manager.config().teamEnd = std::numeric_limits<int>::max();
        REQUIRE(manager.validate().empty());
    }

    SECTION("Empty host pattern") {
        manager.config().hostPattern.clear();
        REQUIRE_FALSE(manager.validate().empty());
    }

    SECTION("Pattern needs exactly one token") {
        manager.config().hostPattern = "10.1.1.0/24";
        REQUIRE(manager.validate().size() == 1);

        manager.config().hostPattern = "10.{team}.{team}.0/24";
        REQUIRE(manager.validate().size() == 1);
    }

    SECTION("Non-positive intervals and timeouts") {
        manager.config().reportIntervalSeconds = 0;
        manager.config().pollIntervalSeconds = -1;
        manager.config().probeTimeoutMs = 0;
        REQUIRE(manager.validate().size() == 3);
    }

    SECTION("Negative pauses") {
        manager.config().cyclePauseMs = 0;
        REQUIRE(manager.validate().empty());
        manager.config().errorBackoffMs = -5;
        REQUIRE(manager.validate().size() == 1);
    }

    SECTION("Unknown log level") {
        manager.config().logLevel = "loud";
        REQUIRE(manager.validate().size() == 1);
        manager.config().logLevel = "debug";
        REQUIRE(manager.validate().empty());
    }
}
