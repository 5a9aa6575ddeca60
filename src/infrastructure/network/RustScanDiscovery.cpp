#include "infrastructure/network/RustScanDiscovery.hpp"

#include "infrastructure/process/ProcessRunner.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>

namespace resetwatch::infra {

namespace {

constexpr const char* kArrow = "->";

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string describe(const std::string& binary, const std::vector<std::string>& args) {
    std::string command = binary;
    for (const auto& arg : args) {
        command += ' ';
        command += arg;
    }
    return command;
}

} // namespace

RustScanDiscovery::RustScanDiscovery(std::string scannerPath, std::chrono::milliseconds timeout)
    : scannerPath_(std::move(scannerPath)), timeout_(timeout) {}

std::string RustScanDiscovery::joinPorts(const std::vector<uint16_t>& ports) {
    std::string joined;
    for (uint16_t port : ports) {
        if (!joined.empty()) {
            joined += ',';
        }
        joined += std::to_string(port);
    }
    return joined;
}

std::vector<std::string> RustScanDiscovery::parseHosts(const std::string& output) {
    std::vector<std::string> hosts;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        auto arrow = line.find(kArrow);
        if (arrow == std::string::npos) {
            continue;
        }
        auto host = trim(line.substr(0, arrow));
        if (!host.empty()) {
            hosts.push_back(host);
        }
    }
    return hosts;
}

std::map<std::string, std::vector<uint16_t>> RustScanDiscovery::parseHostPorts(
    const std::string& output) {
    std::map<std::string, std::vector<uint16_t>> results;
    std::istringstream stream(output);
    std::string line;

    while (std::getline(stream, line)) {
        auto arrow = line.find(kArrow);
        if (arrow == std::string::npos) {
            continue;
        }

        auto host = trim(line.substr(0, arrow));
        auto portSection = trim(line.substr(arrow + 2));
        if (host.empty() || portSection.size() < 2 || portSection.front() != '[' ||
            portSection.back() != ']') {
            continue;
        }

        auto portList = portSection.substr(1, portSection.size() - 2);
        if (trim(portList).empty()) {
            continue;
        }

        std::vector<uint16_t> ports;
        std::istringstream portStream(portList);
        std::string item;
        bool valid = true;
        while (std::getline(portStream, item, ',')) {
            try {
                std::size_t consumed = 0;
                auto text = trim(item);
                int value = std::stoi(text, &consumed);
                if (consumed != text.size() || value < 1 || value > 65535) {
                    valid = false;
                    break;
                }
                ports.push_back(static_cast<uint16_t>(value));
            } catch (const std::exception&) {
                valid = false;
                break;
            }
        }

        if (!valid) {
            spdlog::debug("Skipping malformed scanner line: {}", line);
            continue;
        }

        std::sort(ports.begin(), ports.end());
        ports.erase(std::unique(ports.begin(), ports.end()), ports.end());
        results[host] = std::move(ports);
    }
    return results;
}

std::vector<std::string> RustScanDiscovery::scanSubnet(const std::string& subnet,
                                                       const std::vector<uint16_t>& ports) {
    std::vector<std::string> args{"-a", subnet, "-g"};
    if (!ports.empty()) {
        args.push_back("-p");
        args.push_back(joinPorts(ports));
    }

    spdlog::info("Running: {}", describe(scannerPath_, args));
    auto result = ProcessRunner::run(scannerPath_, args, timeout_);

    if (result.timedOut) {
        spdlog::error("Scan of {} timed out", subnet);
        return {};
    }
    if (!result.succeeded()) {
        spdlog::error("Scan of {} failed (exit {}): {}", subnet, result.exitCode,
                      trim(result.errors));
        return {};
    }

    auto hosts = parseHosts(result.output);
    spdlog::info("Discovered {} hosts on {}", hosts.size(), subnet);
    return hosts;
}

std::map<std::string, std::vector<uint16_t>> RustScanDiscovery::scanHosts(
    const std::vector<std::string>& hosts, const std::vector<uint16_t>& ports) {
    std::map<std::string, std::vector<uint16_t>> results;

    for (const auto& host : hosts) {
        std::vector<std::string> args{"-a", host, "-g"};
        if (ports.empty()) {
            args.push_back("--top");
        } else {
            args.push_back("-p");
            args.push_back(joinPorts(ports));
        }

        spdlog::info("Running: {}", describe(scannerPath_, args));
        auto result = ProcessRunner::run(scannerPath_, args, timeout_);

        if (result.timedOut) {
            spdlog::error("Scan of {} timed out", host);
            continue;
        }
        if (!result.succeeded()) {
            spdlog::error("Scan of {} failed (exit {}): {}", host, result.exitCode,
                          trim(result.errors));
            continue;
        }

        for (auto& [scannedHost, openPorts] : parseHostPorts(result.output)) {
            results[scannedHost] = std::move(openPorts);
        }
    }

    spdlog::info("Found open ports on {} of {} hosts", results.size(), hosts.size());
    return results;
}

} // namespace resetwatch::infra
