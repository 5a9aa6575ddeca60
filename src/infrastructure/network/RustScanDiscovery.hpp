#pragma once

#include "core/services/IDiscoveryScanner.hpp"

#include <chrono>
#include <string>

namespace resetwatch::infra {

/**
 * @brief Discovery scanner that shells out to RustScan in greppable mode.
 *
 * Runs "<scanner> -a <target> -g -p <ports>" and parses lines of the form
 * "10.5.1.3 -> [22,80]". Each invocation is bounded by the configured
 * timeout; failures and timeouts are logged and produce empty results.
 * Implements core::IDiscoveryScanner.
 */
class RustScanDiscovery : public core::IDiscoveryScanner {
public:
    /**
     * @brief Constructs a discovery scanner.
     * @param scannerPath Path to the RustScan binary.
     * @param timeout Limit for each scanner invocation.
     */
    RustScanDiscovery(std::string scannerPath, std::chrono::milliseconds timeout);

    std::vector<std::string> scanSubnet(const std::string& subnet,
                                        const std::vector<uint16_t>& ports) override;

    std::map<std::string, std::vector<uint16_t>> scanHosts(
        const std::vector<std::string>& hosts, const std::vector<uint16_t>& ports) override;

    /**
     * @brief Extracts the host of every "host -> [ports]" line.
     * @param output Greppable scanner output.
     * @return Hosts in output order.
     */
    static std::vector<std::string> parseHosts(const std::string& output);

    /**
     * @brief Extracts host-to-ports mappings from greppable output.
     *
     * Lines whose port list is empty or not numeric are skipped.
     *
     * @param output Greppable scanner output.
     * @return Map from host to sorted ports.
     */
    static std::map<std::string, std::vector<uint16_t>> parseHostPorts(const std::string& output);

    /**
     * @brief Joins ports with commas for the -p option.
     */
    static std::string joinPorts(const std::vector<uint16_t>& ports);

private:
    std::string scannerPath_;
    std::chrono::milliseconds timeout_;
};

} // namespace resetwatch::infra
