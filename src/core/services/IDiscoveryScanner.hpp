/**
 * @file IDiscoveryScanner.hpp
 * @brief Interface for the external network discovery utility.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace resetwatch::core {

/**
 * @brief Finds live hosts and their open ports on a reference subnet.
 *
 * Used only by the discovery phase that builds the inventory. Both calls are
 * bounded by the scanner's own timeout and report failure as an empty
 * result rather than by throwing.
 */
class IDiscoveryScanner {
public:
    virtual ~IDiscoveryScanner() = default;

    /**
     * @brief Lists hosts on a subnet that answer on any discovery port.
     * @param subnet Subnet or address range (e.g. "10.5.1.0/24").
     * @param ports Discovery ports.
     * @return Responsive host addresses, empty on timeout or failure.
     */
    virtual std::vector<std::string> scanSubnet(const std::string& subnet,
                                                const std::vector<uint16_t>& ports) = 0;

    /**
     * @brief Finds the open ports of each host.
     * @param hosts Host addresses to scan.
     * @param ports Ports to check; empty means the scanner's default top ports.
     * @return Map from host to its sorted open ports. Hosts with no open port
     *         or whose scan failed are absent.
     */
    virtual std::map<std::string, std::vector<uint16_t>> scanHosts(
        const std::vector<std::string>& hosts, const std::vector<uint16_t>& ports) = 0;
};

} // namespace resetwatch::core
