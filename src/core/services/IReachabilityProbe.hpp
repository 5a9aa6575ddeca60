/**
 * @file IReachabilityProbe.hpp
 * @brief Interface for the single-host reachability check.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace resetwatch::core {

/**
 * @brief Answers whether a host accepts a connection on any candidate port.
 *
 * Implementations must be safe to call concurrently from several monitor
 * threads and must return within roughly ports.size() * timeout.
 */
class IReachabilityProbe {
public:
    virtual ~IReachabilityProbe() = default;

    /**
     * @brief Tries each port in order until one accepts a connection.
     * @param host Host name or address.
     * @param ports Candidate ports, tried in the given order.
     * @param timeout Per-port connection timeout.
     * @return True on the first successful connection, false if every port
     *         failed or timed out.
     * @throws std::invalid_argument if @p ports is empty or @p timeout is not
     *         positive. Ordinary connection failures never throw.
     */
    virtual bool probe(const std::string& host, const std::vector<uint16_t>& ports,
                       std::chrono::milliseconds timeout) = 0;
};

} // namespace resetwatch::core
