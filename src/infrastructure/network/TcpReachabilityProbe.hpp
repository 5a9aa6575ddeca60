#pragma once

#include "core/services/IReachabilityProbe.hpp"
#include "infrastructure/network/AsioContext.hpp"

#include <asio.hpp>
#include <chrono>
#include <future>
#include <string>

namespace resetwatch::infra {

/**
 * @brief TCP connect probe built on Asio.
 *
 * Each port is tried with an asynchronous resolve + connect raced against a
 * steady_timer on the shared AsioContext; the calling monitor thread blocks
 * on the resulting future. Ports are tried in order and the first accepted
 * connection short-circuits the rest. Implements core::IReachabilityProbe.
 */
class TcpReachabilityProbe : public core::IReachabilityProbe {
public:
    /**
     * @brief Constructs a probe.
     * @param context Running AsioContext that executes the connects.
     */
    explicit TcpReachabilityProbe(AsioContext& context);

    bool probe(const std::string& host, const std::vector<uint16_t>& ports,
               std::chrono::milliseconds timeout) override;

    /**
     * @brief Starts a single timed connect attempt.
     * @param host Host name or address.
     * @param port TCP port.
     * @param timeout Time allowed for resolution and connection together.
     * @return Future that becomes true if the connection was accepted.
     */
    std::future<bool> connectAsync(const std::string& host, uint16_t port,
                                   std::chrono::milliseconds timeout);

private:
    AsioContext& context_;
};

} // namespace resetwatch::infra
