#include "infrastructure/network/TcpReachabilityProbe.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>

namespace resetwatch::infra {

namespace {

// Extra time a caller waits for a completion the I/O threads should already
// have delivered through the timer.
constexpr auto kCompletionGrace = std::chrono::milliseconds(500);

// All handlers run on the strand, so `completed` needs no further locking.
struct ConnectAttempt {
    explicit ConnectAttempt(asio::io_context& io)
        : strand(asio::make_strand(io)), resolver(strand), socket(strand), timer(strand) {}

    void finish(bool reachable) {
        if (completed) {
            return;
        }
        completed = true;

        timer.cancel();
        resolver.cancel();
        asio::error_code ignored;
        socket.close(ignored);

        promise.set_value(reachable);
    }

    asio::strand<asio::io_context::executor_type> strand;
    asio::ip::tcp::resolver resolver;
    asio::ip::tcp::socket socket;
    asio::steady_timer timer;
    std::promise<bool> promise;
    bool completed{false};
};

} // namespace

TcpReachabilityProbe::TcpReachabilityProbe(AsioContext& context) : context_(context) {}

bool TcpReachabilityProbe::probe(const std::string& host, const std::vector<uint16_t>& ports,
                                 std::chrono::milliseconds timeout) {
    if (ports.empty()) {
        throw std::invalid_argument("no candidate ports given for " + host);
    }
    if (timeout.count() <= 0) {
        throw std::invalid_argument("probe timeout must be positive");
    }
    if (!context_.isRunning()) {
        throw std::logic_error("I/O context is not running");
    }

    for (uint16_t port : ports) {
        auto result = connectAsync(host, port, timeout);
        if (result.wait_for(timeout + kCompletionGrace) != std::future_status::ready) {
            spdlog::warn("Connect to {}:{} never completed", host, port);
            continue;
        }

        if (result.get()) {
            spdlog::trace("{}:{} accepted a connection", host, port);
            return true;
        }
    }

    spdlog::trace("{} refused or ignored {} ports", host, ports.size());
    return false;
}

std::future<bool> TcpReachabilityProbe::connectAsync(const std::string& host, uint16_t port,
                                                     std::chrono::milliseconds timeout) {
    auto attempt = std::make_shared<ConnectAttempt>(context_.getContext());
    auto future = attempt->promise.get_future();

    asio::dispatch(attempt->strand, [attempt, host, port, timeout]() {
        attempt->timer.expires_after(timeout);
        attempt->timer.async_wait([attempt](const asio::error_code& ec) {
            if (ec) {
                return; // Cancelled by a completed connect
            }
            attempt->finish(false);
        });

        attempt->resolver.async_resolve(
            host, std::to_string(port),
            [attempt](const asio::error_code& ec,
                      asio::ip::tcp::resolver::results_type endpoints) {
                if (attempt->completed) {
                    return;
                }
                if (ec) {
                    attempt->finish(false);
                    return;
                }

                asio::async_connect(
                    attempt->socket, endpoints,
                    [attempt](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
                        if (attempt->completed) {
                            return; // Timed out first
                        }
                        attempt->finish(!ec);
                    });
            });
    });

    return future;
}

} // namespace resetwatch::infra
