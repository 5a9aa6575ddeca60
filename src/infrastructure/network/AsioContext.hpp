#pragma once

#include <asio.hpp>
#include <atomic>
#include <optional>
#include <thread>
#include <vector>

namespace resetwatch::infra {

/**
 * @brief Asio I/O context driven by a small pool of worker threads.
 *
 * Carries the asynchronous TCP connects issued by the reachability probe and
 * the operator signal handler. A work guard keeps the context alive while no
 * operation is pending, until stop() is called.
 *
 * @note Non-copyable. The application owns one instance and passes it down.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext.
     * @param threadCount Number of I/O threads; zero is raised to one.
     */
    explicit AsioContext(std::size_t threadCount);

    /**
     * @brief Stops the context and joins the I/O threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Spawns the I/O threads. No effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the threads.
     *
     * Pending handlers are abandoned; the context can be started again.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] std::size_t threadCount() const { return threadCount_; }

    asio::io_context& getContext() { return ioContext_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::size_t threadCount_;
};

} // namespace resetwatch::infra
