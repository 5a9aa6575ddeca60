#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace resetwatch::infra {

AsioContext::AsioContext(std::size_t threadCount)
    : threadCount_(threadCount > 0 ? threadCount : 1) {}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            try {
                ioContext_.run();
            } catch (const std::exception& e) {
                spdlog::error("I/O thread {} terminated: {}", i, e.what());
            }
        });
    }

    spdlog::debug("I/O context started with {} threads", threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::debug("I/O context stopped");
}

} // namespace resetwatch::infra
