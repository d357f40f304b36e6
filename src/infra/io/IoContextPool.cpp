#include "IoContextPool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace courier::infra::io {

IoContextPool::IoContextPool(std::size_t pool_size) {
    if (pool_size == 0) {
        throw std::invalid_argument("IoContextPool size must be > 0");
    }

    for (std::size_t i = 0; i < pool_size; ++i) {
        auto ioc = std::make_shared<asio::io_context>(1);
        io_contexts_.push_back(ioc);
        work_guards_.emplace_back(asio::make_work_guard(*ioc));
    }
}

IoContextPool::~IoContextPool() {
    Stop();
    threads_.clear();
}

void IoContextPool::Run() {
    if (!threads_.empty()) {
        return;
    }

    spdlog::info("Starting transport I/O pool with {} thread(s).", io_contexts_.size());
    running_ = true;

    for (std::size_t i = 0; i < io_contexts_.size(); ++i) {
        threads_.emplace_back([ioc = io_contexts_[i], i]() {
            // A handler that throws must not take the other transfers of this
            // context down with it, so the loop resumes until Stop().
            for (;;) {
                try {
                    ioc->run();
                    return;
                } catch (const std::exception& e) {
                    spdlog::critical("[io {}] handler threw, resuming: {}", i, e.what());
                } catch (...) {
                    spdlog::critical("[io {}] handler threw a non-standard exception, resuming", i);
                }
            }
        });
    }
}

void IoContextPool::Stop() {
    running_ = false;
    work_guards_.clear();

    for (const auto& ioc : io_contexts_) {
        if (ioc && !ioc->stopped()) {
            ioc->stop();
        }
    }
}

asio::io_context& IoContextPool::GetIoContext() {
    std::size_t idx =
        next_io_context_.fetch_add(1, std::memory_order_relaxed) % io_contexts_.size();
    return *io_contexts_[idx];
}

}  // namespace courier::infra::io
