#pragma once

#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include "types.hpp"

namespace courier::infra::io {

/**
 * @brief Pool of `io_context` instances, each pinned to one thread.
 *
 * Transfers are assigned to contexts round-robin; a single transfer's
 * coroutine always stays on the context it started on, so its socket state
 * needs no locking.
 */
class IoContextPool {
   public:
    // @throws std::invalid_argument when `pool_size` is 0.
    explicit IoContextPool(std::size_t pool_size);

    // Stops and joins all threads.
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void Run();

    // Releases the work guards and stops every context.
    void Stop();

    asio::io_context& GetIoContext();

    std::size_t Size() const noexcept { return io_contexts_.size(); }

    // True between Run() and Stop(); work handed to a pool that is not
    // running is never executed.
    bool Running() const noexcept { return running_.load(); }

   private:
    std::vector<std::shared_ptr<asio::io_context>> io_contexts_;

    using work_guard_type = asio::executor_work_guard<asio::io_context::executor_type>;
    std::vector<work_guard_type> work_guards_;

    std::vector<std::jthread> threads_;

    std::atomic<std::size_t> next_io_context_{0};
    std::atomic<bool> running_{false};
};

}  // namespace courier::infra::io
