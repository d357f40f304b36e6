#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <utility>

namespace courier::core {

/**
 * @brief Write side of a FutureResult. Settles at most once; later attempts
 * are ignored and reported as `false`.
 *
 * Shared between the transport completion and the cancel path, which may
 * race to settle it.
 */
template <class T>
class PendingResult {
   public:
    PendingResult() : future_(promise_.get_future().share()) {}

    PendingResult(const PendingResult&) = delete;
    PendingResult& operator=(const PendingResult&) = delete;

    template <class... Args>
    bool SetValue(Args&&... value) {
        if (settled_.exchange(true)) return false;
        promise_.set_value(std::forward<Args>(value)...);
        return true;
    }

    bool SetException(std::exception_ptr error) {
        if (settled_.exchange(true)) return false;
        promise_.set_exception(std::move(error));
        return true;
    }

    bool Settled() const noexcept { return settled_.load(); }

    std::shared_future<T> Future() const { return future_; }

   private:
    std::promise<T> promise_;
    std::shared_future<T> future_;
    std::atomic<bool> settled_{false};
};

/**
 * @brief Handle on an in-flight asynchronous execution.
 *
 * `Wait()` is the only blocking primitive: it returns the value or rethrows
 * the translated exception, the same contract as the synchronous call.
 * `Cancel()` is best effort and returns false when the work had already
 * completed or could not be stopped. Copies share the same underlying state.
 */
template <class T>
class FutureResult {
   public:
    using CancelFn = std::function<bool()>;

    FutureResult(std::shared_future<T> future, CancelFn cancel)
        : future_(std::move(future)), cancel_(std::move(cancel)) {}

    decltype(auto) Wait() const { return future_.get(); }

    template <class Rep, class Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        return future_.wait_for(timeout) == std::future_status::ready;
    }

    bool Ready() const { return WaitFor(std::chrono::seconds(0)); }

    bool Cancel() const { return cancel_ ? cancel_() : false; }

   private:
    std::shared_future<T> future_;
    CancelFn cancel_;
};

}  // namespace courier::core
