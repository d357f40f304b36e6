#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>

#include "Result.hpp"
#include "ServiceDescription.hpp"
#include "types.hpp"

namespace courier::core {

// Per-call adjustments applied over the description's wait template.
struct WaiterOverrides {
    std::optional<std::chrono::milliseconds> delay;
    std::optional<int> max_attempts;
};

/**
 * @brief Polls one operation until an acceptor reaches a terminal state.
 *
 * Attempt 1 runs immediately; a retry sleeps `delay` first. Acceptors are
 * tried in declared order and the first match decides. An error no acceptor
 * matched is rethrown as is; a result no acceptor matched is retried. After
 * `max_attempts` polls the wait fails with `WaiterFailureKind::Timeout`.
 */
class Waiter {
   public:
    using Executor =
        std::function<models::Result(const std::string& operation, const json::object& params)>;

    Waiter(std::string name, models::WaiterConfig config, json::object params, Executor execute);

    /**
     * @throws WaiterError on a failure acceptor, timeout or stop request.
     * @throws ServiceException from a poll no acceptor matched.
     */
    void Wait(std::stop_token stop = {});

    const std::string& Name() const noexcept { return name_; }
    const models::WaiterConfig& Config() const noexcept { return config_; }
    int Attempts() const noexcept { return attempts_; }

   private:
    // False when the wait was interrupted by a stop request.
    bool Sleep(const std::stop_token& stop) const;

    std::string name_;
    models::WaiterConfig config_;
    json::object params_;
    Executor execute_;
    int attempts_ = 0;
};

}  // namespace courier::core
