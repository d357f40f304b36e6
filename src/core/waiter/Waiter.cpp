#include "Waiter.hpp"

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "Acceptor.hpp"
#include "Errors.hpp"

namespace courier::core {

Waiter::Waiter(std::string name, models::WaiterConfig config, json::object params,
               Executor execute)
    : name_(std::move(name)),
      config_(std::move(config)),
      params_(std::move(params)),
      execute_(std::move(execute)) {
    if (config_.max_attempts < 1) {
        throw std::invalid_argument("Waiter " + name_ + " needs at least one attempt");
    }
}

bool Waiter::Sleep(const std::stop_token& stop) const {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, config_.delay, [] { return false; });
    return !stop.stop_requested();
}

void Waiter::Wait(std::stop_token stop) {
    spdlog::debug("[waiter] {} polling {} every {} ms (max {} attempts)", name_, config_.operation,
                  config_.delay.count(), config_.max_attempts);

    auto find_acceptor = [this](const models::Result* result,
                                const ServiceException* error) -> const models::AcceptorConfig* {
        for (const auto& acceptor : config_.acceptors) {
            if (AcceptorMatches(acceptor, result, error)) return &acceptor;
        }
        return nullptr;
    };

    for (attempts_ = 1;; ++attempts_) {
        if (stop.stop_requested()) {
            throw WaiterError("The " + name_ + " waiter was cancelled", WaiterFailureKind::Cancelled,
                              name_, attempts_ - 1);
        }

        const models::AcceptorConfig* matched = nullptr;
        try {
            models::Result result = execute_(config_.operation, params_);
            matched = find_acceptor(&result, nullptr);
        } catch (const ServiceException& e) {
            matched = find_acceptor(nullptr, &e);
            if (matched == nullptr) throw;
        }

        if (matched != nullptr) {
            spdlog::debug("[waiter] {} attempt {} matched {} -> {}", name_, attempts_,
                          matched->argument, models::ToString(matched->state));
            if (matched->state == models::AcceptorState::Success) {
                spdlog::info("[waiter] {} succeeded after {} attempt(s)", name_, attempts_);
                return;
            }
            if (matched->state == models::AcceptorState::Failure) {
                spdlog::info("[waiter] {} entered a failure state after {} attempt(s)", name_,
                             attempts_);
                throw WaiterError("The " + name_ + " waiter entered a failure state",
                                  WaiterFailureKind::Failure, name_, attempts_);
            }
        }

        if (attempts_ >= config_.max_attempts) break;
        if (!Sleep(stop)) {
            throw WaiterError("The " + name_ + " waiter was cancelled", WaiterFailureKind::Cancelled,
                              name_, attempts_);
        }
    }

    spdlog::info("[waiter] {} timed out after {} attempt(s)", name_, attempts_);
    throw WaiterError(
        "The " + name_ + " waiter failed after attempt #" + std::to_string(attempts_),
        WaiterFailureKind::Timeout, name_, attempts_);
}

}  // namespace courier::core
