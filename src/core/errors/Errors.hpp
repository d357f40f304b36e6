#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "ErrorShape.hpp"

namespace courier::core {

struct Transaction;

/**
 * @brief The typed exception of the default client family.
 *
 * Every failure observed by a caller of `Client` (other than precondition
 * violations) arrives as this type or a family subclass of it. It carries the
 * normalized service error fields when the remote sent a structured error,
 * the originating URL and request id, and the whole transaction.
 */
class ServiceException : public std::runtime_error {
   public:
    ServiceException(const std::string& message, std::shared_ptr<Transaction> transaction,
                     std::exception_ptr previous = nullptr);

    const std::string& ErrorCode() const noexcept { return error_.code; }
    const std::string& ErrorType() const noexcept { return error_.type; }
    const std::string& ErrorMessage() const noexcept { return error_.message; }
    const std::string& RequestId() const noexcept { return error_.request_id; }
    const models::ErrorShape& Error() const noexcept { return error_; }

    // 0 when no HTTP response was received.
    unsigned int StatusCode() const noexcept { return status_code_; }
    const std::string& Url() const noexcept { return url_; }
    const std::string& OperationName() const noexcept { return operation_; }

    const std::shared_ptr<Transaction>& GetTransaction() const noexcept { return transaction_; }
    const std::exception_ptr& Previous() const noexcept { return previous_; }

   private:
    std::shared_ptr<Transaction> transaction_;
    std::exception_ptr previous_;
    models::ErrorShape error_;
    unsigned int status_code_ = 0;
    std::string url_;
    std::string operation_;
};

// Builds the family exception for a translated failure.
using ExceptionFactory = std::function<std::exception_ptr(
    const std::string& message, std::shared_ptr<Transaction> transaction,
    std::exception_ptr previous)>;

template <class E>
ExceptionFactory MakeExceptionFactory() {
    static_assert(std::is_base_of_v<ServiceException, E>,
                  "client exception families must derive from ServiceException");
    return [](const std::string& message, std::shared_ptr<Transaction> transaction,
              std::exception_ptr previous) {
        return std::make_exception_ptr(E(message, std::move(transaction), std::move(previous)));
    };
}

// The operation has no pagination result key, or the waiter does not exist.
class UnsupportedOperationError : public std::logic_error {
   public:
    using std::logic_error::logic_error;
};

enum class WaiterFailureKind { Failure, Timeout, Cancelled };

class WaiterError : public std::runtime_error {
   public:
    WaiterError(const std::string& message, WaiterFailureKind kind, std::string waiter,
                int attempts);

    WaiterFailureKind Kind() const noexcept { return kind_; }
    const std::string& WaiterName() const noexcept { return waiter_; }
    int Attempts() const noexcept { return attempts_; }

   private:
    WaiterFailureKind kind_;
    std::string waiter_;
    int attempts_;
};

}  // namespace courier::core
