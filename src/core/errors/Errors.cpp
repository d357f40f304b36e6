#include "Errors.hpp"

#include <utility>

#include "Transaction.hpp"

namespace courier::core {

ServiceException::ServiceException(const std::string& message,
                                   std::shared_ptr<Transaction> transaction,
                                   std::exception_ptr previous)
    : std::runtime_error(message),
      transaction_(std::move(transaction)),
      previous_(std::move(previous)) {
    if (!transaction_) return;

    if (transaction_->error) error_ = *transaction_->error;
    if (transaction_->response) status_code_ = transaction_->response->result_int();
    url_ = transaction_->url;
    operation_ = transaction_->command.Name();
}

WaiterError::WaiterError(const std::string& message, WaiterFailureKind kind, std::string waiter,
                         int attempts)
    : std::runtime_error(message), kind_(kind), waiter_(std::move(waiter)), attempts_(attempts) {}

}  // namespace courier::core
