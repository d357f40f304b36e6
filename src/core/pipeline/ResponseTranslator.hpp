#pragma once

#include <exception>
#include <memory>

#include "Transaction.hpp"

namespace courier::core {

/**
 * @brief Turns a completed transaction into its single outcome: a result, or
 * one exception of the client's family.
 *
 * Translation happens once. A `ServiceException` (or family subclass) is
 * returned as is; a `RequestError` is run through the error parser; anything
 * else is wrapped as an uncaught failure. The original cause is kept as the
 * exception's `Previous()`.
 */
class ResponseTranslator {
   public:
    /**
     * @brief Populates `transaction.result` from the response.
     * @throws std::logic_error if there is no response to parse.
     */
    static void Process(Transaction& transaction);

    static std::exception_ptr Translate(const std::shared_ptr<Transaction>& transaction,
                                        std::exception_ptr error);

    // Process or Translate, depending on the transport outcome. Null on success.
    static std::exception_ptr Settle(const std::shared_ptr<Transaction>& transaction);
};

}  // namespace courier::core
