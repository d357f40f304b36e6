#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "ClientOptions.hpp"
#include "Command.hpp"
#include "FutureResult.hpp"
#include "Result.hpp"
#include "ResultPaginator.hpp"
#include "ServiceDescription.hpp"
#include "Waiter.hpp"

namespace courier::core {

/**
 * @brief Operation-agnostic client for one service.
 *
 * Construction runs the Config Resolver and resolves the signer; nothing is
 * sent until an operation is executed. Every call gets its own Transaction,
 * so a client may be shared freely between threads. Copies share state.
 *
 * Failures surface as one exception family (`ServiceException` unless the
 * options select a subclass). Unknown operations and unsupported
 * pagination or waiters raise before any network activity.
 */
class Client {
   public:
    // @throws std::invalid_argument naming the first missing or invalid option.
    explicit Client(ClientOptions options);

    models::Result Execute(std::string_view name, json::object params = {},
                           CommandOptions options = {}) const;
    models::Result Execute(const Command& command) const;

    FutureResult<models::Result> ExecuteAsync(std::string_view name, json::object params = {},
                                              CommandOptions options = {}) const;
    FutureResult<models::Result> ExecuteAsync(const Command& command) const;

    // The command `Execute` would run, with defaults merged.
    Command GetCommand(std::string_view name, json::object params = {},
                       CommandOptions options = {}) const;

    /**
     * @brief Lazy page sequence; nothing is sent until the first `Next()`.
     * @param overrides Non-empty members replace the description's template.
     * @throws UnsupportedOperationError if the operation has no result key.
     */
    ResultPaginator Paginate(std::string_view name, json::object params = {},
                             const models::PaginatorConfig& overrides = {}) const;

    /**
     * @brief Items under the operation's first result key, across pages when
     * the operation declares continuation tokens, else from a single call.
     * @throws UnsupportedOperationError if the operation has no result key.
     */
    ItemSequence GetIterator(std::string_view name, json::object params = {}) const;

    /**
     * @brief Blocks until the named waiter reaches a terminal state.
     * @throws UnsupportedOperationError for an unknown waiter.
     * @throws WaiterError on failure or timeout.
     */
    void WaitUntil(std::string_view waiter, json::object params = {},
                   const WaiterOverrides& overrides = {}) const;

    /**
     * @brief Starts polling in the background immediately. Cancelling (or
     * dropping every copy of the handle) stops the poll loop at its next
     * check and settles the future with a `Cancelled` WaiterError.
     */
    FutureResult<void> WaitUntilAsync(std::string_view waiter, json::object params = {},
                                      const WaiterOverrides& overrides = {}) const;

    std::shared_ptr<infra::signing::ICredentialsProvider> Credentials() const;
    const Endpoint& GetEndpoint() const;
    const std::string& Region() const;
    const models::ServiceDescription& Api() const;
    const ClientConfig& Config() const;

   private:
    FutureResult<models::Result> Start(Command command) const;
    Waiter MakeWaiter(std::string_view name, json::object params,
                      const WaiterOverrides& overrides) const;

    struct Impl;
    std::shared_ptr<Impl> impl_;
};

}  // namespace courier::core
