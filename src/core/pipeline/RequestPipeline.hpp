#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "ClientOptions.hpp"
#include "Command.hpp"
#include "HttpMessage.hpp"
#include "Signer.hpp"
#include "Transaction.hpp"

namespace courier::core {

/**
 * @brief Operation-agnostic path from a command to a transport exchange.
 *
 * Stages: resolve the operation name, merge default parameters, serialize,
 * attach the per-transaction interceptors and the signing hook, send. The
 * signer is resolved once, at construction, and shared by every request.
 */
class RequestPipeline {
   public:
    using SettledFn = std::function<void(const std::shared_ptr<Transaction>&)>;

    /**
     * @throws std::invalid_argument if no signer exists for the configured
     * signature version.
     */
    explicit RequestPipeline(std::shared_ptr<const ClientConfig> config);

    /**
     * @brief Exact match first, then the name with its first letter upper-cased.
     * @throws std::invalid_argument "Operation not found: {name}".
     */
    std::string ResolveOperationName(std::string_view name) const;

    // Defaults are merged under the explicit parameters.
    Command BuildCommand(std::string_view name, json::object params, CommandOptions options = {},
                         bool is_async = false) const;

    std::shared_ptr<Transaction> Begin(Command command) const;

    // Serializes the command and appends the pre-send hooks to the request.
    void Prepare(Transaction& transaction) const;

    /**
     * @brief Hands the prepared request to the transport.
     *
     * `on_settled` runs exactly once with the transaction's `response` or
     * `exception` filled in. HTTP error statuses are recorded as a
     * `RequestError` carrying the response. Returns null when the transport
     * refused the request outright.
     */
    std::shared_ptr<network::ITransfer> Dispatch(std::shared_ptr<Transaction> transaction,
                                                 SettledFn on_settled) const;

    const std::shared_ptr<const ClientConfig>& Config() const noexcept { return config_; }
    const std::shared_ptr<infra::signing::ISigner>& Signer() const noexcept { return signer_; }

   private:
    std::shared_ptr<const ClientConfig> config_;
    std::shared_ptr<infra::signing::ISigner> signer_;
};

}  // namespace courier::core
