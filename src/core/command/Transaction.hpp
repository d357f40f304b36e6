#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "Command.hpp"
#include "ErrorShape.hpp"
#include "HttpMessage.hpp"
#include "Result.hpp"
#include "types.hpp"

namespace courier::core {

struct ClientConfig;

/**
 * @brief Per-call record threaded through every pipeline stage.
 *
 * One transaction exists per execution. Stages fill it in order: `request`
 * (serializer), `response` / `exception` (transport), then `result` or
 * `error` plus `context["error"]` (translator). The translated exception
 * itself is not stored here: it owns the transaction, not the reverse.
 */
struct Transaction {
    Transaction(std::shared_ptr<const ClientConfig> client, Command command)
        : client(std::move(client)), command(std::move(command)) {}

    std::shared_ptr<const ClientConfig> client;
    const Command command;

    std::shared_ptr<network::HttpRequest> request;
    std::optional<network::HttpResponse> response;
    std::exception_ptr exception;

    std::optional<models::Result> result;
    std::optional<models::ErrorShape> error;

    json::object context;
    std::string url;
};

}  // namespace courier::core
