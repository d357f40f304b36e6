#include "RequestPipeline.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>

namespace courier::core {

RequestPipeline::RequestPipeline(std::shared_ptr<const ClientConfig> config)
    : config_(std::move(config)) {
    const auto& api = *config_->api;
    signer_ = config_->signature_provider(config_->signature_version, api.SigningName(),
                                          config_->region);
    if (!signer_) {
        throw std::invalid_argument("Unable to resolve a signer for signature version " +
                                    config_->signature_version);
    }
}

std::string RequestPipeline::ResolveOperationName(std::string_view name) const {
    const auto& api = *config_->api;
    if (api.HasOperation(name)) return std::string(name);

    std::string normalized(name);
    if (!normalized.empty()) {
        normalized[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(normalized[0])));
        if (api.HasOperation(normalized)) return normalized;
    }
    throw std::invalid_argument("Operation not found: " + std::string(name));
}

Command RequestPipeline::BuildCommand(std::string_view name, json::object params,
                                      CommandOptions options, bool is_async) const {
    std::string operation = ResolveOperationName(name);
    for (const auto& [key, value] : config_->defaults) {
        if (!params.contains(key)) params.emplace(key, value);
    }
    return Command(std::move(operation), std::move(params), std::move(options), is_async);
}

std::shared_ptr<Transaction> RequestPipeline::Begin(Command command) const {
    spdlog::debug("[{}] begin {}{}", config_->client_name, command.Name(),
                  command.IsAsync() ? " (async)" : "");
    return std::make_shared<Transaction>(config_, std::move(command));
}

void RequestPipeline::Prepare(Transaction& transaction) const {
    auto request = std::make_shared<network::HttpRequest>(config_->serializer(transaction));
    transaction.url = request->Url();

    // The transport keeps the completion (and with it the transaction) alive
    // until the hooks have run, so the command can be captured by reference.
    const Command& command = transaction.command;
    for (const auto& interceptor : config_->interceptors) {
        request->before_send.emplace_back(
            [interceptor, &command](network::HttpRequest& req) {
                interceptor->OnBeforeSend(command, req);
            });
    }
    for (const auto& hook : command.Hooks()) {
        request->before_send.push_back(hook);
    }
    request->before_send.emplace_back(
        [signer = signer_, credentials = config_->credentials](network::HttpRequest& req) {
            signer->Sign(req, credentials->GetCredentials());
        });

    transaction.request = std::move(request);
    spdlog::debug("[{}] {} prepared for {}", config_->client_name, command.Name(),
                  transaction.url);
}

std::shared_ptr<network::ITransfer> RequestPipeline::Dispatch(
    std::shared_ptr<Transaction> transaction, SettledFn on_settled) const {
    auto on_complete = [transaction, on_settled](network::TransferResult outcome) {
        if (outcome.error) {
            transaction->exception = std::move(outcome.error);
        } else if (!outcome.response) {
            transaction->exception = std::make_exception_ptr(
                network::RequestError("Transport completed without a response", transaction->url));
        } else {
            unsigned int status = outcome.response->result_int();
            spdlog::debug("[{}] {} -> HTTP {}", transaction->client->client_name,
                          transaction->command.Name(), status);
            if (status >= 400) {
                transaction->exception = std::make_exception_ptr(network::RequestError(
                    "HTTP " + std::to_string(status) + " returned for " + transaction->url,
                    transaction->url, *outcome.response));
            }
            transaction->response = std::move(outcome.response);
        }
        on_settled(transaction);
    };

    try {
        return config_->transport->Send(transaction->request, std::move(on_complete));
    } catch (const std::exception& e) {
        spdlog::warn("[{}] transport rejected {}: {}", config_->client_name,
                     transaction->command.Name(), e.what());
        transaction->exception = std::current_exception();
        on_settled(transaction);
        return nullptr;
    }
}

}  // namespace courier::core
