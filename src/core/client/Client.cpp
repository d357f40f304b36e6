#include "Client.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <stop_token>
#include <thread>
#include <utility>

#include "ClientResolver.hpp"
#include "Errors.hpp"
#include "RequestPipeline.hpp"
#include "ResponseTranslator.hpp"

namespace courier::core {

struct Client::Impl {
    explicit Impl(std::shared_ptr<const ClientConfig> cfg)
        : config(std::move(cfg)), pipeline(config) {}

    std::shared_ptr<const ClientConfig> config;
    RequestPipeline pipeline;
};

Client::Client(ClientOptions options)
    : impl_(std::make_shared<Impl>(ClientResolver::Resolve(std::move(options)))) {
    spdlog::info("{} ready for {} ({}) at {}", impl_->config->client_name,
                 impl_->config->api->ServiceFullName(), impl_->config->region,
                 impl_->config->endpoint.ToString());
}

Command Client::GetCommand(std::string_view name, json::object params,
                           CommandOptions options) const {
    return impl_->pipeline.BuildCommand(name, std::move(params), std::move(options));
}

FutureResult<models::Result> Client::Start(Command command) const {
    const auto& pipeline = impl_->pipeline;
    auto transaction = pipeline.Begin(std::move(command));
    auto pending = std::make_shared<PendingResult<models::Result>>();

    auto settle = [pending](const std::shared_ptr<Transaction>& txn) {
        try {
            if (auto error = ResponseTranslator::Settle(txn)) {
                pending->SetException(std::move(error));
            } else {
                pending->SetValue(*txn->result);
            }
        } catch (...) {
            // A throwing exception factory still settles the call.
            pending->SetException(std::current_exception());
        }
    };

    std::shared_ptr<network::ITransfer> transfer;
    try {
        pipeline.Prepare(*transaction);
        transfer = pipeline.Dispatch(transaction, settle);
    } catch (...) {
        transaction->exception = std::current_exception();
        settle(transaction);
    }

    return FutureResult<models::Result>(pending->Future(), [pending, transfer] {
        if (pending->Settled() || !transfer) return false;
        return transfer->Cancel();
    });
}

models::Result Client::Execute(const Command& command) const { return Start(command).Wait(); }

models::Result Client::Execute(std::string_view name, json::object params,
                               CommandOptions options) const {
    return Execute(GetCommand(name, std::move(params), std::move(options)));
}

FutureResult<models::Result> Client::ExecuteAsync(const Command& command) const {
    return Start(command.AsAsync());
}

FutureResult<models::Result> Client::ExecuteAsync(std::string_view name, json::object params,
                                                  CommandOptions options) const {
    return Start(impl_->pipeline.BuildCommand(name, std::move(params), std::move(options), true));
}

ResultPaginator Client::Paginate(std::string_view name, json::object params,
                                 const models::PaginatorConfig& overrides) const {
    std::string operation = impl_->pipeline.ResolveOperationName(name);
    const auto& api = *impl_->config->api;

    models::PaginatorConfig config = api.PaginationTemplate(operation).value_or(models::PaginatorConfig{});
    if (!overrides.input_token.empty()) config.input_token = overrides.input_token;
    if (!overrides.output_token.empty()) config.output_token = overrides.output_token;
    if (!overrides.result_key.empty()) config.result_key = overrides.result_key;
    if (!overrides.limit_key.empty()) config.limit_key = overrides.limit_key;
    if (!overrides.more_results.empty()) config.more_results = overrides.more_results;

    if (config.result_key.empty()) {
        throw UnsupportedOperationError("There are no resources to iterate for the " + operation +
                                        " operation of " + api.ServiceFullName());
    }

    Client self = *this;
    return ResultPaginator(
        [self](const std::string& op, const json::object& args) { return self.Execute(op, args); },
        std::move(operation), std::move(params), std::move(config));
}

ItemSequence Client::GetIterator(std::string_view name, json::object params) const {
    ResultPaginator paginator = Paginate(name, std::move(params));
    const auto& config = paginator.Config();
    std::string key = config.result_key.front();

    if (!config.input_token.empty() && !config.output_token.empty()) {
        return ItemSequence(std::move(paginator), std::move(key));
    }
    auto page = paginator.Next();
    return ItemSequence(page ? page->Search(key) : json::value());
}

Waiter Client::MakeWaiter(std::string_view name, json::object params,
                          const WaiterOverrides& overrides) const {
    const auto& api = *impl_->config->api;
    auto config = api.WaitTemplate(name);
    if (!config) {
        throw UnsupportedOperationError("Waiter was not found: " + std::string(name) + " for " +
                                        api.ServiceFullName());
    }
    if (overrides.delay) config->delay = *overrides.delay;
    if (overrides.max_attempts) config->max_attempts = *overrides.max_attempts;
    impl_->pipeline.ResolveOperationName(config->operation);

    Client self = *this;
    return Waiter(
        std::string(name), std::move(*config), std::move(params),
        [self](const std::string& op, const json::object& args) { return self.Execute(op, args); });
}

void Client::WaitUntil(std::string_view waiter, json::object params,
                       const WaiterOverrides& overrides) const {
    MakeWaiter(waiter, std::move(params), overrides).Wait();
}

FutureResult<void> Client::WaitUntilAsync(std::string_view waiter, json::object params,
                                          const WaiterOverrides& overrides) const {
    auto pending = std::make_shared<PendingResult<void>>();
    auto worker = std::make_shared<std::jthread>(
        [pending, poller = MakeWaiter(waiter, std::move(params), overrides)](
            std::stop_token stop) mutable {
            try {
                poller.Wait(stop);
                pending->SetValue();
            } catch (...) {
                pending->SetException(std::current_exception());
            }
        });

    return FutureResult<void>(pending->Future(), [pending, worker] {
        if (pending->Settled()) return false;
        return worker->request_stop();
    });
}

std::shared_ptr<infra::signing::ICredentialsProvider> Client::Credentials() const {
    return impl_->config->credentials;
}

const Endpoint& Client::GetEndpoint() const { return impl_->config->endpoint; }

const std::string& Client::Region() const { return impl_->config->region; }

const models::ServiceDescription& Client::Api() const { return *impl_->config->api; }

const ClientConfig& Client::Config() const { return *impl_->config; }

}  // namespace courier::core
