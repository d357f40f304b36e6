#include "ResponseTranslator.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "ClientOptions.hpp"
#include "Errors.hpp"
#include "HttpMessage.hpp"

namespace courier::core {

namespace {

std::string lcfirst(std::string name) {
    if (!name.empty()) {
        name[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
    }
    return name;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string describe_call(const Transaction& transaction) {
    return transaction.client->client_name + "::" + lcfirst(transaction.command.Name()) + "()";
}

std::optional<models::ErrorShape> parse_error(const Transaction& transaction,
                                              const network::HttpResponse& response) {
    try {
        return transaction.client->error_parser(response);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] error parser failed for {}: {}", transaction.client->client_name,
                     transaction.command.Name(), e.what());
        return std::nullopt;
    }
}

}  // namespace

void ResponseTranslator::Process(Transaction& transaction) {
    if (transaction.result) return;
    if (!transaction.response) {
        throw std::logic_error("No response available to parse for " +
                               transaction.command.Name());
    }

    const auto& response = *transaction.response;
    models::Result parsed = transaction.client->result_parser(transaction.command, response);

    models::ResponseMetadata metadata;
    metadata.status_code = response.result_int();
    metadata.effective_uri = transaction.url;
    for (const auto& field : response) {
        metadata.headers[std::string(field.name_string())] = std::string(field.value());
    }
    transaction.result.emplace(parsed.Data(), std::move(metadata));
}

std::exception_ptr ResponseTranslator::Translate(const std::shared_ptr<Transaction>& transaction,
                                                 std::exception_ptr error) {
    const auto& client = *transaction->client;
    try {
        std::rethrow_exception(error);
    } catch (const ServiceException&) {
        return error;
    } catch (const network::RequestError& e) {
        if (transaction->url.empty()) transaction->url = e.url();
        transaction->context["error"] = json::object{};

        std::string detail = e.what();
        if (const auto& response = e.response()) {
            if (!transaction->response) transaction->response = *response;
            if (auto shape = parse_error(*transaction, *response)) {
                detail = trim(shape->code + " (" + shape->type + " error): " + shape->message);
                transaction->context["error"] = shape->ToJson();
                transaction->error = std::move(*shape);
            }
        }

        std::string message = "Error executing " + describe_call(*transaction) + " on \"" +
                               transaction->url + "\"; " + detail;
        spdlog::error("[{}] {}", client.client_name, message);
        return client.exception_factory(message, transaction, error);
    } catch (const std::exception& e) {
        std::string message =
            "Uncaught exception while executing " + describe_call(*transaction) + " - " + e.what();
        spdlog::error("[{}] {}", client.client_name, message);
        return client.exception_factory(message, transaction, error);
    } catch (...) {
        std::string message = "Uncaught exception while executing " + describe_call(*transaction) +
                              " - unknown exception";
        spdlog::error("[{}] {}", client.client_name, message);
        return client.exception_factory(message, transaction, error);
    }
}

std::exception_ptr ResponseTranslator::Settle(const std::shared_ptr<Transaction>& transaction) {
    if (transaction->exception) return Translate(transaction, transaction->exception);
    try {
        Process(*transaction);
        return nullptr;
    } catch (...) {
        return Translate(transaction, std::current_exception());
    }
}

}  // namespace courier::core
