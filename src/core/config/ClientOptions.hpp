#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Command.hpp"
#include "Credentials.hpp"
#include "ErrorShape.hpp"
#include "Errors.hpp"
#include "HttpMessage.hpp"
#include "Result.hpp"
#include "ServiceDescription.hpp"
#include "Signer.hpp"
#include "types.hpp"

namespace courier::core {

struct Transaction;

// Strategy contracts of the service collaborators.
using Serializer = std::function<network::HttpRequest(const Transaction&)>;
using ResultParser = std::function<models::Result(const Command&, const network::HttpResponse&)>;
using ErrorParser =
    std::function<std::optional<models::ErrorShape>(const network::HttpResponse&)>;
using SignatureProviderFn = std::function<std::shared_ptr<infra::signing::ISigner>(
    const std::string& version, const std::string& signing_name, const std::string& region)>;

/**
 * @brief Service-specific request customization, composed at construction.
 *
 * Interceptors run in registration order on the transport thread, after
 * serialization and before signing.
 */
struct IRequestInterceptor {
    virtual ~IRequestInterceptor() = default;
    virtual void OnBeforeSend(const Command& command, network::HttpRequest& request) = 0;
};

struct Endpoint {
    std::string scheme;
    std::string host;
    std::string port;
    std::string base_path;  // without a trailing '/'

    std::string ToString() const;
};

/**
 * @brief Raw construction options. Unset members are either required (api,
 * region, credentials, transport) or derived by `ClientResolver`.
 */
struct ClientOptions {
    std::string client_name;
    std::shared_ptr<const models::ServiceDescription> api;
    std::optional<std::string> region;
    std::optional<std::string> endpoint;
    std::shared_ptr<infra::signing::ICredentialsProvider> credentials;
    std::optional<std::string> signature_version;

    Serializer serializer;
    ResultParser result_parser;
    ErrorParser error_parser;
    SignatureProviderFn signature_provider;
    ExceptionFactory exception_factory;

    json::object defaults;
    std::vector<std::shared_ptr<IRequestInterceptor>> interceptors;
    std::shared_ptr<network::ITransport> transport;
};

// Resolved, immutable configuration shared by every transaction of a client.
struct ClientConfig {
    std::string client_name;
    std::shared_ptr<const models::ServiceDescription> api;
    std::string region;
    Endpoint endpoint;
    std::shared_ptr<infra::signing::ICredentialsProvider> credentials;
    std::string signature_version;

    Serializer serializer;
    ResultParser result_parser;
    ErrorParser error_parser;
    SignatureProviderFn signature_provider;
    ExceptionFactory exception_factory;

    json::object defaults;
    std::vector<std::shared_ptr<IRequestInterceptor>> interceptors;
    std::shared_ptr<network::ITransport> transport;
};

}  // namespace courier::core
