#pragma once

#include "Client.hpp"
#include "ClientOptions.hpp"
#include "Errors.hpp"

namespace courier::services::dynamodb {

// Exception family of DynamoDB clients.
class DynamoDbException : public core::ServiceException {
   public:
    using core::ServiceException::ServiceException;
};

// Sets `Accept-Encoding: identity` on every request.
class IdentityEncodingInterceptor : public core::IRequestInterceptor {
   public:
    void OnBeforeSend(const core::Command& command, network::HttpRequest& request) override;
};

/**
 * @brief Builds a client with the DynamoDB family: `DynamoDbException`, the
 * client name "DynamoDbClient" unless one is set, and the identity encoding
 * interceptor ahead of any interceptors already in `options`.
 */
core::Client MakeDynamoDbClient(core::ClientOptions options);

}  // namespace courier::services::dynamodb
