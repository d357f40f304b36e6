#include "DynamoDbClient.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace courier::services::dynamodb {

void IdentityEncodingInterceptor::OnBeforeSend(const core::Command& command,
                                               network::HttpRequest& request) {
    request.message.set(http::field::accept_encoding, "identity");
    spdlog::trace("[dynamodb] {} requests identity encoding", command.Name());
}

core::Client MakeDynamoDbClient(core::ClientOptions options) {
    if (options.client_name.empty()) options.client_name = "DynamoDbClient";
    options.exception_factory = core::MakeExceptionFactory<DynamoDbException>();
    options.interceptors.insert(options.interceptors.begin(),
                                std::make_shared<IdentityEncodingInterceptor>());
    return core::Client(std::move(options));
}

}  // namespace courier::services::dynamodb
