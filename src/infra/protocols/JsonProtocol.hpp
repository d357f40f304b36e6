#pragma once

#include <optional>
#include <string_view>

#include "ClientOptions.hpp"
#include "ErrorShape.hpp"
#include "HttpMessage.hpp"
#include "Result.hpp"

namespace courier::core {
struct Transaction;
}

namespace courier::infra::protocols {

inline constexpr std::string_view USER_AGENT = "courier-cpp/1.0";

/**
 * @brief `json` protocol: every operation is `POST /` with the operation named
 * by `X-Amz-Target` and the parameters as the JSON body.
 */
network::HttpRequest SerializeJson(const core::Transaction& transaction);

/**
 * @brief `rest-json` protocol: method and URI template from the operation
 * model. `{Name}` / `{Name+}` placeholders are filled from the parameters;
 * the remaining parameters go to the query string for GET, HEAD and DELETE
 * and to a JSON body otherwise.
 * @throws std::invalid_argument if a URI placeholder has no parameter.
 */
network::HttpRequest SerializeRestJson(const core::Transaction& transaction);

// Decodes a JSON object body; an empty body is an empty result.
models::Result ParseJsonResult(const core::Command& command, const network::HttpResponse& response);

// Extracts code/type/message/request id; empty when no error code is present.
std::optional<models::ErrorShape> ParseJsonError(const network::HttpResponse& response);

struct ProtocolHandlers {
    core::Serializer serializer;
    core::ResultParser result_parser;
    core::ErrorParser error_parser;
};

// @throws std::invalid_argument for a protocol with no built-in handlers.
ProtocolHandlers ForProtocol(std::string_view protocol);

}  // namespace courier::infra::protocols
