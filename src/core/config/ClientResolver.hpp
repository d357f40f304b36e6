#pragma once

#include <memory>

#include "ClientOptions.hpp"

namespace courier::core {

/**
 * @brief Validates construction options and derives the missing ones.
 *
 * Required, checked in this order: `api`, `region`, `credentials`,
 * `transport`. Derived when unset: `endpoint` (from the endpoint prefix and
 * region), `signature_version`, the protocol handlers, the signature
 * provider, the exception family and the client name.
 *
 * Pure: nothing is connected, signed or sent during resolution.
 */
class ClientResolver {
   public:
    /**
     * @throws std::invalid_argument naming the first missing or invalid option.
     */
    static std::shared_ptr<const ClientConfig> Resolve(ClientOptions options);

    // @throws std::invalid_argument for a non-http(s) or unparsable URL.
    static Endpoint ParseEndpoint(const std::string& url);
};

}  // namespace courier::core
