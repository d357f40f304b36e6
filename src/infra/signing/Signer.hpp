#pragma once

#include "Credentials.hpp"
#include "HttpMessage.hpp"

namespace courier::infra::signing {

/**
 * @brief Signing strategy. One instance is resolved per client and shared by
 * every request it sends, so implementations must be stateless per call.
 */
class ISigner {
   public:
    virtual ~ISigner() = default;

    // Signs the serialized request in place.
    virtual void Sign(network::HttpRequest& request, const Credentials& credentials) const = 0;
};

class AnonymousSigner : public ISigner {
   public:
    void Sign(network::HttpRequest&, const Credentials&) const override {}
};

}  // namespace courier::infra::signing
