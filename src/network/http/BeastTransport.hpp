#pragma once

#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>

#include "HttpMessage.hpp"
#include "IoContextPool.hpp"
#include "types.hpp"

namespace courier::network {

struct TransportOptions {
    // Applies to each phase (resolve + connect, handshake, write + read).
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    bool verify_peer = true;
    std::uint64_t body_limit = 64ULL * 1024 * 1024;
};

/**
 * @brief HTTP/1.1 transport over Boost.Beast, one connection per exchange.
 *
 * Each `Send` spawns a coroutine on the next context of the pool: resolve,
 * connect, TLS handshake for `https`, run the request's pre-send hooks,
 * write, read. The completion is invoked on the pool thread. `Cancel()`
 * closes the socket, which fails the pending operation with
 * `operation_aborted`.
 */
class BeastTransport : public ITransport {
   public:
    BeastTransport(infra::io::IoContextPool& pool, TransportOptions options = {});

    std::shared_ptr<ITransfer> Send(std::shared_ptr<HttpRequest> request,
                                    Completion on_complete) override;

   private:
    infra::io::IoContextPool& pool_;
    TransportOptions options_;
    std::shared_ptr<asio::ssl::context> ssl_ctx_;
};

}  // namespace courier::network
