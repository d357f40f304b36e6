#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

namespace courier::network {

using HttpResponse = http::response<http::string_body>;

struct HttpRequest;

// Runs on the transport right before the request is written to the wire.
using PreSendHook = std::function<void(HttpRequest&)>;

/**
 * @brief A fully serialized wire request plus its pre-send extension point.
 *
 * The serializer fills `message` and the addressing fields. The pipeline then
 * appends the per-transaction hooks (service interceptors, per-call hooks and
 * finally the signer) to `before_send`; the transport runs them exactly once.
 */
struct HttpRequest {
    http::request<http::string_body> message{http::verb::post, "/", 11};
    std::string scheme = "https";
    std::string host;
    std::string port;
    std::vector<PreSendHook> before_send;

    // host[:port], with the port omitted when it is the scheme default.
    std::string Authority() const;

    std::string Url() const;

    // Runs and clears the pre-send hooks.
    void RunBeforeSend();
};

/**
 * @brief Transport-level failure.
 *
 * Raised for connection, timeout and protocol errors (no response) and for
 * completed exchanges that returned an HTTP error status (response attached).
 */
class RequestError : public std::runtime_error {
   public:
    RequestError(const std::string& message, std::string url,
                 std::optional<HttpResponse> response = std::nullopt,
                 beast::error_code code = {});

    const std::string& url() const noexcept { return url_; }
    const std::optional<HttpResponse>& response() const noexcept { return response_; }
    beast::error_code code() const noexcept { return code_; }

   private:
    std::string url_;
    std::optional<HttpResponse> response_;
    beast::error_code code_;
};

struct TransferResult {
    std::optional<HttpResponse> response;
    std::exception_ptr error;
};

// Handle on one in-flight exchange.
class ITransfer {
   public:
    virtual ~ITransfer() = default;

    // Best effort. Returns false when the exchange had already completed.
    virtual bool Cancel() = 0;
};

/**
 * @brief Contract of the wire-level collaborator.
 *
 * Implementations own all socket I/O and threading. `on_complete` is invoked
 * exactly once per `Send`, on whichever thread the transport chooses.
 */
class ITransport {
   public:
    using Completion = std::function<void(TransferResult)>;

    virtual ~ITransport() = default;

    virtual std::shared_ptr<ITransfer> Send(std::shared_ptr<HttpRequest> request,
                                            Completion on_complete) = 0;
};

}  // namespace courier::network
