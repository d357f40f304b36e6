#include "HttpMessage.hpp"

#include <utility>

namespace courier::network {

std::string HttpRequest::Authority() const {
    if (port.empty() || (scheme == "https" && port == "443") ||
        (scheme == "http" && port == "80")) {
        return host;
    }
    return host + ":" + port;
}

std::string HttpRequest::Url() const {
    return scheme + "://" + Authority() + std::string(message.target());
}

void HttpRequest::RunBeforeSend() {
    // Detach first so a hook that throws cannot be run a second time.
    auto hooks = std::move(before_send);
    before_send.clear();
    for (auto& hook : hooks) {
        hook(*this);
    }
}

RequestError::RequestError(const std::string& message, std::string url,
                           std::optional<HttpResponse> response, beast::error_code code)
    : std::runtime_error(message),
      url_(std::move(url)),
      response_(std::move(response)),
      code_(code) {}

}  // namespace courier::network
