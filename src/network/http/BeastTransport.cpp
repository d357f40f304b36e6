#include "BeastTransport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace courier::network {

namespace {

template <class Stream>
asio::awaitable<HttpResponse> exchange(Stream& stream, http::request<http::string_body>& req,
                                       std::uint64_t body_limit) {
    co_await http::async_write(stream, req, asio::use_awaitable);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(body_limit);
    if (req.method() == http::verb::head) parser.skip(true);

    co_await http::async_read(stream, buffer, parser, asio::use_awaitable);
    co_return parser.release();
}

/**
 * @brief One request/response exchange on its own connection.
 */
class BeastTransfer : public ITransfer, public std::enable_shared_from_this<BeastTransfer> {
   public:
    BeastTransfer(asio::io_context& ioc, std::shared_ptr<asio::ssl::context> ssl_ctx,
                  const TransportOptions& options, std::shared_ptr<HttpRequest> request,
                  ITransport::Completion on_complete)
        : ioc_(ioc),
          ssl_ctx_(std::move(ssl_ctx)),
          options_(options),
          request_(std::move(request)),
          on_complete_(std::move(on_complete)),
          resolver_(ioc) {
        if (request_->scheme == "https") {
            tls_.emplace(ioc, *ssl_ctx_);
        } else {
            plain_.emplace(ioc);
        }
    }

    void Start() {
        asio::co_spawn(
            ioc_, [self = shared_from_this()]() { return self->Run(); }, asio::detached);
    }

    bool Cancel() override {
        State expected = State::Running;
        if (!state_.compare_exchange_strong(expected, State::Cancelled)) return false;
        asio::post(ioc_, [self = shared_from_this()] { self->Close(); });
        spdlog::debug("[transport] cancel requested for {}", request_->Url());
        return true;
    }

   private:
    enum class State { Running, Cancelled, Done };

    beast::tcp_stream& Lowest() { return tls_ ? beast::get_lowest_layer(*tls_) : *plain_; }

    bool Cancelled() const { return state_.load() == State::Cancelled; }

    void Close() {
        resolver_.cancel();
        Lowest().close();
    }

    // Close() only reaches operations already started; a cancel that lands
    // between two steps is caught here.
    void ThrowIfCancelled() const {
        if (Cancelled()) {
            throw beast::system_error(beast::error_code(asio::error::operation_aborted));
        }
    }

    RequestError CancelledError(const std::string& url) const {
        return RequestError("Request cancelled while sending to " + url, url, std::nullopt,
                            beast::error_code(asio::error::operation_aborted));
    }

    asio::awaitable<void> Run() {
        TransferResult outcome;
        const std::string url = request_->Url();
        try {
            auto results =
                co_await resolver_.async_resolve(request_->host, request_->port, asio::use_awaitable);
            ThrowIfCancelled();

            auto& lowest = Lowest();
            lowest.expires_after(options_.timeout);
            co_await lowest.async_connect(results, asio::use_awaitable);
            ThrowIfCancelled();
            spdlog::debug("[transport] connected to {}:{}", request_->host, request_->port);

            if (tls_) {
                if (!SSL_set_tlsext_host_name(tls_->native_handle(), request_->host.c_str())) {
                    throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                                asio::error::get_ssl_category()));
                }
                if (options_.verify_peer) {
                    tls_->set_verify_callback(asio::ssl::host_name_verification(request_->host));
                }
                lowest.expires_after(options_.timeout);
                co_await tls_->async_handshake(asio::ssl::stream_base::client, asio::use_awaitable);
                ThrowIfCancelled();
            }

            request_->RunBeforeSend();

            lowest.expires_after(options_.timeout);
            if (tls_) {
                outcome.response = co_await exchange(*tls_, request_->message, options_.body_limit);
            } else {
                outcome.response = co_await exchange(*plain_, request_->message, options_.body_limit);
            }

            beast::error_code ec;
            lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
        } catch (const beast::system_error& e) {
            if (Cancelled()) {
                spdlog::debug("[transport] {} cancelled", url);
                outcome.error = std::make_exception_ptr(CancelledError(url));
            } else {
                std::string reason = e.code() == beast::error::timeout ? "Request timed out"
                                                                       : e.code().message();
                spdlog::warn("[transport] {} failed: {}", url, reason);
                outcome.error = std::make_exception_ptr(
                    RequestError(reason + " while sending to " + url, url, std::nullopt, e.code()));
            }
        } catch (...) {
            // A pre-send hook failed; its exception is reported as is.
            spdlog::warn("[transport] pre-send hook failed for {}", url);
            outcome.error = std::current_exception();
        }

        // A cancel that won the race against completion still settles as cancelled.
        State expected = State::Running;
        if (!state_.compare_exchange_strong(expected, State::Done) && !outcome.error) {
            outcome.response.reset();
            outcome.error = std::make_exception_ptr(CancelledError(url));
        }

        try {
            on_complete_(std::move(outcome));
        } catch (const std::exception& e) {
            spdlog::critical("[transport] completion handler for {} threw: {}", url, e.what());
        } catch (...) {
            spdlog::critical("[transport] completion handler for {} threw a non-standard exception",
                             url);
        }
    }

    asio::io_context& ioc_;
    std::shared_ptr<asio::ssl::context> ssl_ctx_;
    TransportOptions options_;
    std::shared_ptr<HttpRequest> request_;
    ITransport::Completion on_complete_;

    tcp::resolver resolver_;
    std::optional<beast::tcp_stream> plain_;
    std::optional<beast::ssl_stream<beast::tcp_stream>> tls_;

    std::atomic<State> state_{State::Running};
};

}  // namespace

BeastTransport::BeastTransport(infra::io::IoContextPool& pool, TransportOptions options)
    : pool_(pool),
      options_(options),
      ssl_ctx_(std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client)) {
    ssl_ctx_->set_default_verify_paths();
    ssl_ctx_->set_verify_mode(options_.verify_peer ? asio::ssl::verify_peer
                                                   : asio::ssl::verify_none);
    spdlog::debug("[transport] using {} I/O context(s), timeout {} ms", pool_.Size(),
                  options_.timeout.count());
}

std::shared_ptr<ITransfer> BeastTransport::Send(std::shared_ptr<HttpRequest> request,
                                                Completion on_complete) {
    if (!request) {
        throw std::invalid_argument("BeastTransport::Send called without a request");
    }
    if (!pool_.Running()) {
        throw std::logic_error("BeastTransport::Send called before the I/O pool was started");
    }
    spdlog::debug("[transport] {} {}", std::string(request->message.method_string()),
                  request->Url());

    auto transfer = std::make_shared<BeastTransfer>(pool_.GetIoContext(), ssl_ctx_, options_,
                                                    std::move(request), std::move(on_complete));
    transfer->Start();
    return transfer;
}

}  // namespace courier::network
