#include "ClientResolver.hpp"

#include <spdlog/spdlog.h>

#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <stdexcept>
#include <utility>

#include "JsonProtocol.hpp"
#include "SignatureProvider.hpp"

namespace courier::core {

namespace {

[[noreturn]] void missing(const char* option) {
    throw std::invalid_argument(std::string("Missing required client configuration option: ") +
                                option);
}

}  // namespace

std::string Endpoint::ToString() const {
    std::string out = scheme + "://" + host;
    bool default_port = (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
    if (!port.empty() && !default_port) out += ":" + port;
    return out + base_path;
}

Endpoint ClientResolver::ParseEndpoint(const std::string& url) {
    auto parsed = boost::urls::parse_uri(url);
    if (parsed.has_error()) {
        throw std::invalid_argument("Invalid endpoint '" + url + "': " + parsed.error().message());
    }
    const boost::urls::url_view& view = *parsed;
    auto str = [](auto sv) { return std::string(sv.data(), sv.size()); };

    Endpoint ep;
    ep.scheme = str(view.scheme());
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw std::invalid_argument("Invalid endpoint '" + url + "': scheme must be http or https");
    }
    ep.host = str(view.encoded_host());
    if (ep.host.empty()) {
        throw std::invalid_argument("Invalid endpoint '" + url + "': missing host");
    }
    ep.port = view.has_port() ? str(view.port()) : (ep.scheme == "https" ? "443" : "80");

    ep.base_path = str(view.encoded_path());
    while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();
    return ep;
}

std::shared_ptr<const ClientConfig> ClientResolver::Resolve(ClientOptions options) {
    if (!options.api) missing("api");
    if (!options.region || options.region->empty()) missing("region");
    if (!options.credentials) missing("credentials");
    if (!options.transport) missing("transport");

    auto cfg = std::make_shared<ClientConfig>();
    cfg->api = std::move(options.api);
    cfg->region = std::move(*options.region);
    cfg->credentials = std::move(options.credentials);
    cfg->transport = std::move(options.transport);
    cfg->client_name = options.client_name.empty() ? "Client" : std::move(options.client_name);

    std::string endpoint = options.endpoint.value_or("");
    if (endpoint.empty()) {
        endpoint = "https://" + cfg->api->EndpointPrefix() + "." + cfg->region + ".amazonaws.com";
    }
    cfg->endpoint = ParseEndpoint(endpoint);

    cfg->signature_version = options.signature_version.value_or(cfg->api->SignatureVersion());
    if (cfg->signature_version.empty()) cfg->signature_version = "v4";

    // Protocol handlers are only looked up when at least one is missing, so a
    // service with a custom protocol can supply all three itself.
    if (!options.serializer || !options.result_parser || !options.error_parser) {
        auto handlers = infra::protocols::ForProtocol(cfg->api->Protocol());
        if (!options.serializer) options.serializer = std::move(handlers.serializer);
        if (!options.result_parser) options.result_parser = std::move(handlers.result_parser);
        if (!options.error_parser) options.error_parser = std::move(handlers.error_parser);
    }
    cfg->serializer = std::move(options.serializer);
    cfg->result_parser = std::move(options.result_parser);
    cfg->error_parser = std::move(options.error_parser);

    cfg->signature_provider = options.signature_provider
                                  ? std::move(options.signature_provider)
                                  : SignatureProviderFn([](const std::string& version,
                                                           const std::string& signing_name,
                                                           const std::string& region) {
                                        return infra::signing::SignatureProvider::Default().Resolve(
                                            version, signing_name, region);
                                    });

    cfg->exception_factory = options.exception_factory
                                 ? std::move(options.exception_factory)
                                 : MakeExceptionFactory<ServiceException>();

    for (const auto& interceptor : options.interceptors) {
        if (!interceptor) {
            throw std::invalid_argument("Invalid client configuration option: null interceptor");
        }
    }
    cfg->interceptors = std::move(options.interceptors);
    cfg->defaults = std::move(options.defaults);

    spdlog::debug("Resolved {} configuration: region={} endpoint={} signature={}",
                  cfg->client_name, cfg->region, cfg->endpoint.ToString(), cfg->signature_version);
    return cfg;
}

}  // namespace courier::core
