#include "JsonProtocol.hpp"

#include <spdlog/spdlog.h>

#include <boost/url/encode.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <functional>
#include <set>
#include <stdexcept>
#include <string>

#include "Transaction.hpp"

namespace courier::infra::protocols {

namespace {

constexpr boost::urls::grammar::lut_chars PATH_SEGMENT_CHARS =
    boost::urls::unreserved_chars + boost::urls::grammar::lut_chars('/');

// Greedy placeholders keep their slashes; everything else is encoded.
std::string percent_encode(std::string_view input, bool keep_slash) {
    if (keep_slash) return boost::urls::encode(input, PATH_SEGMENT_CHARS);
    return boost::urls::encode(input, boost::urls::unreserved_chars);
}

std::string scalar_to_string(const json::value& v) {
    switch (v.kind()) {
        case json::kind::string:
            return std::string(v.get_string());
        case json::kind::int64:
            return std::to_string(v.get_int64());
        case json::kind::uint64:
            return std::to_string(v.get_uint64());
        case json::kind::bool_:
            return v.get_bool() ? "true" : "false";
        default:
            return json::serialize(v);
    }
}

network::HttpRequest make_request(const core::Transaction& txn, http::verb method,
                                  const std::string& path_and_query) {
    const auto& ep = txn.client->endpoint;

    network::HttpRequest req;
    req.scheme = ep.scheme;
    req.host = ep.host;
    req.port = ep.port;
    req.message.method(method);
    req.message.target(ep.base_path + path_and_query);
    req.message.version(11);

    boost::uuids::random_generator generator;
    req.message.set(http::field::host, req.Authority());
    req.message.set(http::field::user_agent, std::string(USER_AGENT));
    req.message.set("amz-sdk-invocation-id", boost::uuids::to_string(generator()));
    return req;
}

// Fills `{Name}` and `{Name+}` placeholders and removes the consumed parameters,
// keeping the order of the ones left.
std::string expand_uri(std::string_view uri_template, json::object& params) {
    std::set<std::string, std::less<>> consumed;
    std::string out;
    std::size_t pos = 0;
    while (pos < uri_template.size()) {
        auto open = uri_template.find('{', pos);
        if (open == std::string_view::npos) {
            out.append(uri_template.substr(pos));
            break;
        }
        auto close = uri_template.find('}', open);
        if (close == std::string_view::npos) {
            throw std::invalid_argument("Unterminated placeholder in URI template: " +
                                        std::string(uri_template));
        }
        out.append(uri_template.substr(pos, open - pos));

        std::string name(uri_template.substr(open + 1, close - open - 1));
        bool greedy = !name.empty() && name.back() == '+';
        if (greedy) name.pop_back();

        auto it = params.find(name);
        if (it == params.end() || it->value().is_null()) {
            throw std::invalid_argument("Missing required URI parameter: " + name);
        }
        out += percent_encode(scalar_to_string(it->value()), greedy);
        consumed.insert(std::move(name));
        pos = close + 1;
    }

    json::object remaining;
    for (const auto& [key, value] : params) {
        if (!consumed.contains(std::string_view(key.data(), key.size()))) {
            remaining.emplace(key, value);
        }
    }
    params = std::move(remaining);
    return out;
}

}  // namespace

network::HttpRequest SerializeJson(const core::Transaction& transaction) {
    const auto& api = *transaction.client->api;
    const auto& command = transaction.command;

    auto req = make_request(transaction, http::verb::post, "/");
    if (!api.TargetPrefix().empty()) {
        req.message.set("X-Amz-Target", api.TargetPrefix() + "." + command.Name());
    }
    req.message.set(http::field::content_type, "application/x-amz-json-" + api.JsonVersion());
    req.message.body() = json::serialize(command.Params());
    req.message.prepare_payload();

    spdlog::debug("[json] serialized {} ({} bytes)", command.Name(), req.message.body().size());
    return req;
}

network::HttpRequest SerializeRestJson(const core::Transaction& transaction) {
    const auto& command = transaction.command;
    const auto& op = transaction.client->api->Operation(command.Name());

    http::verb method = http::string_to_verb(op.http_method);
    if (method == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method for " + op.name + ": " +
                                    op.http_method);
    }

    json::object params = command.Params();
    std::string target = expand_uri(op.request_uri, params);

    const bool body_less =
        method == http::verb::get || method == http::verb::head || method == http::verb::delete_;

    if (body_less && !params.empty()) {
        char sep = target.find('?') == std::string::npos ? '?' : '&';
        for (const auto& [key, value] : params) {
            if (value.is_null()) continue;
            target += sep;
            target += percent_encode(key, false) + "=" + percent_encode(scalar_to_string(value), false);
            sep = '&';
        }
    }

    auto req = make_request(transaction, method, target);
    if (!body_less) {
        req.message.set(http::field::content_type, "application/json");
        req.message.body() = json::serialize(params);
    }
    req.message.prepare_payload();

    spdlog::debug("[rest-json] serialized {} as {} {}", command.Name(), op.http_method, target);
    return req;
}

models::Result ParseJsonResult(const core::Command& command, const network::HttpResponse& response) {
    const auto& body = response.body();
    if (body.empty()) return models::Result{};

    boost::system::error_code ec;
    json::value jv = json::parse(body, ec);
    if (ec) {
        throw std::runtime_error("Unable to parse " + command.Name() +
                                 " response as JSON: " + ec.message());
    }
    if (!jv.is_object()) {
        throw std::runtime_error("Expected a JSON object in the " + command.Name() + " response");
    }
    return models::Result(std::move(jv.get_object()));
}

std::optional<models::ErrorShape> ParseJsonError(const network::HttpResponse& response) {
    models::ErrorShape shape;
    shape.type = response.result_int() < 500 ? "client" : "server";

    if (auto it = response.find("x-amzn-RequestId"); it != response.end()) {
        shape.request_id = std::string(it->value());
    } else if (auto rid = response.find("x-amz-request-id"); rid != response.end()) {
        shape.request_id = std::string(rid->value());
    }

    std::string code;
    if (auto it = response.find("x-amzn-ErrorType"); it != response.end()) {
        code = std::string(it->value());
        code = code.substr(0, code.find(':'));
    }

    boost::system::error_code ec;
    json::value jv = json::parse(response.body(), ec);
    if (!ec && jv.is_object()) {
        const auto& obj = jv.get_object();
        if (code.empty()) {
            for (const char* key : {"__type", "code", "Code"}) {
                if (const auto* v = obj.if_contains(key); v && v->is_string()) {
                    code = std::string(v->get_string());
                    break;
                }
            }
        }
        for (const char* key : {"message", "Message", "errorMessage"}) {
            if (const auto* v = obj.if_contains(key); v && v->is_string()) {
                shape.message = std::string(v->get_string());
                break;
            }
        }
    }

    // "com.amazonaws.dynamodb.v20120810#ResourceNotFoundException" -> "ResourceNotFoundException"
    if (auto hash = code.rfind('#'); hash != std::string::npos) {
        code = code.substr(hash + 1);
    } else if (auto dot = code.rfind('.'); dot != std::string::npos) {
        code = code.substr(dot + 1);
    }

    if (code.empty()) return std::nullopt;
    shape.code = std::move(code);
    return shape;
}

ProtocolHandlers ForProtocol(std::string_view protocol) {
    if (protocol == "json") {
        return {SerializeJson, ParseJsonResult, ParseJsonError};
    }
    if (protocol == "rest-json") {
        return {SerializeRestJson, ParseJsonResult, ParseJsonError};
    }
    throw std::invalid_argument("No built-in handlers for protocol: " + std::string(protocol));
}

}  // namespace courier::infra::protocols
