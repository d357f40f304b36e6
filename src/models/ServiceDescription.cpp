#include "ServiceDescription.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "JsonHelpers.hpp"

namespace courier::models {

namespace {

using infra::parsers::get_or;
using infra::parsers::require;

json::object read_json_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Cannot open service description: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    boost::system::error_code ec;
    json::value doc = json::parse(ss.str(), ec);
    if (ec) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + ec.message());
    }
    if (!doc.is_object()) {
        throw std::runtime_error("JSON root must be an object in " + path.string());
    }
    return std::move(doc.get_object());
}

PaginatorConfig parse_paginator(const json::object& obj) {
    PaginatorConfig cfg;
    cfg.input_token = infra::parsers::string_list(obj, "input_token");
    cfg.output_token = infra::parsers::string_list(obj, "output_token");
    cfg.result_key = infra::parsers::string_list(obj, "result_key");
    cfg.limit_key = get_or<std::string>(obj, "limit_key", "");
    cfg.more_results = get_or<std::string>(obj, "more_results", "");

    if (cfg.input_token.size() != cfg.output_token.size()) {
        throw std::invalid_argument("Paginator input_token and output_token must pair up");
    }
    return cfg;
}

WaiterConfig parse_waiter(const std::string& name, const json::object& obj) {
    WaiterConfig cfg;
    cfg.operation = require<std::string>(obj, "operation");

    if (auto it = obj.find("delay"); it != obj.end()) {
        cfg.delay = std::chrono::milliseconds(infra::parsers::seconds_to_ms(it->value()));
    }
    cfg.max_attempts = get_or<int>(obj, "maxAttempts", cfg.max_attempts);
    if (cfg.max_attempts < 1) {
        throw std::invalid_argument("Waiter " + name + " must allow at least one attempt");
    }

    for (const auto& v : require<json::array>(obj, "acceptors")) {
        const auto& acc = v.as_object();
        AcceptorConfig a;
        a.state = ParseAcceptorState(require<std::string>(acc, "state"));
        a.matcher = ParseAcceptorMatcher(require<std::string>(acc, "matcher"));
        a.argument = get_or<std::string>(acc, "argument", "");
        a.expected = acc.contains("expected") ? acc.at("expected") : json::value();
        cfg.acceptors.push_back(std::move(a));
    }
    return cfg;
}

}  // namespace

AcceptorState ParseAcceptorState(std::string_view state) {
    if (state == "success") return AcceptorState::Success;
    if (state == "failure") return AcceptorState::Failure;
    if (state == "retry") return AcceptorState::Retry;
    throw std::invalid_argument("Unknown acceptor state: " + std::string(state));
}

AcceptorMatcher ParseAcceptorMatcher(std::string_view matcher) {
    if (matcher == "path") return AcceptorMatcher::Path;
    if (matcher == "pathAll") return AcceptorMatcher::PathAll;
    if (matcher == "pathAny") return AcceptorMatcher::PathAny;
    if (matcher == "status") return AcceptorMatcher::Status;
    if (matcher == "error") return AcceptorMatcher::Error;
    throw std::invalid_argument("Unknown acceptor matcher: " + std::string(matcher));
}

std::string_view ToString(AcceptorState state) noexcept {
    switch (state) {
        case AcceptorState::Success:
            return "success";
        case AcceptorState::Failure:
            return "failure";
        case AcceptorState::Retry:
            return "retry";
    }
    return "unknown";
}

ServiceDescription ServiceDescription::FromJson(const json::object& api,
                                                const json::object* paginators,
                                                const json::object* waiters) {
    ServiceDescription d;

    const auto& meta = require<json::object>(api, "metadata");
    d.endpoint_prefix_ = require<std::string>(meta, "endpointPrefix");
    d.service_full_name_ = get_or<std::string>(meta, "serviceFullName", d.endpoint_prefix_);
    d.signing_name_ = get_or<std::string>(meta, "signingName", d.endpoint_prefix_);
    d.protocol_ = get_or<std::string>(meta, "protocol", "json");
    d.signature_version_ = get_or<std::string>(meta, "signatureVersion", "v4");
    d.json_version_ = get_or<std::string>(meta, "jsonVersion", "1.0");
    d.target_prefix_ = get_or<std::string>(meta, "targetPrefix", "");
    d.api_version_ = get_or<std::string>(meta, "apiVersion", "");

    for (const auto& [key, value] : require<json::object>(api, "operations")) {
        OperationModel op;
        op.name = std::string(key);
        if (const auto* obj = value.if_object()) {
            if (auto it = obj->find("http"); it != obj->end() && it->value().is_object()) {
                const auto& http_obj = it->value().get_object();
                op.http_method = get_or<std::string>(http_obj, "method", op.http_method);
                op.request_uri = get_or<std::string>(http_obj, "requestUri", op.request_uri);
            }
        }
        d.operations_.emplace(op.name, std::move(op));
    }

    auto load_paginators = [&d](const json::object& root) {
        for (const auto& [key, value] : root) {
            d.paginators_[std::string(key)] = parse_paginator(value.as_object());
        }
    };
    auto load_waiters = [&d](const json::object& root) {
        for (const auto& [key, value] : root) {
            std::string name(key);
            d.waiters_[name] = parse_waiter(name, value.as_object());
        }
    };

    if (auto it = api.find("pagination"); it != api.end()) load_paginators(it->value().as_object());
    if (auto it = api.find("waiters"); it != api.end()) load_waiters(it->value().as_object());
    if (paginators) load_paginators(require<json::object>(*paginators, "pagination"));
    if (waiters) load_waiters(require<json::object>(*waiters, "waiters"));

    spdlog::debug("Loaded description for {} ({} operations, {} paginators, {} waiters)",
                  d.service_full_name_, d.operations_.size(), d.paginators_.size(),
                  d.waiters_.size());
    return d;
}

std::shared_ptr<const ServiceDescription> ServiceDescription::LoadFile(
    const std::filesystem::path& api_path,
    const std::optional<std::filesystem::path>& paginators_path,
    const std::optional<std::filesystem::path>& waiters_path) {
    json::object api = read_json_file(api_path);

    std::optional<json::object> paginators;
    std::optional<json::object> waiters;
    if (paginators_path) paginators = read_json_file(*paginators_path);
    if (waiters_path) waiters = read_json_file(*waiters_path);

    try {
        return std::make_shared<const ServiceDescription>(
            FromJson(api, paginators ? &*paginators : nullptr, waiters ? &*waiters : nullptr));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid service description " + api_path.string() + ": " +
                                 e.what());
    }
}

bool ServiceDescription::HasOperation(std::string_view name) const {
    return operations_.find(name) != operations_.end();
}

const OperationModel& ServiceDescription::Operation(std::string_view name) const {
    auto it = operations_.find(name);
    if (it == operations_.end()) {
        throw std::invalid_argument("Operation not found: " + std::string(name));
    }
    return it->second;
}

std::vector<std::string> ServiceDescription::OperationNames() const {
    std::vector<std::string> names;
    names.reserve(operations_.size());
    for (const auto& [name, _] : operations_) names.push_back(name);
    return names;
}

std::optional<PaginatorConfig> ServiceDescription::PaginationTemplate(
    std::string_view operation) const {
    auto it = paginators_.find(operation);
    if (it == paginators_.end()) return std::nullopt;
    return it->second;
}

std::optional<WaiterConfig> ServiceDescription::WaitTemplate(std::string_view waiter) const {
    auto it = waiters_.find(waiter);
    if (it == waiters_.end()) return std::nullopt;
    return it->second;
}

const std::string& ServiceDescription::SigningName() const noexcept { return signing_name_; }

}  // namespace courier::models
