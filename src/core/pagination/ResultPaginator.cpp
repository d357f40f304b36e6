#include "ResultPaginator.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "JsonPath.hpp"

namespace courier::core {

ResultPaginator::ResultPaginator(Executor execute, std::string operation, json::object params,
                                 models::PaginatorConfig config)
    : execute_(std::move(execute)),
      operation_(std::move(operation)),
      params_(std::move(params)),
      config_(std::move(config)) {}

json::object ResultPaginator::ExtractToken(const models::Result& result) const {
    json::object token;
    if (!config_.more_results.empty()) {
        json::value more = result.Search(config_.more_results);
        if (infra::parsers::IsEmpty(more) || (more.is_bool() && !more.get_bool())) return token;
    }

    // Output and input tokens are paired by position.
    for (std::size_t i = 0; i < config_.output_token.size() && i < config_.input_token.size(); ++i) {
        json::value value = result.Search(config_.output_token[i]);
        if (!infra::parsers::IsEmpty(value)) token[config_.input_token[i]] = std::move(value);
    }
    return token;
}

std::optional<models::Result> ResultPaginator::Next() {
    if (exhausted_) return std::nullopt;

    json::object args = params_;
    for (const auto& [key, value] : next_token_) args[key] = value;

    ++request_count_;
    models::Result result;
    try {
        result = execute_(operation_, args);
    } catch (const std::exception&) {
        exhausted_ = true;
        throw;
    }

    json::object token = ExtractToken(result);
    if (token.empty()) {
        exhausted_ = true;
        spdlog::info("[paginator] {} exhausted after {} request(s)", operation_, request_count_);
    } else if (token == next_token_) {
        exhausted_ = true;
        spdlog::warn("[paginator] {} returned the token it was called with; stopping", operation_);
    } else {
        spdlog::debug("[paginator] {} page {} has a continuation token", operation_,
                      request_count_);
    }
    next_token_ = std::move(token);
    return result;
}

ItemSequence::ItemSequence(ResultPaginator paginator, std::string expression)
    : paginator_(std::move(paginator)), expression_(std::move(expression)) {}

ItemSequence::ItemSequence(const json::value& items) { Buffer(items); }

void ItemSequence::Buffer(const json::value& found) {
    if (found.is_array()) {
        for (const auto& item : found.get_array()) buffered_.push_back(item);
    } else if (!found.is_null()) {
        buffered_.push_back(found);
    }
}

std::optional<json::value> ItemSequence::Next() {
    while (buffered_.empty()) {
        if (!paginator_) return std::nullopt;
        auto page = paginator_->Next();
        if (!page) {
            paginator_.reset();
            return std::nullopt;
        }
        Buffer(page->Search(expression_));
    }
    json::value item = std::move(buffered_.front());
    buffered_.pop_front();
    return item;
}

}  // namespace courier::core
