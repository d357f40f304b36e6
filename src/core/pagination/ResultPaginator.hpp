#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "Result.hpp"
#include "ServiceDescription.hpp"
#include "types.hpp"

namespace courier::core {

// Single-pass iterator over anything with `std::optional<Value> Next()`.
template <class Source, class Value>
class PullIterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = const Value*;
    using reference = const Value&;

    PullIterator() = default;
    explicit PullIterator(Source* source) : source_(source) { Advance(); }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }

    PullIterator& operator++() {
        Advance();
        return *this;
    }
    void operator++(int) { Advance(); }

    friend bool operator==(const PullIterator& a, const PullIterator& b) {
        return a.source_ == b.source_;
    }

   private:
    void Advance() {
        current_ = source_->Next();
        if (!current_) source_ = nullptr;
    }

    Source* source_ = nullptr;
    std::optional<Value> current_;
};

/**
 * @brief Lazy, finite, single-pass sequence of result pages.
 *
 * Each `Next()` executes the operation with the base parameters plus the
 * continuation token taken from the previous page. The sequence ends when a
 * page carries no token (or `more_results` evaluates to false), or when a
 * page repeats the token that requested it. Errors from an execution
 * propagate and end the sequence.
 */
class ResultPaginator {
   public:
    using Executor =
        std::function<models::Result(const std::string& operation, const json::object& params)>;
    using iterator = PullIterator<ResultPaginator, models::Result>;

    ResultPaginator(Executor execute, std::string operation, json::object params,
                    models::PaginatorConfig config);

    std::optional<models::Result> Next();

    bool Exhausted() const noexcept { return exhausted_; }
    int RequestCount() const noexcept { return request_count_; }
    const std::string& OperationName() const noexcept { return operation_; }
    const models::PaginatorConfig& Config() const noexcept { return config_; }

    // Input parameters for the next page; empty before the first call.
    const json::object& NextToken() const noexcept { return next_token_; }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

   private:
    json::object ExtractToken(const models::Result& result) const;

    Executor execute_;
    std::string operation_;
    json::object params_;
    models::PaginatorConfig config_;

    json::object next_token_;
    int request_count_ = 0;
    bool exhausted_ = false;
};

/**
 * @brief Flattened items found under one path expression.
 *
 * Backed either by a paginator (pages fetched on demand) or by a single
 * already-fetched value. Arrays contribute each element, other non-null
 * values contribute themselves.
 */
class ItemSequence {
   public:
    using iterator = PullIterator<ItemSequence, json::value>;

    ItemSequence(ResultPaginator paginator, std::string expression);
    explicit ItemSequence(const json::value& items);

    std::optional<json::value> Next();

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

   private:
    void Buffer(const json::value& found);

    std::optional<ResultPaginator> paginator_;
    std::string expression_;
    std::deque<json::value> buffered_;
};

}  // namespace courier::core
