#include "Result.hpp"

#include <utility>

#include "JsonPath.hpp"

namespace courier::models {

Result::Result(json::object data, ResponseMetadata metadata)
    : data_(std::move(data)), metadata_(std::move(metadata)) {}

bool Result::Has(std::string_view key) const { return data_.contains(key); }

const json::value* Result::Get(std::string_view key) const { return data_.if_contains(key); }

json::value Result::Search(std::string_view expression) const {
    return infra::parsers::Search(json::value(data_), expression);
}

std::string Result::ToString() const { return json::serialize(data_); }

}  // namespace courier::models
