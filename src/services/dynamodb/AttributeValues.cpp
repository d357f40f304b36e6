#include "AttributeValues.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <stdexcept>

namespace courier::services::dynamodb {

std::string NumberText(const json::value& number) {
    switch (number.kind()) {
        case json::kind::int64:
            return std::to_string(number.get_int64());
        case json::kind::uint64:
            return std::to_string(number.get_uint64());
        case json::kind::double_: {
            std::array<char, 32> buf{};
            auto [end, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), number.get_double());
            if (ec != std::errc()) {
                throw std::invalid_argument("Cannot format number");
            }
            return std::string(buf.data(), end);
        }
        default:
            throw std::invalid_argument("Expected a JSON number");
    }
}

json::value ParseNumber(std::string_view text) {
    const char* first = text.data();
    const char* last = text.data() + text.size();

    std::int64_t integer = 0;
    if (auto [end, ec] = std::from_chars(first, last, integer); ec == std::errc() && end == last) {
        return json::value(integer);
    }
    std::uint64_t unsigned_integer = 0;
    if (auto [end, ec] = std::from_chars(first, last, unsigned_integer);
        ec == std::errc() && end == last) {
        return json::value(unsigned_integer);
    }
    double real = 0;
    if (auto [end, ec] = std::from_chars(first, last, real); ec == std::errc() && end == last) {
        return json::value(real);
    }
    throw std::invalid_argument("Not a number: " + std::string(text));
}

SetValue::SetValue(std::string type, const std::vector<std::string>& members)
    : type_(std::move(type)) {
    if (type_ != "SS" && type_ != "NS" && type_ != "BS") {
        throw std::invalid_argument("Invalid set type. Must be BS, NS, or SS");
    }
    for (const auto& member : members) Insert(member);
}

SetValue SetValue::FromJson(std::string type, const json::array& members) {
    SetValue set(std::move(type));
    for (const auto& member : members) {
        if (member.is_string()) {
            set.Insert(std::string(member.get_string()));
        } else if (member.is_number()) {
            set.Insert(NumberText(member));
        } else {
            throw std::invalid_argument("Set members must be strings or numbers");
        }
    }
    return set;
}

const std::vector<std::string>& SetValue::Values() const {
    if (members_.empty()) {
        throw std::runtime_error("DynamoDB does not allow empty sets.");
    }
    return members_;
}

json::array SetValue::ToJson() const {
    json::array out;
    for (const auto& member : members_) {
        if (type_ == "NS") {
            out.push_back(ParseNumber(member));
        } else {
            out.emplace_back(member);
        }
    }
    return out;
}

bool SetValue::Insert(std::string member) {
    if (Contains(member)) return false;
    members_.push_back(std::move(member));
    return true;
}

bool SetValue::Contains(std::string_view member) const {
    return std::find(members_.begin(), members_.end(), member) != members_.end();
}

bool SetValue::Erase(std::string_view member) {
    auto it = std::find(members_.begin(), members_.end(), member);
    if (it == members_.end()) return false;
    members_.erase(it);
    return true;
}

}  // namespace courier::services::dynamodb
