#include "JsonPath.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace courier::infra::parsers {

namespace {

struct Step {
    enum class Kind { Field, Index, Flatten };
    Kind kind;
    std::string name;
    std::int64_t index = 0;
};

struct Outcome {
    json::value value;
    bool projected = false;
};

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-' || c == '$' ||
           c == '@';
}

[[noreturn]] void malformed(std::string_view expression, const char* why) {
    throw std::invalid_argument("Malformed path expression '" + std::string(expression) +
                                "': " + why);
}

std::vector<Step> tokenize(std::string_view expression) {
    std::vector<Step> steps;
    std::size_t pos = 0;
    bool expect_field = true;

    while (pos < expression.size()) {
        char c = expression[pos];

        if (c == '.') {
            if (expect_field) malformed(expression, "unexpected '.'");
            expect_field = true;
            ++pos;
            continue;
        }

        if (c == '[') {
            auto close = expression.find(']', pos);
            if (close == std::string_view::npos) malformed(expression, "unterminated '['");

            std::string_view inner = expression.substr(pos + 1, close - pos - 1);
            if (inner.empty()) {
                steps.push_back({Step::Kind::Flatten, {}, 0});
            } else {
                std::int64_t index = 0;
                auto [ptr, ec] = std::from_chars(inner.data(), inner.data() + inner.size(), index);
                if (ec != std::errc() || ptr != inner.data() + inner.size()) {
                    malformed(expression, "index must be an integer");
                }
                steps.push_back({Step::Kind::Index, {}, index});
            }
            expect_field = false;
            pos = close + 1;
            continue;
        }

        if (!expect_field || !is_identifier_char(c)) {
            malformed(expression, "unexpected character");
        }

        std::size_t end = pos;
        while (end < expression.size() && is_identifier_char(expression[end])) ++end;
        steps.push_back({Step::Kind::Field, std::string(expression.substr(pos, end - pos)), 0});
        expect_field = false;
        pos = end;
    }

    if (expect_field && !steps.empty()) malformed(expression, "trailing '.'");
    return steps;
}

Outcome evaluate(const json::value& current, const std::vector<Step>& steps, std::size_t i) {
    if (i == steps.size()) return {current, false};

    const Step& step = steps[i];
    switch (step.kind) {
        case Step::Kind::Field: {
            const auto* obj = current.if_object();
            if (!obj) return {};
            auto it = obj->find(step.name);
            if (it == obj->end()) return {};
            return evaluate(it->value(), steps, i + 1);
        }
        case Step::Kind::Index: {
            const auto* arr = current.if_array();
            if (!arr) return {};
            auto size = static_cast<std::int64_t>(arr->size());
            auto idx = step.index < 0 ? size + step.index : step.index;
            if (idx < 0 || idx >= size) return {};
            return evaluate((*arr)[static_cast<std::size_t>(idx)], steps, i + 1);
        }
        case Step::Kind::Flatten: {
            const auto* arr = current.if_array();
            if (!arr) return {};

            json::array flattened;
            for (const auto& element : *arr) {
                if (const auto* nested = element.if_array()) {
                    for (const auto& item : *nested) flattened.push_back(item);
                } else {
                    flattened.push_back(element);
                }
            }

            json::array projected;
            for (const auto& item : flattened) {
                Outcome sub = evaluate(item, steps, i + 1);
                if (sub.value.is_null()) continue;
                if (sub.projected && sub.value.is_array()) {
                    for (const auto& v : sub.value.get_array()) projected.push_back(v);
                } else {
                    projected.push_back(std::move(sub.value));
                }
            }
            return {json::value(std::move(projected)), true};
        }
    }
    return {};
}

}  // namespace

json::value Search(const json::value& root, std::string_view expression) {
    if (expression.empty()) return root;
    return evaluate(root, tokenize(expression), 0).value;
}

bool IsEmpty(const json::value& value) noexcept {
    switch (value.kind()) {
        case json::kind::null:
            return true;
        case json::kind::string:
            return value.get_string().empty();
        case json::kind::array:
            return value.get_array().empty();
        case json::kind::object:
            return value.get_object().empty();
        default:
            return false;
    }
}

}  // namespace courier::infra::parsers
