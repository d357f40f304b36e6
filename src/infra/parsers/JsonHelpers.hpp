#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "types.hpp"

namespace courier::infra::parsers {

template <class T>
T require(const json::object& obj, const char* key) {
    if (!obj.contains(key)) {
        throw std::invalid_argument(std::string("Missing required key: ") + key);
    }
    try {
        return json::value_to<T>(obj.at(key));
    } catch (const std::exception& e) {
        throw std::invalid_argument(std::string("Failed to parse key '") + key + "': " + e.what());
    }
}

template <class T>
T get_or(const json::object& obj, const char* key, T default_val) {
    if (!obj.contains(key) || obj.at(key).is_null()) return default_val;
    try {
        return json::value_to<T>(obj.at(key));
    } catch (const std::exception&) {
        return default_val;
    }
}

// Accepts either a single string or an array of strings.
inline std::vector<std::string> string_list(const json::object& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.find(key);
    if (it == obj.end() || it->value().is_null()) return out;

    if (const auto* s = it->value().if_string()) {
        out.emplace_back(*s);
        return out;
    }
    if (const auto* arr = it->value().if_array()) {
        for (const auto& v : *arr) {
            if (!v.is_string()) {
                throw std::invalid_argument(std::string("Expected strings in '") + key + "'");
            }
            out.emplace_back(v.get_string());
        }
        return out;
    }
    throw std::invalid_argument(std::string("Expected a string or array for '") + key + "'");
}

// Seconds as int or double, converted to milliseconds.
inline long long seconds_to_ms(const json::value& v) {
    if (v.is_int64()) return v.get_int64() * 1000;
    if (v.is_uint64()) return static_cast<long long>(v.get_uint64()) * 1000;
    if (v.is_double()) return static_cast<long long>(v.get_double() * 1000.0);
    throw std::invalid_argument("Expected a number of seconds");
}

}  // namespace courier::infra::parsers
