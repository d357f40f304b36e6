#pragma once

#include <string>

#include "types.hpp"

namespace courier::models {

// Normalized error fields extracted from a service error body.
struct ErrorShape {
    std::string code;
    std::string type;  // "client" or "server"
    std::string message;
    std::string request_id;

    json::object ToJson() const {
        json::object obj;
        obj["code"] = code;
        obj["type"] = type;
        obj["message"] = message;
        obj["request_id"] = request_id;
        return obj;
    }
};

}  // namespace courier::models
