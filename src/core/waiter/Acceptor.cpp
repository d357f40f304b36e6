#include "Acceptor.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace courier::core {

namespace {

bool status_equals(const json::value& expected, unsigned int status) {
    if (expected.is_int64()) return expected.get_int64() == static_cast<std::int64_t>(status);
    if (expected.is_uint64()) return expected.get_uint64() == status;
    if (expected.is_double()) return expected.get_double() == static_cast<double>(status);
    if (expected.is_string()) return expected.get_string() == std::to_string(status);
    return false;
}

}  // namespace

bool AcceptorMatches(const models::AcceptorConfig& acceptor, const models::Result* result,
                     const ServiceException* error) {
    using models::AcceptorMatcher;

    switch (acceptor.matcher) {
        case AcceptorMatcher::Path:
            return result != nullptr && result->Search(acceptor.argument) == acceptor.expected;

        case AcceptorMatcher::PathAll: {
            if (result == nullptr) return false;
            json::value found = result->Search(acceptor.argument);
            if (!found.is_array() || found.get_array().empty()) return false;
            const auto& items = found.get_array();
            return std::all_of(items.begin(), items.end(),
                               [&](const json::value& v) { return v == acceptor.expected; });
        }

        case AcceptorMatcher::PathAny: {
            if (result == nullptr) return false;
            json::value found = result->Search(acceptor.argument);
            if (!found.is_array()) return false;
            const auto& items = found.get_array();
            return std::any_of(items.begin(), items.end(),
                               [&](const json::value& v) { return v == acceptor.expected; });
        }

        case AcceptorMatcher::Status: {
            unsigned int status = result != nullptr ? result->Metadata().status_code
                                                    : error->StatusCode();
            return status != 0 && status_equals(acceptor.expected, status);
        }

        case AcceptorMatcher::Error:
            return error != nullptr && acceptor.expected.is_string() &&
                   error->ErrorCode() == acceptor.expected.get_string();
    }
    return false;
}

}  // namespace courier::core
