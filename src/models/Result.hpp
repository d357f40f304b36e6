#pragma once

#include <map>
#include <string>
#include <string_view>

#include "types.hpp"

namespace courier::models {

struct ResponseMetadata {
    unsigned int status_code = 0;
    std::string effective_uri;
    std::map<std::string, std::string> headers;
};

/**
 * @brief Parsed output of one operation.
 *
 * Holds the decoded response members as a JSON object plus the metadata of
 * the HTTP exchange that produced it.
 */
class Result {
   public:
    Result() = default;
    explicit Result(json::object data, ResponseMetadata metadata = {});

    const json::object& Data() const noexcept { return data_; }
    const ResponseMetadata& Metadata() const noexcept { return metadata_; }

    bool Has(std::string_view key) const;

    // Top-level member, or nullptr.
    const json::value* Get(std::string_view key) const;

    // Path expression over the data (see JsonPath.hpp); null when absent.
    json::value Search(std::string_view expression) const;

    std::string ToString() const;

   private:
    json::object data_;
    ResponseMetadata metadata_;
};

}  // namespace courier::models
