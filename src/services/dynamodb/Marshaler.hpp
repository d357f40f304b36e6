#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "AttributeValues.hpp"
#include "types.hpp"

namespace courier::services::dynamodb {

/**
 * @brief Converts JSON documents to DynamoDB items and back.
 *
 * Marshaled attribute values have the `{TYPE: VALUE}` form the DynamoDB API
 * expects: strings become `S`, numbers `N` (as text), booleans `BOOL`, null
 * `{"NULL": true}`, arrays `L` and objects `M`. Sets, binaries and exact
 * numbers have their own entry points since plain JSON cannot express them.
 */
class Marshaler {
   public:
    /**
     * @brief Called with the JSON type name and the value for anything that
     * cannot be marshaled (an empty string). Returning an attribute value
     * replaces it; returning nothing lets the marshaler throw.
     */
    using ErrorHandler =
        std::function<std::optional<json::object>(std::string_view type, const json::value& value)>;

    explicit Marshaler(ErrorHandler on_error = {});

    // @throws std::invalid_argument unless `document` is a JSON object.
    json::object MarshalJson(std::string_view document) const;

    json::object MarshalItem(const json::object& item) const;

    // @throws std::invalid_argument for a value that cannot be marshaled.
    json::object MarshalValue(const json::value& value) const;

    json::object MarshalSet(const SetValue& set) const;
    json::object MarshalBinary(const BinaryValue& binary) const;
    json::object MarshalNumber(const NumberValue& number) const;

    /**
     * @brief Builds a set whose type follows its first member (SS or NS).
     * @throws std::invalid_argument for an empty list or unsupported members.
     */
    SetValue MakeSet(const json::array& members) const;

    /**
     * @brief Decodes one attribute value. Numbers are coerced to integers or
     * doubles, binaries are base64-decoded and sets become arrays.
     * @throws std::runtime_error for an unknown or malformed attribute.
     */
    json::value UnmarshalValue(const json::object& attribute) const;

    json::object UnmarshalItem(const json::object& item) const;

    std::string UnmarshalJson(const json::object& item) const;

   private:
    ErrorHandler on_error_;
};

std::string Base64Encode(std::string_view bytes);

// @throws std::runtime_error for malformed input.
std::string Base64Decode(std::string_view text);

}  // namespace courier::services::dynamodb
