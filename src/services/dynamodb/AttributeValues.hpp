#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "types.hpp"

namespace courier::services::dynamodb {

// Shortest text of a JSON number ("3", "1.5", "1e+100").
// @throws std::invalid_argument for a non-number.
std::string NumberText(const json::value& number);

// Integer when the text is integral and fits in 64 bits, double otherwise.
// @throws std::invalid_argument when the text is not a number.
json::value ParseNumber(std::string_view text);

// Binary (B) attribute. Holds raw bytes; base64 only on the wire.
class BinaryValue {
   public:
    explicit BinaryValue(std::string bytes) : bytes_(std::move(bytes)) {}

    const std::string& ToString() const noexcept { return bytes_; }
    json::value ToJson() const { return json::string(bytes_); }

    friend bool operator==(const BinaryValue& a, const BinaryValue& b) {
        return a.bytes_ == b.bytes_;
    }

   private:
    std::string bytes_;
};

// Number (N) attribute kept as text, so precision is never lost to a double.
class NumberValue {
   public:
    explicit NumberValue(std::string text) : text_(std::move(text)) {}

    const std::string& ToString() const noexcept { return text_; }
    json::value ToJson() const { return json::string(text_); }

   private:
    std::string text_;
};

/**
 * @brief Set (SS, NS, BS) attribute.
 *
 * Members are unique and keep their insertion order. They are stored as
 * text; `ToJson()` renders NS members back as numbers.
 */
class SetValue {
   public:
    using const_iterator = std::vector<std::string>::const_iterator;

    // @throws std::invalid_argument unless `type` is SS, NS or BS.
    explicit SetValue(std::string type, const std::vector<std::string>& members = {});

    // Members given as JSON scalars; numbers are kept as their text.
    static SetValue FromJson(std::string type, const json::array& members);

    const std::string& Type() const noexcept { return type_; }

    // @throws std::runtime_error for an empty set.
    const std::vector<std::string>& Values() const;

    json::array ToJson() const;

    // False when the member was already present.
    bool Insert(std::string member);
    bool Contains(std::string_view member) const;
    bool Erase(std::string_view member);

    std::size_t Size() const noexcept { return members_.size(); }
    bool Empty() const noexcept { return members_.empty(); }

    const_iterator begin() const noexcept { return members_.begin(); }
    const_iterator end() const noexcept { return members_.end(); }

   private:
    std::string type_;
    std::vector<std::string> members_;
};

}  // namespace courier::services::dynamodb
