#include "Marshaler.hpp"

#include <openssl/evp.h>

#include <stdexcept>
#include <utility>

namespace courier::services::dynamodb {

namespace {

std::string_view type_name(const json::value& value) {
    switch (value.kind()) {
        case json::kind::string:
            return "string";
        case json::kind::int64:
        case json::kind::uint64:
            return "integer";
        case json::kind::double_:
            return "double";
        case json::kind::bool_:
            return "boolean";
        case json::kind::array:
            return "array";
        case json::kind::object:
            return "object";
        case json::kind::null:
            return "NULL";
    }
    return "unknown";
}

std::string_view text_of(const json::value& value) {
    const json::string& s = value.as_string();
    return std::string_view(s.data(), s.size());
}

json::object attribute(std::string_view type, json::value value) {
    json::object out;
    out[type] = std::move(value);
    return out;
}

}  // namespace

std::string Base64Encode(std::string_view bytes) {
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(bytes.data()),
                                  static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::string Base64Decode(std::string_view text) {
    if (text.size() % 4 != 0) {
        throw std::runtime_error("Invalid base64 length");
    }
    std::string out(3 * (text.size() / 4), '\0');
    int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw std::runtime_error("Invalid base64 data");
    }
    // EVP_DecodeBlock counts the padding as decoded zero bytes.
    std::size_t padding = 0;
    for (auto it = text.rbegin(); it != text.rend() && *it == '=' && padding < 2; ++it) ++padding;
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

Marshaler::Marshaler(ErrorHandler on_error) : on_error_(std::move(on_error)) {}

json::object Marshaler::MarshalJson(std::string_view document) const {
    boost::system::error_code ec;
    json::value data = json::parse(document, ec);
    if (ec || !data.is_object()) {
        throw std::invalid_argument("The JSON document must be valid and be an object at its root.");
    }
    return MarshalItem(data.get_object());
}

json::object Marshaler::MarshalItem(const json::object& item) const {
    json::object out;
    for (const auto& [key, value] : item) {
        out[key] = MarshalValue(value);
    }
    return out;
}

json::object Marshaler::MarshalValue(const json::value& value) const {
    switch (value.kind()) {
        case json::kind::string:
            if (!value.get_string().empty()) return attribute("S", value);
            break;
        case json::kind::int64:
        case json::kind::uint64:
        case json::kind::double_:
            return attribute("N", json::string(NumberText(value)));
        case json::kind::bool_:
            return attribute("BOOL", value);
        case json::kind::null:
            return attribute("NULL", true);
        case json::kind::array: {
            json::array list;
            for (const auto& element : value.get_array()) list.emplace_back(MarshalValue(element));
            return attribute("L", std::move(list));
        }
        case json::kind::object:
            return attribute("M", MarshalItem(value.get_object()));
    }

    std::string_view type = type_name(value);
    if (on_error_) {
        if (auto replacement = on_error_(type, value)) return std::move(*replacement);
    }
    throw std::invalid_argument("Marshaling error: encountered unexpected type \"" +
                                std::string(type) + "\".");
}

json::object Marshaler::MarshalSet(const SetValue& set) const {
    json::array members;
    for (const auto& member : set.Values()) {
        members.emplace_back(set.Type() == "BS" ? Base64Encode(member) : member);
    }
    return attribute(set.Type(), std::move(members));
}

json::object Marshaler::MarshalBinary(const BinaryValue& binary) const {
    return attribute("B", json::string(Base64Encode(binary.ToString())));
}

json::object Marshaler::MarshalNumber(const NumberValue& number) const {
    return attribute("N", json::string(number.ToString()));
}

SetValue Marshaler::MakeSet(const json::array& members) const {
    if (members.empty()) {
        throw std::invalid_argument("Sets cannot be empty.");
    }
    json::object first = MarshalValue(members.front());
    if (first.size() != 1) {
        throw std::invalid_argument("Cannot infer the set type from the first member");
    }
    std::string type = std::string(first.begin()->key()) + "S";
    return SetValue::FromJson(std::move(type), members);
}

json::value Marshaler::UnmarshalValue(const json::object& attribute) const {
    if (attribute.size() != 1) {
        throw std::runtime_error("An attribute value must have exactly one type member");
    }
    const auto& [type, value] = *attribute.begin();

    if (type == "S" || type == "BOOL") return value;
    if (type == "NULL") return nullptr;
    if (type == "N") return ParseNumber(text_of(value));
    if (type == "B") return json::string(Base64Decode(text_of(value)));
    if (type == "M") return UnmarshalItem(value.as_object());
    if (type == "L") {
        json::array list;
        for (const auto& element : value.as_array()) list.push_back(UnmarshalValue(element.as_object()));
        return list;
    }
    if (type == "SS" || type == "NS" || type == "BS") {
        json::array members;
        for (const auto& member : value.as_array()) {
            std::string_view text = text_of(member);
            if (type == "NS") {
                members.push_back(ParseNumber(text));
            } else if (type == "BS") {
                members.emplace_back(Base64Decode(text));
            } else {
                members.push_back(member);
            }
        }
        return members;
    }
    throw std::runtime_error("Unexpected type: " + std::string(type) + ".");
}

json::object Marshaler::UnmarshalItem(const json::object& item) const {
    json::object out;
    for (const auto& [key, value] : item) {
        out[key] = UnmarshalValue(value.as_object());
    }
    return out;
}

std::string Marshaler::UnmarshalJson(const json::object& item) const {
    return json::serialize(UnmarshalItem(item));
}

}  // namespace courier::services::dynamodb
