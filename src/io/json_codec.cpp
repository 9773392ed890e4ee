// EN: Implementation of the JSON codec.
// FR: Implémentation du codec JSON.

#include "io/json_codec.hpp"

#include <limits>

namespace BJS::IO {

Value fromJson(const nlohmann::json& json) {
    switch (json.type()) {
        case nlohmann::json::value_t::null:
            return Value();
        case nlohmann::json::value_t::boolean:
            return Value(json.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return Value(json.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned: {
            const uint64_t number = json.get<uint64_t>();
            if (number > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw ParseError("integer " + std::to_string(number) + " does not fit in 64 bits");
            }
            return Value(static_cast<int64_t>(number));
        }
        case nlohmann::json::value_t::number_float:
            return Value(json.get<double>());
        case nlohmann::json::value_t::string:
            return Value(json.get<std::string>());
        case nlohmann::json::value_t::array: {
            Value::List items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(fromJson(item));
            }
            return Value(std::move(items));
        }
        case nlohmann::json::value_t::object: {
            Value::Map members;
            for (auto it = json.begin(); it != json.end(); ++it) {
                members.emplace(it.key(), fromJson(it.value()));
            }
            return Value(std::move(members));
        }
        default:
            throw ParseError(std::string("unsupported JSON value of type ") + json.type_name());
    }
}

nlohmann::json toJson(const Value& value) {
    switch (value.type()) {
        case ValueType::NONE:     return nullptr;
        case ValueType::BOOLEAN:  return value.as<bool>();
        case ValueType::INTEGER:  return value.as<int64_t>();
        case ValueType::FLOAT:    return value.as<double>();
        case ValueType::STRING:   return value.as<std::string>();
        case ValueType::DATE:     return value.as<Date>().toIsoFormat();
        case ValueType::TIME:     return value.as<Time>().toIsoFormat();
        case ValueType::DATETIME: return value.as<DateTime>().toIsoFormat();
        case ValueType::LIST: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : value.as<Value::List>()) {
                array.push_back(toJson(item));
            }
            return array;
        }
        default: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& [key, item] : value.as<Value::Map>()) {
                object[key] = toJson(item);
            }
            return object;
        }
    }
}

nlohmann::json parseJsonDocument(const std::string& text) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("malformed JSON: ") + e.what());
    }
}

Value parseJson(const std::string& text) {
    return fromJson(parseJsonDocument(text));
}

std::string dumpJson(const Value& value, int indent) {
    return toJson(value).dump(indent);
}

} // namespace BJS::IO
