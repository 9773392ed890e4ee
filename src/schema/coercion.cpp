// EN: Implementation of the coercion resolver and the built-in coercions.
// FR: Implémentation du résolveur de coercition et des coercitions intégrées.

#include "schema/coercion.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace BJS::Schema {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(first, last - first + 1);
}

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

[[noreturn]] void unsupported(ValueType target, const Value& value) {
    throw ValueTypeError("cannot convert value of type " + valueTypeToString(value.type()) +
                         " to " + valueTypeToString(target));
}

Value parseInteger(const std::string& raw) {
    const std::string text = trim(raw);
    const bool has_digits = !text.empty() &&
        std::all_of(text.begin() + ((text[0] == '-' || text[0] == '+') ? 1 : 0), text.end(),
                    [](unsigned char c) { return std::isdigit(c); }) &&
        text.find_first_of("0123456789") != std::string::npos;
    if (!has_digits) {
        throw CoercionError("invalid literal for integer: " + Value(raw).repr());
    }
    errno = 0;
    const long long parsed = std::strtoll(text.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        throw CoercionError("integer literal out of range: " + Value(raw).repr());
    }
    return Value(static_cast<int64_t>(parsed));
}

Value parseFloat(const std::string& raw) {
    const std::string text = trim(raw);
    char* end = nullptr;
    const double parsed = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        throw CoercionError("could not convert string to float: " + Value(raw).repr());
    }
    return Value(parsed);
}

Value truncateToInteger(double number) {
    if (std::isnan(number) || std::isinf(number)) {
        throw CoercionError("cannot convert float " + formatFloat(number) + " to integer");
    }
    const double truncated = std::trunc(number);
    if (truncated < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
        truncated >= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        throw CoercionError("float " + formatFloat(number) + " is out of integer range");
    }
    return Value(static_cast<int64_t>(truncated));
}

Value mapFromPairs(const Value::List& items) {
    Value::Map result;
    for (std::size_t i = 0; i < items.size(); ++i) {
        const Value::List* pair = items[i].tryAs<Value::List>();
        if (!pair) {
            throw ValueTypeError("map update sequence element #" + std::to_string(i) + " is not a list");
        }
        if (pair->size() != 2) {
            throw CoercionError("map update sequence element #" + std::to_string(i) + " has length " +
                                std::to_string(pair->size()) + "; 2 is required");
        }
        result[(*pair)[0].as<std::string>()] = (*pair)[1];
    }
    return Value(std::move(result));
}

} // namespace

// EN: CoercionPolicy
// FR: Politique de coercition
CoercionPolicy CoercionPolicy::automatic() {
    return CoercionPolicy(Mode::AUTOMATIC, {}, "automatic");
}

CoercionPolicy CoercionPolicy::disabled() {
    return CoercionPolicy(Mode::DISABLED, {}, "disabled");
}

CoercionPolicy CoercionPolicy::custom(CoerceFunction function, std::string name) {
    if (!function) {
        throw ConfigurationError("custom coercion '" + name + "' must be a callable function");
    }
    return CoercionPolicy(Mode::CUSTOM, std::move(function), std::move(name));
}

std::string CoercionPolicy::toString() const {
    return name_;
}

// EN: Built-in coercions
// FR: Coercitions intégrées
namespace Coercions {

Value booleanFlag(const Value& value) {
    if (value.is(ValueType::BOOLEAN)) {
        return value;
    }
    if (const std::string* text = value.tryAs<std::string>()) {
        const std::string flag = lower(trim(*text));
        if (flag == "1" || flag == "y" || flag == "yes" || flag == "true" || flag == "on") {
            return Value(true);
        }
        if (flag == "0" || flag == "n" || flag == "no" || flag == "false" || flag == "off") {
            return Value(false);
        }
        throw CoercionError("cannot convert given value flag to boolean: " + Value(flag).repr());
    }
    throw ValueTypeError("cannot convert given value flag to boolean: " + value.repr());
}

Value isoDate(const Value& value) {
    if (value.is(ValueType::DATE)) {
        return value;
    }
    if (const std::string* text = value.tryAs<std::string>()) {
        return Value(Date::fromIsoFormat(*text));
    }
    unsupported(ValueType::DATE, value);
}

Value isoTime(const Value& value) {
    if (value.is(ValueType::TIME)) {
        return value;
    }
    if (const std::string* text = value.tryAs<std::string>()) {
        return Value(Time::fromIsoFormat(*text));
    }
    unsupported(ValueType::TIME, value);
}

Value isoDateTime(const Value& value) {
    if (value.is(ValueType::DATETIME)) {
        return value;
    }
    if (const std::string* text = value.tryAs<std::string>()) {
        return Value(DateTime::fromIsoFormat(*text));
    }
    unsupported(ValueType::DATETIME, value);
}

Value strict(const Value& value) {
    return value;
}

Value constructAs(ValueType target, const Value& value) {
    switch (target) {
        case ValueType::ANY:
            return value;
        case ValueType::NONE:
            if (value.isNone()) {
                return value;
            }
            unsupported(target, value);
        case ValueType::BOOLEAN:
            return Value(value.truthy());
        case ValueType::INTEGER:
            switch (value.type()) {
                case ValueType::INTEGER: return value;
                case ValueType::BOOLEAN: return Value(static_cast<int64_t>(value.as<bool>() ? 1 : 0));
                case ValueType::FLOAT:   return truncateToInteger(value.as<double>());
                case ValueType::STRING:  return parseInteger(value.as<std::string>());
                default:                 unsupported(target, value);
            }
        case ValueType::FLOAT:
            if (value.isNumber()) {
                return Value(value.toDouble());
            }
            if (const std::string* text = value.tryAs<std::string>()) {
                return parseFloat(*text);
            }
            unsupported(target, value);
        case ValueType::STRING:
            return Value(value.toString());
        case ValueType::DATE:
            return isoDate(value);
        case ValueType::TIME:
            return isoTime(value);
        case ValueType::DATETIME:
            return isoDateTime(value);
        case ValueType::LIST:
            switch (value.type()) {
                case ValueType::LIST:
                    return value;
                case ValueType::STRING: {
                    Value::List characters;
                    for (auto& character : utf8Split(value.as<std::string>())) {
                        characters.emplace_back(std::move(character));
                    }
                    return Value(std::move(characters));
                }
                case ValueType::MAP: {
                    Value::List keys;
                    for (const auto& entry : value.as<Value::Map>()) {
                        keys.emplace_back(entry.first);
                    }
                    return Value(std::move(keys));
                }
                default:
                    unsupported(target, value);
            }
        case ValueType::MAP:
            if (value.is(ValueType::MAP)) {
                return value;
            }
            if (const Value::List* items = value.tryAs<Value::List>()) {
                return mapFromPairs(*items);
            }
            unsupported(target, value);
    }
    unsupported(target, value);
}

} // namespace Coercions

// EN: CoercionRegistry
// FR: Registre de coercition
CoercionRegistry& CoercionRegistry::getInstance() {
    static CoercionRegistry instance;
    return instance;
}

CoercionRegistry::CoercionRegistry() {
    registerBuiltins();
}

void CoercionRegistry::registerBuiltins() {
    coercions_[ValueType::DATE] = Coercions::isoDate;
    coercions_[ValueType::TIME] = Coercions::isoTime;
    coercions_[ValueType::DATETIME] = Coercions::isoDateTime;
    coercions_[ValueType::BOOLEAN] = Coercions::booleanFlag;

    named_["boolean_flag"] = Coercions::booleanFlag;
    named_["iso_date"] = Coercions::isoDate;
    named_["iso_time"] = Coercions::isoTime;
    named_["iso_datetime"] = Coercions::isoDateTime;
    named_["strict"] = Coercions::strict;
}

void CoercionRegistry::registerCoercion(ValueType type, CoerceFunction function) {
    if (!function) {
        throw ConfigurationError("coercion for " + valueTypeToString(type) + " must be a callable function");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        coercions_[type] = std::move(function);
    }
    LOG_DEBUG("coercion", "Coercion registered for type: " + valueTypeToString(type));
}

void CoercionRegistry::unregisterCoercion(ValueType type) {
    std::lock_guard<std::mutex> lock(mutex_);
    coercions_.erase(type);
}

bool CoercionRegistry::hasCoercion(ValueType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return coercions_.count(type) > 0;
}

std::optional<CoerceFunction> CoercionRegistry::lookup(ValueType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = coercions_.find(type);
    if (it == coercions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void CoercionRegistry::registerNamedCoercion(const std::string& name, CoerceFunction function) {
    if (!function) {
        throw ConfigurationError("coercion '" + name + "' must be a callable function");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    named_[name] = std::move(function);
}

CoerceFunction CoercionRegistry::getNamedCoercion(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = named_.find(name);
    if (it == named_.end()) {
        throw ConfigurationError("unknown coercion '" + name + "'");
    }
    return it->second;
}

std::vector<std::string> CoercionRegistry::getNamedCoercions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& entry : named_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<CoerceFunction> CoercionRegistry::resolve(const CoercionPolicy& policy, ValueType type) const {
    switch (policy.mode()) {
        case CoercionPolicy::Mode::DISABLED:
            return std::nullopt;
        case CoercionPolicy::Mode::CUSTOM:
            return policy.function();
        case CoercionPolicy::Mode::AUTOMATIC:
            break;
    }
    if (type == ValueType::ANY) {
        return std::nullopt;
    }
    if (auto registered = lookup(type)) {
        return registered;
    }
    return CoerceFunction([type](const Value& value) { return Coercions::constructAs(type, value); });
}

void CoercionRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    coercions_.clear();
    named_.clear();
    registerBuiltins();
}

} // namespace BJS::Schema
