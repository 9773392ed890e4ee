// EN: Implementation of the dynamic Value model (equality, ordering, length, representation).
// FR: Implémentation du modèle Value dynamique (égalité, ordre, longueur, représentation).

#include "core/value.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <unordered_map>

namespace BJS {

namespace {

bool isIntegral(const Value& value) {
    return value.is(ValueType::BOOLEAN) || value.is(ValueType::INTEGER);
}

int64_t integralOf(const Value& value) {
    if (const bool* flag = value.tryAs<bool>()) {
        return *flag ? 1 : 0;
    }
    return value.as<int64_t>();
}

template <typename T>
int threeWay(const T& lhs, const T& rhs) {
    return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0);
}

// EN: Exact ordering of an integer against a double, nullopt for NaN.
// FR: Ordre exact d'un entier face à un double, nullopt pour NaN.
std::optional<int> orderIntegerAgainstFloat(int64_t integer, double number) {
    constexpr double TWO_POW_63 = 9223372036854775808.0;
    if (std::isnan(number)) {
        return std::nullopt;
    }
    if (number >= TWO_POW_63) {
        return -1;
    }
    if (number < -TWO_POW_63) {
        return 1;
    }
    const double truncated = std::trunc(number);
    const int64_t whole = static_cast<int64_t>(truncated);
    if (integer != whole) {
        return integer < whole ? -1 : 1;
    }
    const double fraction = number - truncated;
    return fraction > 0.0 ? -1 : (fraction < 0.0 ? 1 : 0);
}

// EN: Ordering of two numbers (BOOLEAN, INTEGER or FLOAT), nullopt when unordered.
// FR: Ordre de deux nombres (BOOLEAN, INTEGER ou FLOAT), nullopt si non ordonnés.
std::optional<int> orderNumbers(const Value& lhs, const Value& rhs) {
    const bool lhs_integral = isIntegral(lhs);
    const bool rhs_integral = isIntegral(rhs);
    if (lhs_integral && rhs_integral) {
        return threeWay(integralOf(lhs), integralOf(rhs));
    }
    if (lhs_integral) {
        return orderIntegerAgainstFloat(integralOf(lhs), rhs.as<double>());
    }
    if (rhs_integral) {
        auto order = orderIntegerAgainstFloat(integralOf(rhs), lhs.as<double>());
        if (!order) {
            return std::nullopt;
        }
        return -*order;
    }
    const double a = lhs.as<double>();
    const double b = rhs.as<double>();
    if (std::isnan(a) || std::isnan(b)) {
        return std::nullopt;
    }
    return threeWay(a, b);
}

// EN: Byte count of the UTF-8 sequence starting at pos, 1 for an invalid lead or truncated sequence.
// FR: Nombre d'octets de la séquence UTF-8 commençant à pos, 1 pour un octet initial invalide ou tronqué.
std::size_t sequenceLength(const std::string& text, std::size_t pos) {
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 1;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
    }
    if (pos + length > text.size()) {
        return 1;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const unsigned char next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) {
            return 1;
        }
    }
    return length;
}

std::string quote(const std::string& text) {
    std::string result;
    result.reserve(text.size() + 2);
    result += '"';
    for (char c : text) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:   result += c; break;
        }
    }
    result += '"';
    return result;
}

} // namespace

std::string valueTypeToString(ValueType type) {
    switch (type) {
        case ValueType::NONE:     return "none";
        case ValueType::BOOLEAN:  return "boolean";
        case ValueType::INTEGER:  return "integer";
        case ValueType::FLOAT:    return "float";
        case ValueType::STRING:   return "string";
        case ValueType::DATE:     return "date";
        case ValueType::TIME:     return "time";
        case ValueType::DATETIME: return "datetime";
        case ValueType::LIST:     return "list";
        case ValueType::MAP:      return "map";
        case ValueType::ANY:      return "any";
        default:                  return "unknown";
    }
}

std::optional<ValueType> valueTypeFromString(const std::string& name) {
    static const std::unordered_map<std::string, ValueType> names = {
        {"none", ValueType::NONE},         {"null", ValueType::NONE},
        {"boolean", ValueType::BOOLEAN},   {"bool", ValueType::BOOLEAN},
        {"integer", ValueType::INTEGER},   {"int", ValueType::INTEGER},
        {"float", ValueType::FLOAT},       {"double", ValueType::FLOAT},
        {"string", ValueType::STRING},     {"str", ValueType::STRING},
        {"date", ValueType::DATE},         {"time", ValueType::TIME},
        {"datetime", ValueType::DATETIME}, {"list", ValueType::LIST},
        {"array", ValueType::LIST},        {"map", ValueType::MAP},
        {"object", ValueType::MAP},        {"any", ValueType::ANY}
    };
    auto it = names.find(name);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t utf8Length(const std::string& text) {
    std::size_t count = 0;
    for (std::size_t pos = 0; pos < text.size(); pos += sequenceLength(text, pos)) {
        ++count;
    }
    return count;
}

std::vector<std::string> utf8Split(const std::string& text) {
    std::vector<std::string> characters;
    for (std::size_t pos = 0; pos < text.size();) {
        const std::size_t length = sequenceLength(text, pos);
        characters.push_back(text.substr(pos, length));
        pos += length;
    }
    return characters;
}

std::string formatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    // EN: Smallest precision that reads back to the same double.
    // FR: Plus petite précision qui relit le même double.
    char buffer[32];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }

    std::string text = buffer;
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

ValueType Value::type() const {
    switch (storage_.index()) {
        case 0: return ValueType::NONE;
        case 1: return ValueType::BOOLEAN;
        case 2: return ValueType::INTEGER;
        case 3: return ValueType::FLOAT;
        case 4: return ValueType::STRING;
        case 5: return ValueType::DATE;
        case 6: return ValueType::TIME;
        case 7: return ValueType::DATETIME;
        case 8: return ValueType::LIST;
        default: return ValueType::MAP;
    }
}

bool Value::isNumber() const {
    return is(ValueType::BOOLEAN) || is(ValueType::INTEGER) || is(ValueType::FLOAT);
}

double Value::toDouble() const {
    if (const double* number = tryAs<double>()) {
        return *number;
    }
    if (isIntegral(*this)) {
        return static_cast<double>(integralOf(*this));
    }
    throw ValueTypeError("expected a number but value is " + valueTypeToString(type()));
}

bool Value::truthy() const {
    switch (type()) {
        case ValueType::NONE:    return false;
        case ValueType::BOOLEAN: return as<bool>();
        case ValueType::INTEGER: return as<int64_t>() != 0;
        case ValueType::FLOAT:   return as<double>() != 0.0;
        case ValueType::STRING:  return !as<std::string>().empty();
        case ValueType::LIST:    return !as<List>().empty();
        case ValueType::MAP:     return !as<Map>().empty();
        default:                 return true;
    }
}

std::size_t Value::length() const {
    switch (type()) {
        case ValueType::STRING: return utf8Length(as<std::string>());
        case ValueType::LIST:   return as<List>().size();
        case ValueType::MAP:    return as<Map>().size();
        default:
            throw ValueTypeError("value of type " + valueTypeToString(type()) + " has no length");
    }
}

std::optional<int> Value::compare(const Value& other) const {
    if (isNumber() && other.isNumber()) {
        return orderNumbers(*this, other);
    }

    if (type() != other.type()) {
        throw ValueTypeError("cannot compare " + valueTypeToString(type()) + " with " +
                             valueTypeToString(other.type()));
    }

    switch (type()) {
        case ValueType::STRING: {
            const int result = as<std::string>().compare(other.as<std::string>());
            return result < 0 ? -1 : (result > 0 ? 1 : 0);
        }
        case ValueType::DATE:
            return as<Date>().compare(other.as<Date>());
        case ValueType::TIME:
            return as<Time>().compare(other.as<Time>());
        case ValueType::DATETIME:
            return as<DateTime>().compare(other.as<DateTime>());
        case ValueType::LIST: {
            const List& lhs = as<List>();
            const List& rhs = other.as<List>();
            const std::size_t common = std::min(lhs.size(), rhs.size());
            for (std::size_t i = 0; i < common; ++i) {
                if (lhs[i] == rhs[i]) {
                    continue;
                }
                return lhs[i].compare(rhs[i]);
            }
            return threeWay(lhs.size(), rhs.size());
        }
        default:
            throw ValueTypeError("values of type " + valueTypeToString(type()) + " are not ordered");
    }
}

bool Value::operator==(const Value& other) const {
    if (isNumber() && other.isNumber()) {
        auto order = orderNumbers(*this, other);
        return order && *order == 0;
    }
    if (type() != other.type()) {
        return false;
    }
    switch (type()) {
        case ValueType::NONE:     return true;
        case ValueType::STRING:   return as<std::string>() == other.as<std::string>();
        case ValueType::DATE:     return as<Date>() == other.as<Date>();
        case ValueType::TIME:     return as<Time>() == other.as<Time>();
        case ValueType::DATETIME: return as<DateTime>() == other.as<DateTime>();
        case ValueType::LIST:     return as<List>() == other.as<List>();
        case ValueType::MAP:      return as<Map>() == other.as<Map>();
        default:                  return false;
    }
}

std::string Value::repr() const {
    switch (type()) {
        case ValueType::NONE:     return "null";
        case ValueType::BOOLEAN:  return as<bool>() ? "true" : "false";
        case ValueType::INTEGER:  return std::to_string(as<int64_t>());
        case ValueType::FLOAT:    return formatFloat(as<double>());
        case ValueType::STRING:   return quote(as<std::string>());
        case ValueType::DATE:     return "date(" + as<Date>().toIsoFormat() + ")";
        case ValueType::TIME:     return "time(" + as<Time>().toIsoFormat() + ")";
        case ValueType::DATETIME: return "datetime(" + as<DateTime>().toIsoFormat() + ")";
        case ValueType::LIST: {
            std::ostringstream out;
            out << "[";
            bool first = true;
            for (const auto& item : as<List>()) {
                if (!first) {
                    out << ", ";
                }
                first = false;
                out << item.repr();
            }
            out << "]";
            return out.str();
        }
        default: {
            std::ostringstream out;
            out << "{";
            bool first = true;
            for (const auto& [key, item] : as<Map>()) {
                if (!first) {
                    out << ", ";
                }
                first = false;
                out << quote(key) << ": " << item.repr();
            }
            out << "}";
            return out.str();
        }
    }
}

std::string Value::toString() const {
    switch (type()) {
        case ValueType::STRING:   return as<std::string>();
        case ValueType::DATE:     return as<Date>().toIsoFormat();
        case ValueType::TIME:     return as<Time>().toIsoFormat();
        case ValueType::DATETIME: return as<DateTime>().toIsoFormat();
        default:                  return repr();
    }
}

} // namespace BJS
