// EN: Dynamic value model - native representation of every input handled by fields and validators
// FR: Modèle de valeur dynamique - représentation native de toute entrée traitée par champs et validateurs

#pragma once

#include "core/errors.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace BJS {

// EN: Kinds of values. ANY is only meaningful as a declared field type.
// FR: Types de valeurs. ANY n'a de sens que comme type déclaré de champ.
enum class ValueType {
    NONE,           // EN: Null value / FR: Valeur nulle
    BOOLEAN,        // EN: true/false / FR: vrai/faux
    INTEGER,        // EN: 64-bit signed integer / FR: Entier signé 64 bits
    FLOAT,          // EN: Double precision number / FR: Nombre double précision
    STRING,         // EN: UTF-8 text / FR: Texte UTF-8
    DATE,           // EN: Calendar date / FR: Date calendaire
    TIME,           // EN: Time of day, optional UTC offset / FR: Heure du jour, décalage UTC optionnel
    DATETIME,       // EN: Date and time / FR: Date et heure
    LIST,           // EN: Ordered sequence of values / FR: Séquence ordonnée de valeurs
    MAP,            // EN: String-keyed mapping / FR: Dictionnaire à clés chaînes
    ANY             // EN: Declared type accepting everything / FR: Type déclaré acceptant tout
};

std::string valueTypeToString(ValueType type);
std::optional<ValueType> valueTypeFromString(const std::string& name);

// EN: Proleptic Gregorian calendar date.
// FR: Date du calendrier grégorien proleptique.
struct Date {
    int year{1};
    int month{1};
    int day{1};

    Date() = default;
    Date(int y, int m, int d);

    // EN: Parse YYYY-MM-DD (throws CoercionError).
    // FR: Parse YYYY-MM-DD (lève CoercionError).
    static Date fromIsoFormat(const std::string& text);
    std::string toIsoFormat() const;

    // EN: Days since 1970-01-01.
    // FR: Jours depuis le 1970-01-01.
    int64_t toEpochDays() const;

    int compare(const Date& other) const;
    bool operator==(const Date& other) const { return compare(other) == 0; }
    bool operator!=(const Date& other) const { return !(*this == other); }
};

// EN: Time of day with microsecond precision and optional UTC offset (in minutes).
// FR: Heure du jour à la microseconde avec décalage UTC optionnel (en minutes).
struct Time {
    int hour{0};
    int minute{0};
    int second{0};
    int microsecond{0};
    std::optional<int> utc_offset_minutes;

    Time() = default;
    Time(int h, int m, int s = 0, int us = 0, std::optional<int> offset = std::nullopt);

    // EN: Parse HH:MM[:SS[.fff|.ffffff]][Z|+HH:MM] (throws CoercionError).
    // FR: Parse HH:MM[:SS[.fff|.ffffff]][Z|+HH:MM] (lève CoercionError).
    static Time fromIsoFormat(const std::string& text);
    std::string toIsoFormat() const;

    bool isAware() const { return utc_offset_minutes.has_value(); }
    int64_t toMicroseconds() const;

    // EN: Throws ValueTypeError when mixing offset-naive and offset-aware times.
    // FR: Lève ValueTypeError en mélangeant heures naïves et heures avec décalage.
    int compare(const Time& other) const;
    bool operator==(const Time& other) const;
    bool operator!=(const Time& other) const { return !(*this == other); }
};

struct DateTime {
    Date date;
    Time time;

    DateTime() = default;
    DateTime(const Date& d, const Time& t) : date(d), time(t) {}

    // EN: Date and time joined by 'T' or a space.
    // FR: Date et heure jointes par 'T' ou un espace.
    static DateTime fromIsoFormat(const std::string& text);
    std::string toIsoFormat() const;

    bool isAware() const { return time.isAware(); }
    int compare(const DateTime& other) const;
    bool operator==(const DateTime& other) const;
    bool operator!=(const DateTime& other) const { return !(*this == other); }
};

class Value;

namespace detail {
template <typename T> struct ValueTypeOf;
} // namespace detail

// EN: Tagged union over ValueType with value semantics.
// FR: Union étiquetée sur ValueType avec sémantique de valeur.
class Value {
public:
    using List = std::vector<Value>;
    using Map = std::map<std::string, Value>;
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string,
                                 Date, Time, DateTime, List, Map>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : storage_(v) {}
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value && !std::is_same<T, bool>::value,
                                      int>::type = 0>
    Value(T v) : storage_(static_cast<int64_t>(v)) {}
    Value(double v) : storage_(v) {}
    Value(const char* v) : storage_(std::string(v)) {}
    Value(const std::string& v) : storage_(v) {}
    Value(std::string&& v) : storage_(std::move(v)) {}
    Value(const Date& v) : storage_(v) {}
    Value(const Time& v) : storage_(v) {}
    Value(const DateTime& v) : storage_(v) {}
    Value(const List& v) : storage_(v) {}
    Value(List&& v) : storage_(std::move(v)) {}
    Value(const Map& v) : storage_(v) {}
    Value(Map&& v) : storage_(std::move(v)) {}

    ValueType type() const;
    bool is(ValueType type) const { return this->type() == type; }
    bool isNone() const { return std::holds_alternative<std::monostate>(storage_); }
    bool isNumber() const;

    // EN: Typed access (throws ValueTypeError on kind mismatch).
    // FR: Accès typé (lève ValueTypeError si le type ne correspond pas).
    template <typename T>
    const T& as() const {
        if (const T* ptr = std::get_if<T>(&storage_)) {
            return *ptr;
        }
        throw ValueTypeError("expected " + valueTypeToString(detail::ValueTypeOf<T>::value) +
                             " but value is " + valueTypeToString(type()));
    }

    template <typename T>
    const T* tryAs() const { return std::get_if<T>(&storage_); }

    // EN: Numeric view of BOOLEAN, INTEGER and FLOAT values.
    // FR: Vue numérique des valeurs BOOLEAN, INTEGER et FLOAT.
    double toDouble() const;

    bool truthy() const;

    // EN: Length of STRING (in code points), LIST or MAP (throws ValueTypeError otherwise).
    // FR: Longueur de STRING (en points de code), LIST ou MAP (lève ValueTypeError sinon).
    std::size_t length() const;

    // EN: Three-way ordering, nullopt when unordered (NaN). Throws ValueTypeError for incomparable kinds.
    // FR: Ordre à trois voies, nullopt si non ordonné (NaN). Lève ValueTypeError pour des types incomparables.
    std::optional<int> compare(const Value& other) const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }
    bool operator<(const Value& other) const { auto order = compare(other); return order && *order < 0; }
    bool operator<=(const Value& other) const { auto order = compare(other); return order && *order <= 0; }
    bool operator>(const Value& other) const { auto order = compare(other); return order && *order > 0; }
    bool operator>=(const Value& other) const { auto order = compare(other); return order && *order >= 0; }

    // EN: Representation for messages (strings quoted).
    // FR: Représentation pour les messages (chaînes entre guillemets).
    std::string repr() const;

    // EN: Plain text form (strings unquoted).
    // FR: Forme texte simple (chaînes sans guillemets).
    std::string toString() const;

    const Storage& storage() const { return storage_; }

private:
    Storage storage_;
};

namespace detail {
template <> struct ValueTypeOf<std::monostate> { static constexpr ValueType value = ValueType::NONE; };
template <> struct ValueTypeOf<bool> { static constexpr ValueType value = ValueType::BOOLEAN; };
template <> struct ValueTypeOf<int64_t> { static constexpr ValueType value = ValueType::INTEGER; };
template <> struct ValueTypeOf<double> { static constexpr ValueType value = ValueType::FLOAT; };
template <> struct ValueTypeOf<std::string> { static constexpr ValueType value = ValueType::STRING; };
template <> struct ValueTypeOf<Date> { static constexpr ValueType value = ValueType::DATE; };
template <> struct ValueTypeOf<Time> { static constexpr ValueType value = ValueType::TIME; };
template <> struct ValueTypeOf<DateTime> { static constexpr ValueType value = ValueType::DATETIME; };
template <> struct ValueTypeOf<Value::List> { static constexpr ValueType value = ValueType::LIST; };
template <> struct ValueTypeOf<Value::Map> { static constexpr ValueType value = ValueType::MAP; };
} // namespace detail

// EN: Shortest round-trip text of a double ("3.0", "0.1", "inf", "nan").
// FR: Texte le plus court d'un double conservant sa valeur ("3.0", "0.1", "inf", "nan").
std::string formatFloat(double value);

// EN: UTF-8 helpers. A byte that does not start a valid sequence counts as one code point.
// FR: Outils UTF-8. Un octet qui ne commence pas une séquence valide compte pour un point de code.
std::size_t utf8Length(const std::string& text);
std::vector<std::string> utf8Split(const std::string& text);

} // namespace BJS
