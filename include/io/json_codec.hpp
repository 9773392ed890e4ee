// EN: JSON codec - parser and formatter collaborators between nlohmann::json and Value
// FR: Codec JSON - collaborateurs parseur et formateur entre nlohmann::json et Value

#pragma once

#include "core/value.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace BJS::IO {

// EN: Field-level collaborators: raw JSON to Value, Value to JSON.
// FR: Collaborateurs au niveau du champ : JSON brut vers Value, Value vers JSON.
using ValueParser = std::function<Value(const nlohmann::json&)>;
using ValueFormatter = std::function<nlohmann::json(const Value&)>;

// EN: Default parser: null, booleans, integers, floats, strings, arrays and objects.
// FR: Parseur par défaut : null, booléens, entiers, flottants, chaînes, tableaux et objets.
Value fromJson(const nlohmann::json& json);

// EN: Default formatter: dates, times and datetimes become ISO-8601 strings.
// FR: Formateur par défaut : dates, heures et dates-heures deviennent des chaînes ISO-8601.
nlohmann::json toJson(const Value& value);

// EN: Parse JSON text (throws ParseError on malformed input).
// FR: Parse un texte JSON (lève ParseError sur une entrée malformée).
nlohmann::json parseJsonDocument(const std::string& text);
Value parseJson(const std::string& text);

std::string dumpJson(const Value& value, int indent = -1);

} // namespace BJS::IO
