// EN: Coercion resolver - maps a declared value type to a coercion function
// FR: Résolveur de coercition - associe un type de valeur déclaré à une fonction de coercition

#pragma once

#include "core/value.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace BJS::Schema {

using CoerceFunction = std::function<Value(const Value&)>;

// EN: How a field converts raw input before type-checking.
// FR: Façon dont un champ convertit l'entrée brute avant la vérification de type.
class CoercionPolicy {
public:
    enum class Mode {
        AUTOMATIC,      // EN: Registry lookup, then constructor conversion / FR: Registre, puis conversion par constructeur
        DISABLED,       // EN: No coercion / FR: Pas de coercition
        CUSTOM          // EN: Explicit function / FR: Fonction explicite
    };

    static CoercionPolicy automatic();
    static CoercionPolicy disabled();
    static CoercionPolicy custom(CoerceFunction function, std::string name = "custom");

    Mode mode() const { return mode_; }
    const CoerceFunction& function() const { return function_; }
    const std::string& name() const { return name_; }

    // EN: "automatic", "disabled" or the custom function name.
    // FR: "automatic", "disabled" ou le nom de la fonction personnalisée.
    std::string toString() const;

private:
    CoercionPolicy(Mode mode, CoerceFunction function, std::string name)
        : mode_(mode), function_(std::move(function)), name_(std::move(name)) {}

    Mode mode_;
    CoerceFunction function_;
    std::string name_;
};

// EN: Process-wide coercion table keyed by target type, plus named coercions for declarative documents.
// FR: Table de coercition globale indexée par type cible, plus coercitions nommées pour documents déclaratifs.
class CoercionRegistry {
public:
    static CoercionRegistry& getInstance();

    // EN: Register or replace the coercion of a target type.
    // FR: Enregistre ou remplace la coercition d'un type cible.
    void registerCoercion(ValueType type, CoerceFunction function);
    void unregisterCoercion(ValueType type);
    bool hasCoercion(ValueType type) const;
    std::optional<CoerceFunction> lookup(ValueType type) const;

    void registerNamedCoercion(const std::string& name, CoerceFunction function);
    CoerceFunction getNamedCoercion(const std::string& name) const;
    std::vector<std::string> getNamedCoercions() const;

    // EN: Function to apply for a policy and declared type (none when nothing applies).
    // FR: Fonction à appliquer pour une politique et un type déclaré (aucune si rien ne s'applique).
    std::optional<CoerceFunction> resolve(const CoercionPolicy& policy, ValueType type) const;

    // EN: Restore the built-in table.
    // FR: Restaure la table intégrée.
    void reset();

private:
    CoercionRegistry();
    CoercionRegistry(const CoercionRegistry&) = delete;
    CoercionRegistry& operator=(const CoercionRegistry&) = delete;

    void registerBuiltins();

    mutable std::mutex mutex_;
    std::unordered_map<ValueType, CoerceFunction> coercions_;
    std::unordered_map<std::string, CoerceFunction> named_;
};

// EN: Built-in coercion functions.
// FR: Fonctions de coercition intégrées.
namespace Coercions {

// EN: Trimmed, lowercased flag: {1,y,yes,true,on} or {0,n,no,false,off}.
// FR: Drapeau nettoyé et en minuscules : {1,y,yes,true,on} ou {0,n,no,false,off}.
Value booleanFlag(const Value& value);

Value isoDate(const Value& value);
Value isoTime(const Value& value);
Value isoDateTime(const Value& value);

// EN: Identity; the declared type is still enforced by the field.
// FR: Identité ; le type déclaré reste imposé par le champ.
Value strict(const Value& value);

// EN: Constructor-style conversion to a target type (CoercionError / ValueTypeError on failure).
// FR: Conversion façon constructeur vers un type cible (CoercionError / ValueTypeError en cas d'échec).
Value constructAs(ValueType target, const Value& value);

} // namespace Coercions

} // namespace BJS::Schema
