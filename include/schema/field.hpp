// EN: Field - named, typed schema attribute running the coerce, type-check and validate pipeline
// FR: Champ - attribut de schéma nommé et typé exécutant le pipeline coercition, typage et validation

#pragma once

#include "core/value.hpp"
#include "io/json_codec.hpp"
#include "schema/coercion.hpp"
#include "validation/validator.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace BJS::Schema {

class Field;
using FieldPtr = std::shared_ptr<const Field>;

// EN: Field declaration. Setters return *this for chaining; the name is bound once by the schema builder.
// FR: Déclaration de champ. Les setters retournent *this pour le chaînage ; le nom est lié une fois par le constructeur de schéma.
class Field {
public:
    explicit Field(ValueType dtype);

    Field& addValidator(Validation::ValidatorPtr validator);
    Field& setValidators(std::vector<Validation::ValidatorPtr> validators);
    Field& setDefault(Value default_value);
    Field& clearDefault();
    Field& setCoercion(CoercionPolicy coercion);
    Field& setDescription(const std::string& description);
    Field& setParser(IO::ValueParser parser);
    Field& setFormatter(IO::ValueFormatter formatter);

    // EN: Copy of this declaration bound to a name (throws ConfigurationError if already bound).
    // FR: Copie de cette déclaration liée à un nom (lève ConfigurationError si déjà liée).
    FieldPtr bind(const std::string& name) const;

    const std::string& name() const { return name_; }
    bool isBound() const { return !name_.empty(); }
    ValueType dtype() const { return dtype_; }
    const CoercionPolicy& coercion() const { return coercion_; }
    const std::vector<Validation::ValidatorPtr>& validators() const { return validators_; }
    const std::optional<Value>& defaultValue() const { return default_; }
    bool hasDefault() const { return default_.has_value(); }
    const std::string& description() const { return description_; }

    // EN: Declared type check without coercion. INTEGER rejects BOOLEAN, DATE rejects DATETIME.
    // FR: Vérification du type déclaré sans coercition. INTEGER rejette BOOLEAN, DATE rejette DATETIME.
    bool acceptsType(const Value& value) const;

    // EN: Coerce then type-check (throws FieldTypeError; coercion errors propagate unchanged).
    // FR: Coercition puis vérification de type (lève FieldTypeError ; les erreurs de coercition se propagent).
    Value coerce(const Value& value) const;

    // EN: Run validators in order, threading the value; first failure wins.
    // FR: Exécute les validateurs dans l'ordre en propageant la valeur ; le premier échec l'emporte.
    Validation::ValidationOutcome runValidators(const Value& value) const;

    // EN: Full pipeline: coerce, type-check, validate (throws ValidationFailed on the first failure).
    // FR: Pipeline complet : coercition, typage, validation (lève ValidationFailed au premier échec).
    Value sanitize(const Value& value) const;

    Value parse(const nlohmann::json& raw) const { return parser_(raw); }
    nlohmann::json format(const Value& value) const { return formatter_(value); }

    // EN: One-line description: type, default, coercion and validators.
    // FR: Description sur une ligne : type, défaut, coercition et validateurs.
    std::string describe() const;

private:
    std::string label() const { return isBound() ? name_ : "<unbound>"; }

    std::string name_;
    ValueType dtype_;
    CoercionPolicy coercion_;
    std::vector<Validation::ValidatorPtr> validators_;
    std::optional<Value> default_;
    std::string description_;
    IO::ValueParser parser_;
    IO::ValueFormatter formatter_;
};

} // namespace BJS::Schema
