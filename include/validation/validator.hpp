// EN: Validator base class - primitive rule unit with tagged outcome and throwing/boolean adapters
// FR: Classe de base des validateurs - unité de règle primitive avec résultat étiqueté et adaptateurs levant/booléen

#pragma once

#include "core/errors.hpp"
#include "core/value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace BJS::Validation {

class Validator;

// EN: Description of a failed check: (value, validator, error_code)
// FR: Description d'une vérification échouée : (valeur, validateur, code d'erreur)
struct ValidationFailure {
    Value value;                                     // EN: Value that failed / FR: Valeur qui a échoué
    const Validator* validator{nullptr};             // EN: Failing validator (non-owning) / FR: Validateur en échec (non propriétaire)
    std::string validator_kind;                      // EN: Kind name of the validator / FR: Nom du type de validateur
    std::string error_code;                          // EN: Code such as "out_of_range" / FR: Code tel que "out_of_range"

    // EN: Rendered message from the validator's templates.
    // FR: Message rendu depuis les templates du validateur.
    std::string message() const;
};

// EN: Recoverable outcome of a failed validation, thrown by the throwing adapter.
// FR: Résultat récupérable d'une validation échouée, levé par l'adaptateur levant.
class ValidationFailed : public Error {
public:
    explicit ValidationFailed(ValidationFailure failure);

    const ValidationFailure& failure() const { return failure_; }
    const Value& value() const { return failure_.value; }
    const Validator* validator() const { return failure_.validator; }
    const std::string& errorCode() const { return failure_.error_code; }

private:
    ValidationFailure failure_;
};

// EN: Tagged result of a check: either the validated value or a failure.
// FR: Résultat étiqueté d'une vérification : la valeur validée ou un échec.
class ValidationOutcome {
public:
    static ValidationOutcome success(Value value);
    static ValidationOutcome failure(ValidationFailure failure);

    bool isValid() const { return std::holds_alternative<Value>(result_); }
    explicit operator bool() const { return isValid(); }

    // EN: Validated value (throws ValidationFailed on a failure outcome).
    // FR: Valeur validée (lève ValidationFailed sur un échec).
    const Value& value() const;

    // EN: Failure details (throws Error on a success outcome).
    // FR: Détails de l'échec (lève Error sur un succès).
    const ValidationFailure& failure() const;

    Value valueOrThrow() const { return value(); }

private:
    explicit ValidationOutcome(std::variant<Value, ValidationFailure> result)
        : result_(std::move(result)) {}

    std::variant<Value, ValidationFailure> result_;
};

// EN: Abstract validator. Subclasses implement evaluate() and own an error template table.
// FR: Validateur abstrait. Les sous-classes implémentent evaluate() et possèdent une table de templates.
class Validator {
public:
    virtual ~Validator() = default;

    // EN: Tagged check. Errors other than validation failures propagate.
    // FR: Vérification étiquetée. Les erreurs autres que les échecs de validation se propagent.
    ValidationOutcome check(const Value& value) const;

    // EN: Throwing adapter: returns the validated value or throws ValidationFailed.
    // FR: Adaptateur levant : retourne la valeur validée ou lève ValidationFailed.
    Value validate(const Value& value) const;

    // EN: Boolean adapter: false on validation failure only.
    // FR: Adaptateur booléen : false uniquement en cas d'échec de validation.
    bool operator()(const Value& value) const;

    virtual std::string kind() const = 0;
    virtual std::string describe() const = 0;

    // EN: Render the message of an error code, interpolating {value} and named fields.
    // FR: Rend le message d'un code d'erreur en interpolant {value} et les champs nommés.
    std::string renderMessage(const std::string& error_code, const Value& value) const;

protected:
    virtual ValidationOutcome evaluate(const Value& value) const = 0;
    virtual const std::unordered_map<std::string, std::string>& errorTemplates() const;
    virtual std::optional<std::string> templateField(const std::string& name) const;

    ValidationOutcome success(Value value) const;
    ValidationOutcome failure(const Value& value, const std::string& error_code) const;
};

using ValidatorPtr = std::shared_ptr<const Validator>;

} // namespace BJS::Validation
