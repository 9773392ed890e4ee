// EN: Validator composition - chains, alternatives, negation and sanitizing transforms
// FR: Composition de validateurs - chaînes, alternatives, négation et transformations d'assainissement

#pragma once

#include "validation/validator.hpp"

#include <functional>
#include <string>
#include <vector>

namespace BJS::Validation {

// EN: Runs validators in order, threading each returned value into the next.
//     Stops at the first failure and reports that validator's failure unchanged.
// FR: Exécute les validateurs dans l'ordre en passant la valeur retournée au suivant.
//     S'arrête au premier échec et rapporte l'échec de ce validateur tel quel.
class ValidatorChain : public Validator {
public:
    explicit ValidatorChain(std::vector<ValidatorPtr> validators);

    // EN: Concatenate two validators, flattening nested chains.
    // FR: Concatène deux validateurs en aplatissant les chaînes imbriquées.
    static std::shared_ptr<const ValidatorChain> concat(const ValidatorPtr& first, const ValidatorPtr& second);

    std::string kind() const override { return "ValidatorChain"; }
    std::string describe() const override;

    const std::vector<ValidatorPtr>& validators() const { return validators_; }
    std::size_t size() const { return validators_.size(); }

protected:
    ValidationOutcome evaluate(const Value& value) const override;

private:
    std::vector<ValidatorPtr> validators_;
};

// EN: Succeeds with the first passing alternative.
// FR: Réussit avec la première alternative satisfaite.
class AnyOf : public Validator {
public:
    explicit AnyOf(std::vector<ValidatorPtr> alternatives);

    std::string kind() const override { return "AnyOf"; }
    std::string describe() const override;

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;
    std::optional<std::string> templateField(const std::string& name) const override;

private:
    std::vector<ValidatorPtr> alternatives_;
};

// EN: Succeeds when the inner validator fails.
// FR: Réussit quand le validateur interne échoue.
class Not : public Validator {
public:
    explicit Not(ValidatorPtr inner);

    std::string kind() const override { return "Not"; }
    std::string describe() const override;

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;
    std::optional<std::string> templateField(const std::string& name) const override;

private:
    ValidatorPtr inner_;
};

// EN: Sanitizer step returning a converted value. Errors thrown by the function propagate.
// FR: Étape d'assainissement retournant une valeur convertie. Les erreurs de la fonction se propagent.
class Transform : public Validator {
public:
    using TransformFunction = std::function<Value(const Value&)>;

    Transform(TransformFunction function, std::string name);

    std::string kind() const override { return "Transform"; }
    std::string describe() const override { return "Transform(" + name_ + ")"; }

protected:
    ValidationOutcome evaluate(const Value& value) const override;

private:
    TransformFunction function_;
    std::string name_;
};

ValidatorPtr allOf(std::vector<ValidatorPtr> validators);
ValidatorPtr anyOf(std::vector<ValidatorPtr> alternatives);
ValidatorPtr negate(ValidatorPtr inner);

// EN: Common sanitizers.
// FR: Assainisseurs courants.
namespace Sanitizers {
ValidatorPtr trim();
ValidatorPtr toLower();
ValidatorPtr toUpper();
} // namespace Sanitizers

} // namespace BJS::Validation
