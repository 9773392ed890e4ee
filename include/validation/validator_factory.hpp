// EN: Validator factory - builds validators from dynamic parameters with construction-time checks
// FR: Fabrique de validateurs - construit des validateurs depuis des paramètres dynamiques avec vérifications

#pragma once

#include "validation/composition.hpp"
#include "validation/validators.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace BJS::Validation {

// EN: Creates validators by kind name. Parameters arrive as a Value: a map of named
//     parameters, or a bare value for the single-parameter kinds.
// FR: Crée des validateurs par nom de type. Les paramètres arrivent sous forme de Value :
//     un dictionnaire de paramètres nommés, ou une valeur nue pour les types à paramètre unique.
class ValidatorFactory {
public:
    // EN: Constructor registers the built-in predicates and comparators
    // FR: Le constructeur enregistre les prédicats et comparateurs intégrés
    ValidatorFactory();

    // EN: Process-wide factory used by the schema loader.
    // FR: Fabrique globale utilisée par le chargeur de schémas.
    static ValidatorFactory& getInstance();

    // EN: Build a validator of the given kind (throws ConfigurationError on bad kind or parameters).
    // FR: Construit un validateur du type donné (lève ConfigurationError si type ou paramètres invalides).
    ValidatorPtr create(const std::string& kind, const Value& params = Value()) const;

    // EN: Build from a single-entry map {kind: params}, or a string naming a registered predicate.
    // FR: Construit depuis un dictionnaire à une entrée {type: paramètres}, ou une chaîne nommant un prédicat.
    ValidatorPtr createFromSpec(const Value& spec) const;

    // EN: Named predicates and comparators
    // FR: Prédicats et comparateurs nommés
    void registerPredicate(const std::string& name, PredicateFunction predicate);
    void registerComparator(const std::string& name, CompareFunction comparator);
    PredicateFunction getPredicate(const std::string& name) const;
    CompareFunction getComparator(const std::string& name) const;
    bool hasPredicate(const std::string& name) const;
    bool hasComparator(const std::string& name) const;

    std::vector<std::string> getAvailableKinds() const;

private:
    ValidatorPtr createPredicate(const Value& params) const;
    ValidatorPtr createEqual(const Value& params) const;
    ValidatorPtr createRange(const Value& params) const;
    ValidatorPtr createLength(const Value& params) const;
    ValidatorPtr createRegexp(const Value& params) const;
    ValidatorPtr createInChoices(const Value& params) const;
    std::vector<ValidatorPtr> createList(const std::string& kind, const Value& params) const;

    std::unordered_map<std::string, PredicateFunction> predicates_;
    std::unordered_map<std::string, CompareFunction> comparators_;
    mutable std::mutex mutex_;
};

} // namespace BJS::Validation
