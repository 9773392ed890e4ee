// EN: Validator primitives - Predicate, Equal/Match, Range, Length, Regexp and InChoices
// FR: Validateurs primitifs - Predicate, Equal/Match, Range, Length, Regexp et InChoices

#pragma once

#include "validation/validator.hpp"

#include <functional>
#include <optional>
#include <regex>
#include <string>

namespace BJS::Validation {

// EN: Unary predicate; the result is checked for boolean type in strict mode.
// FR: Prédicat unaire ; le type booléen du résultat est vérifié en mode strict.
using PredicateFunction = std::function<Value(const Value&)>;

// EN: Binary comparison called as compare(value, target).
// FR: Comparaison binaire appelée comme compare(valeur, cible).
using CompareFunction = std::function<Value(const Value&, const Value&)>;

namespace Comparators {

// EN: Plain equality (Value::operator==).
// FR: Égalité simple (Value::operator==).
CompareFunction equality();

// EN: Approximate numeric equality: |a-b| <= max(rel_tol * max(|a|, |b|), abs_tol).
// FR: Égalité numérique approchée : |a-b| <= max(rel_tol * max(|a|, |b|), abs_tol).
CompareFunction isClose(double rel_tol = 1e-9, double abs_tol = 0.0);

} // namespace Comparators

// EN: Wraps a custom predicate function.
// FR: Encapsule une fonction prédicat personnalisée.
class Predicate : public Validator {
public:
    explicit Predicate(PredicateFunction pred, bool strict = true, std::string name = "<function>");

    std::string kind() const override { return "Predicate"; }
    std::string describe() const override;

    bool isStrict() const { return strict_; }
    const std::string& name() const { return name_; }

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;

private:
    PredicateFunction pred_;
    bool strict_;
    std::string name_;
};

// EN: Checks compare(value, target); equality by default.
// FR: Vérifie compare(valeur, cible) ; égalité par défaut.
class Equal : public Validator {
public:
    explicit Equal(Value target, CompareFunction compare = {}, bool strict = true);

    std::string kind() const override { return "Equal"; }
    std::string describe() const override;

    const Value& target() const { return target_; }

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;
    std::optional<std::string> templateField(const std::string& name) const override;

private:
    Value target_;
    CompareFunction compare_;
    bool custom_compare_;
    bool strict_;
};

using Match = Equal;

// EN: Bounded range with independently inclusive/exclusive ends; missing bounds are unchecked.
// FR: Intervalle borné aux extrémités incluses/exclues indépendamment ; bornes absentes non vérifiées.
class Range : public Validator {
public:
    Range(std::optional<Value> min, std::optional<Value> max,
          bool min_inclusive = true, bool max_inclusive = true, bool absorb_cmp_error = true);

    static Range atLeast(Value min, bool inclusive = true);
    static Range atMost(Value max, bool inclusive = true);

    std::string kind() const override { return "Range"; }
    std::string describe() const override;

    // EN: Range statement such as "-12 < ? <= -6".
    // FR: Énoncé de l'intervalle tel que "-12 < ? <= -6".
    std::string rangeString() const;

    const std::optional<Value>& min() const { return min_; }
    const std::optional<Value>& max() const { return max_; }
    bool minInclusive() const { return min_inclusive_; }
    bool maxInclusive() const { return max_inclusive_; }

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;
    std::optional<std::string> templateField(const std::string& name) const override;

private:
    bool compareLower(const Value& value) const;
    bool compareUpper(const Value& value) const;

    std::optional<Value> min_;
    std::optional<Value> max_;
    bool min_inclusive_;
    bool max_inclusive_;
    bool absorb_cmp_error_;
};

// EN: Length check with either an exact length or min/max bounds.
// FR: Vérification de longueur exacte ou bornée par min/max.
class Length : public Validator {
public:
    Length(std::optional<int64_t> min, std::optional<int64_t> max,
           std::optional<int64_t> equal = std::nullopt, bool absorb_len_error = true);

    static Length exactly(int64_t length, bool absorb_len_error = true);

    std::string kind() const override { return "Length"; }
    std::string describe() const override;
    std::string rangeString() const;

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;
    std::optional<std::string> templateField(const std::string& name) const override;

private:
    std::optional<int64_t> min_;
    std::optional<int64_t> max_;
    std::optional<int64_t> equal_;
    bool absorb_len_error_;
};

// EN: Full-string regular expression match with optional post-validation on captured groups.
//     Inputs longer than max_length bytes fail with too_long without reaching the regex engine,
//     whose recursion depth grows with the input size.
// FR: Correspondance complète d'expression régulière avec post-validation optionnelle des groupes.
//     Les entrées de plus de max_length octets échouent avec too_long sans atteindre le moteur regex,
//     dont la profondeur de récursion croît avec la taille de l'entrée.
class Regexp : public Validator {
public:
    static constexpr std::size_t DEFAULT_MAX_LENGTH = 8192;

    explicit Regexp(const std::string& pattern, PredicateFunction post_validate = {}, bool strict = true,
                    std::size_t max_length = DEFAULT_MAX_LENGTH);
    Regexp(std::regex compiled, std::string source, PredicateFunction post_validate = {}, bool strict = true,
           std::size_t max_length = DEFAULT_MAX_LENGTH);

    std::string kind() const override { return "Regexp"; }
    std::string describe() const override;

    const std::string& pattern() const { return source_; }
    std::size_t maxLength() const { return max_length_; }

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;
    std::optional<std::string> templateField(const std::string& name) const override;

private:
    std::regex regex_;
    std::string source_;
    PredicateFunction post_validate_;
    bool strict_;
    std::size_t max_length_;
};

// EN: Membership among ordered choices (a list, the characters of a string or the keys of a map).
// FR: Appartenance à des choix ordonnés (liste, caractères d'une chaîne ou clés d'un dictionnaire).
class InChoices : public Validator {
public:
    explicit InChoices(const Value& choices, CompareFunction compare = {}, bool strict = true);

    std::string kind() const override { return "InChoices"; }
    std::string describe() const override;

    const Value::List& choices() const { return choices_; }

protected:
    ValidationOutcome evaluate(const Value& value) const override;
    const std::unordered_map<std::string, std::string>& errorTemplates() const override;
    std::optional<std::string> templateField(const std::string& name) const override;

private:
    Value::List choices_;
    CompareFunction compare_;
    bool strict_;
};

// EN: Sequence of values for iteration: list items, string characters or map keys.
// FR: Séquence de valeurs pour l'itération : éléments de liste, caractères ou clés.
Value::List iterateValue(const Value& value);

// EN: Truthiness of a predicate/comparator result, throwing ValueTypeError when strict and non-boolean.
// FR: Véracité d'un résultat de prédicat/comparateur, lève ValueTypeError si strict et non booléen.
bool checkedResult(const Value& result, bool strict, const std::string& what);

} // namespace BJS::Validation
