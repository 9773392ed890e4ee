// EN: Implementation of validator composition.
// FR: Implémentation de la composition de validateurs.

#include "validation/composition.hpp"

#include <algorithm>
#include <cctype>

namespace BJS::Validation {

namespace {

void requireValidators(const std::vector<ValidatorPtr>& validators, const std::string& owner) {
    for (const auto& validator : validators) {
        if (!validator) {
            throw ConfigurationError(owner + " received a null validator");
        }
    }
}

std::string joinDescriptions(const std::vector<ValidatorPtr>& validators) {
    std::string text;
    for (std::size_t i = 0; i < validators.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += validators[i]->describe();
    }
    return text;
}

std::string changeCase(const Value& value, bool upper) {
    std::string text = value.as<std::string>();
    std::transform(text.begin(), text.end(), text.begin(), [upper](unsigned char c) {
        return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
    });
    return text;
}

} // namespace

// EN: ValidatorChain
// FR: Chaîne de validateurs
ValidatorChain::ValidatorChain(std::vector<ValidatorPtr> validators)
    : validators_(std::move(validators)) {
    requireValidators(validators_, "ValidatorChain");
}

std::shared_ptr<const ValidatorChain> ValidatorChain::concat(const ValidatorPtr& first,
                                                             const ValidatorPtr& second) {
    std::vector<ValidatorPtr> flattened;
    for (const auto& part : {first, second}) {
        if (auto chain = std::dynamic_pointer_cast<const ValidatorChain>(part)) {
            flattened.insert(flattened.end(), chain->validators_.begin(), chain->validators_.end());
        } else {
            flattened.push_back(part);
        }
    }
    return std::make_shared<ValidatorChain>(std::move(flattened));
}

std::string ValidatorChain::describe() const {
    return "ValidatorChain(" + joinDescriptions(validators_) + ")";
}

ValidationOutcome ValidatorChain::evaluate(const Value& value) const {
    Value current = value;
    for (const auto& validator : validators_) {
        ValidationOutcome outcome = validator->check(current);
        if (!outcome) {
            return outcome;
        }
        current = outcome.value();
    }
    return success(std::move(current));
}

// EN: AnyOf
// FR: Alternative
AnyOf::AnyOf(std::vector<ValidatorPtr> alternatives) : alternatives_(std::move(alternatives)) {
    if (alternatives_.empty()) {
        throw ConfigurationError("AnyOf requires at least one alternative");
    }
    requireValidators(alternatives_, "AnyOf");
}

std::string AnyOf::describe() const {
    return "AnyOf(" + joinDescriptions(alternatives_) + ")";
}

ValidationOutcome AnyOf::evaluate(const Value& value) const {
    for (const auto& alternative : alternatives_) {
        ValidationOutcome outcome = alternative->check(value);
        if (outcome) {
            return outcome;
        }
    }
    return failure(value, "none_satisfied");
}

const std::unordered_map<std::string, std::string>& AnyOf::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"none_satisfied", "value does not satisfy any of {count} alternatives"},
    };
    return templates;
}

std::optional<std::string> AnyOf::templateField(const std::string& name) const {
    if (name == "count") {
        return std::to_string(alternatives_.size());
    }
    return std::nullopt;
}

// EN: Not
// FR: Négation
Not::Not(ValidatorPtr inner) : inner_(std::move(inner)) {
    if (!inner_) {
        throw ConfigurationError("Not received a null validator");
    }
}

std::string Not::describe() const {
    return "Not(" + inner_->describe() + ")";
}

ValidationOutcome Not::evaluate(const Value& value) const {
    if (inner_->check(value)) {
        return failure(value, "negation_satisfied");
    }
    return success(value);
}

const std::unordered_map<std::string, std::string>& Not::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"negation_satisfied", "value must not satisfy {inner}"},
    };
    return templates;
}

std::optional<std::string> Not::templateField(const std::string& name) const {
    if (name == "inner") {
        return inner_->describe();
    }
    return std::nullopt;
}

// EN: Transform
// FR: Transformation
Transform::Transform(TransformFunction function, std::string name)
    : function_(std::move(function)), name_(std::move(name)) {
    if (!function_) {
        throw ConfigurationError("Transform '" + name_ + "' requires a callable function");
    }
}

ValidationOutcome Transform::evaluate(const Value& value) const {
    return success(function_(value));
}

ValidatorPtr allOf(std::vector<ValidatorPtr> validators) {
    return std::make_shared<ValidatorChain>(std::move(validators));
}

ValidatorPtr anyOf(std::vector<ValidatorPtr> alternatives) {
    return std::make_shared<AnyOf>(std::move(alternatives));
}

ValidatorPtr negate(ValidatorPtr inner) {
    return std::make_shared<Not>(std::move(inner));
}

namespace Sanitizers {

ValidatorPtr trim() {
    return std::make_shared<Transform>([](const Value& value) {
        const std::string& text = value.as<std::string>();
        const auto first = text.find_first_not_of(" \t\n\r\f\v");
        if (first == std::string::npos) {
            return Value(std::string());
        }
        const auto last = text.find_last_not_of(" \t\n\r\f\v");
        return Value(text.substr(first, last - first + 1));
    }, "trim");
}

ValidatorPtr toLower() {
    return std::make_shared<Transform>(
        [](const Value& value) { return Value(changeCase(value, false)); }, "lower");
}

ValidatorPtr toUpper() {
    return std::make_shared<Transform>(
        [](const Value& value) { return Value(changeCase(value, true)); }, "upper");
}

} // namespace Sanitizers

} // namespace BJS::Validation
