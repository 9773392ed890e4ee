// EN: Implementation of the Validator base class and its outcome types.
// FR: Implémentation de la classe de base Validator et de ses types de résultat.

#include "validation/validator.hpp"
#include "infrastructure/logging/logger.hpp"

namespace BJS::Validation {

namespace {

constexpr const char* GENERIC_MESSAGE = "validation failed";

} // namespace

std::string ValidationFailure::message() const {
    if (!validator) {
        return GENERIC_MESSAGE;
    }
    return validator->renderMessage(error_code, value);
}

ValidationFailed::ValidationFailed(ValidationFailure failure)
    : Error(failure.message()), failure_(std::move(failure)) {}

ValidationOutcome ValidationOutcome::success(Value value) {
    return ValidationOutcome(std::variant<Value, ValidationFailure>(std::in_place_index<0>, std::move(value)));
}

ValidationOutcome ValidationOutcome::failure(ValidationFailure failure) {
    return ValidationOutcome(std::variant<Value, ValidationFailure>(std::in_place_index<1>, std::move(failure)));
}

const Value& ValidationOutcome::value() const {
    if (const Value* value = std::get_if<Value>(&result_)) {
        return *value;
    }
    throw ValidationFailed(std::get<ValidationFailure>(result_));
}

const ValidationFailure& ValidationOutcome::failure() const {
    if (const ValidationFailure* failure = std::get_if<ValidationFailure>(&result_)) {
        return *failure;
    }
    throw Error("validation outcome holds no failure");
}

ValidationOutcome Validator::check(const Value& value) const {
    return evaluate(value);
}

Value Validator::validate(const Value& value) const {
    ValidationOutcome outcome = evaluate(value);
    if (!outcome) {
        throw ValidationFailed(outcome.failure());
    }
    return outcome.value();
}

bool Validator::operator()(const Value& value) const {
    return evaluate(value).isValid();
}

std::string Validator::renderMessage(const std::string& error_code, const Value& value) const {
    const auto& templates = errorTemplates();
    auto it = templates.find(error_code);
    if (it == templates.end()) {
        std::unordered_map<std::string, std::string> metadata = {
            {"error_code", error_code}, {"validator", kind()}};
        LOG_WARN_META("validator", "unknown error code", metadata);
        return GENERIC_MESSAGE;
    }

    // EN: Replace each {name} placeholder; unknown names are kept verbatim.
    // FR: Remplace chaque marqueur {nom} ; les noms inconnus sont conservés tels quels.
    const std::string& pattern = it->second;
    std::string rendered;
    rendered.reserve(pattern.size());
    std::size_t pos = 0;
    while (pos < pattern.size()) {
        std::size_t open = pattern.find('{', pos);
        if (open == std::string::npos) {
            rendered.append(pattern, pos, std::string::npos);
            break;
        }
        std::size_t close = pattern.find('}', open);
        if (close == std::string::npos) {
            rendered.append(pattern, pos, std::string::npos);
            break;
        }
        rendered.append(pattern, pos, open - pos);
        const std::string name = pattern.substr(open + 1, close - open - 1);
        if (name == "value") {
            rendered += value.repr();
        } else if (auto field = templateField(name)) {
            rendered += *field;
        } else {
            rendered.append(pattern, open, close - open + 1);
        }
        pos = close + 1;
    }
    return rendered;
}

const std::unordered_map<std::string, std::string>& Validator::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> empty;
    return empty;
}

std::optional<std::string> Validator::templateField(const std::string& /*name*/) const {
    return std::nullopt;
}

ValidationOutcome Validator::success(Value value) const {
    return ValidationOutcome::success(std::move(value));
}

ValidationOutcome Validator::failure(const Value& value, const std::string& error_code) const {
    return ValidationOutcome::failure(ValidationFailure{value, this, kind(), error_code});
}

} // namespace BJS::Validation
