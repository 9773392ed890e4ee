// EN: Implementation of the Field sanitize pipeline.
// FR: Implémentation du pipeline d'assainissement des champs.

#include "schema/field.hpp"

#include <sstream>

namespace BJS::Schema {

Field::Field(ValueType dtype)
    : dtype_(dtype), coercion_(CoercionPolicy::automatic()),
      parser_(IO::fromJson), formatter_(IO::toJson) {}

Field& Field::addValidator(Validation::ValidatorPtr validator) {
    if (!validator) {
        throw ConfigurationError("field '" + label() + "' received a null validator");
    }
    validators_.push_back(std::move(validator));
    return *this;
}

Field& Field::setValidators(std::vector<Validation::ValidatorPtr> validators) {
    validators_.clear();
    for (auto& validator : validators) {
        addValidator(std::move(validator));
    }
    return *this;
}

Field& Field::setDefault(Value default_value) {
    default_ = std::move(default_value);
    return *this;
}

Field& Field::clearDefault() {
    default_.reset();
    return *this;
}

Field& Field::setCoercion(CoercionPolicy coercion) {
    coercion_ = std::move(coercion);
    return *this;
}

Field& Field::setDescription(const std::string& description) {
    description_ = description;
    return *this;
}

Field& Field::setParser(IO::ValueParser parser) {
    if (!parser) {
        throw ConfigurationError("field '" + label() + "' parser must be a callable function");
    }
    parser_ = std::move(parser);
    return *this;
}

Field& Field::setFormatter(IO::ValueFormatter formatter) {
    if (!formatter) {
        throw ConfigurationError("field '" + label() + "' formatter must be a callable function");
    }
    formatter_ = std::move(formatter);
    return *this;
}

FieldPtr Field::bind(const std::string& name) const {
    if (isBound()) {
        throw ConfigurationError("field '" + name_ + "' is already bound and cannot be rebound as '" + name + "'");
    }
    if (name.empty()) {
        throw ConfigurationError("field name must not be empty");
    }
    auto bound = std::make_shared<Field>(*this);
    bound->name_ = name;
    return bound;
}

bool Field::acceptsType(const Value& value) const {
    return dtype_ == ValueType::ANY || value.type() == dtype_;
}

Value Field::coerce(const Value& value) const {
    if (auto function = CoercionRegistry::getInstance().resolve(coercion_, dtype_)) {
        Value coerced = (*function)(value);
        if (!acceptsType(coerced)) {
            throw FieldTypeError(label(), valueTypeToString(dtype_),
                                 valueTypeToString(coerced.type()), value.repr());
        }
        return coerced;
    }

    if (!acceptsType(value)) {
        throw FieldTypeError(label(), valueTypeToString(dtype_),
                             valueTypeToString(value.type()), value.repr());
    }
    return value;
}

Validation::ValidationOutcome Field::runValidators(const Value& value) const {
    Value current = value;
    for (const auto& validator : validators_) {
        Validation::ValidationOutcome outcome = validator->check(current);
        if (!outcome) {
            return outcome;
        }
        current = outcome.value();
    }
    return Validation::ValidationOutcome::success(std::move(current));
}

Value Field::sanitize(const Value& value) const {
    return runValidators(coerce(value)).valueOrThrow();
}

std::string Field::describe() const {
    std::ostringstream out;
    out << valueTypeToString(dtype_);
    if (default_) {
        out << " = " << default_->repr();
    } else {
        out << " (required)";
    }
    out << ", coercion: " << coercion_.toString();
    if (!validators_.empty()) {
        out << ", validators: ";
        for (std::size_t i = 0; i < validators_.size(); ++i) {
            if (i > 0) {
                out << ", ";
            }
            out << validators_[i]->describe();
        }
    }
    return out.str();
}

} // namespace BJS::Schema
