// EN: Implementation of the ValidatorFactory.
// FR: Implémentation de la ValidatorFactory.

#include "validation/validator_factory.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>

namespace BJS::Validation {

namespace {

// EN: Reads named parameters of one validator kind and rejects leftovers.
// FR: Lit les paramètres nommés d'un type de validateur et rejette les restes.
class ParamReader {
public:
    ParamReader(const std::string& kind, const Value& params) : kind_(kind) {
        if (!params.is(ValueType::MAP)) {
            throw ConfigurationError("'" + kind + "' parameters must be a map (received " +
                                     params.repr() + ")");
        }
        params_ = params.as<Value::Map>();
    }

    // EN: Present and non-null parameter.
    // FR: Paramètre présent et non nul.
    std::optional<Value> take(const std::string& name) {
        auto it = params_.find(name);
        if (it == params_.end()) {
            return std::nullopt;
        }
        Value value = it->second;
        params_.erase(it);
        if (value.isNone()) {
            return std::nullopt;
        }
        return value;
    }

    Value require(const std::string& name) {
        auto value = take(name);
        if (!value) {
            throw ConfigurationError("'" + kind_ + "' requires parameter '" + name + "'");
        }
        return *value;
    }

    bool flag(const std::string& name, bool default_value) {
        auto value = take(name);
        if (!value) {
            return default_value;
        }
        if (!value->is(ValueType::BOOLEAN)) {
            throw ConfigurationError(name + " flag must be a boolean (but received " + value->repr() + ")");
        }
        return value->as<bool>();
    }

    std::optional<int64_t> integer(const std::string& name) {
        auto value = take(name);
        if (!value) {
            return std::nullopt;
        }
        if (!value->is(ValueType::INTEGER)) {
            throw ConfigurationError(name + " should be int if provided (but received " + value->repr() + ")");
        }
        return value->as<int64_t>();
    }

    std::optional<std::string> text(const std::string& name) {
        auto value = take(name);
        if (!value) {
            return std::nullopt;
        }
        if (!value->is(ValueType::STRING)) {
            throw ConfigurationError(name + " must be a string (but received " + value->repr() + ")");
        }
        return value->as<std::string>();
    }

    void finish() const {
        if (!params_.empty()) {
            throw ConfigurationError("unknown parameter '" + params_.begin()->first + "' for '" + kind_ + "'");
        }
    }

private:
    std::string kind_;
    Value::Map params_;
};

bool isNamedParams(const Value& params, const std::string& key) {
    const Value::Map* map = params.tryAs<Value::Map>();
    return map && map->count(key) > 0;
}

} // namespace

ValidatorFactory::ValidatorFactory() {
    // EN: Register built-in predicates
    // FR: Enregistre les prédicats intégrés
    registerPredicate("non_empty", [](const Value& value) {
        if (value.is(ValueType::STRING) || value.is(ValueType::LIST) || value.is(ValueType::MAP)) {
            return Value(value.length() > 0);
        }
        return Value(!value.isNone());
    });

    registerPredicate("alphanumeric", [](const Value& value) {
        const std::string* text = value.tryAs<std::string>();
        return Value(text && std::all_of(text->begin(), text->end(), [](unsigned char c) {
            return std::isalnum(c);
        }));
    });

    registerPredicate("numeric", [](const Value& value) {
        if (value.is(ValueType::INTEGER) || value.is(ValueType::FLOAT)) {
            return Value(true);
        }
        const std::string* text = value.tryAs<std::string>();
        return Value(text && !text->empty() && std::all_of(text->begin(), text->end(), [](unsigned char c) {
            return std::isdigit(c) || c == '.' || c == '-' || c == '+';
        }));
    });

    registerComparator("equal", Comparators::equality());
    registerComparator("is_close", Comparators::isClose());
}

ValidatorFactory& ValidatorFactory::getInstance() {
    static ValidatorFactory instance;
    return instance;
}

void ValidatorFactory::registerPredicate(const std::string& name, PredicateFunction predicate) {
    if (!predicate) {
        throw ConfigurationError("predicate '" + name + "' must be a callable function");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        predicates_[name] = std::move(predicate);
    }
    LOG_DEBUG("validator", "Predicate registered: " + name);
}

void ValidatorFactory::registerComparator(const std::string& name, CompareFunction comparator) {
    if (!comparator) {
        throw ConfigurationError("comparator '" + name + "' must be a callable function");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        comparators_[name] = std::move(comparator);
    }
    LOG_DEBUG("validator", "Comparator registered: " + name);
}

PredicateFunction ValidatorFactory::getPredicate(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = predicates_.find(name);
    if (it == predicates_.end()) {
        throw ConfigurationError("unknown predicate '" + name + "'");
    }
    return it->second;
}

CompareFunction ValidatorFactory::getComparator(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = comparators_.find(name);
    if (it == comparators_.end()) {
        throw ConfigurationError("unknown comparator '" + name + "'");
    }
    return it->second;
}

bool ValidatorFactory::hasPredicate(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return predicates_.count(name) > 0;
}

bool ValidatorFactory::hasComparator(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return comparators_.count(name) > 0;
}

std::vector<std::string> ValidatorFactory::getAvailableKinds() const {
    return {"predicate", "equal", "match", "range", "length", "regexp",
            "in_choices", "all_of", "any_of", "not"};
}

ValidatorPtr ValidatorFactory::create(const std::string& kind, const Value& params) const {
    if (kind == "predicate") return createPredicate(params);
    if (kind == "equal" || kind == "match") return createEqual(params);
    if (kind == "range") return createRange(params);
    if (kind == "length") return createLength(params);
    if (kind == "regexp") return createRegexp(params);
    if (kind == "in_choices") return createInChoices(params);
    if (kind == "all_of") return allOf(createList(kind, params));
    if (kind == "any_of") return anyOf(createList(kind, params));
    if (kind == "not") return negate(createFromSpec(params));
    throw ConfigurationError("unknown validator kind '" + kind + "'");
}

ValidatorPtr ValidatorFactory::createFromSpec(const Value& spec) const {
    if (const std::string* name = spec.tryAs<std::string>()) {
        return std::make_shared<Predicate>(getPredicate(*name), true, *name);
    }
    const Value::Map* map = spec.tryAs<Value::Map>();
    if (!map || map->size() != 1) {
        throw ConfigurationError("validator spec must be a predicate name or a single-entry map {kind: params} "
                                 "(received " + spec.repr() + ")");
    }
    return create(map->begin()->first, map->begin()->second);
}

ValidatorPtr ValidatorFactory::createPredicate(const Value& params) const {
    if (const std::string* name = params.tryAs<std::string>()) {
        return std::make_shared<Predicate>(getPredicate(*name), true, *name);
    }
    ParamReader reader("predicate", params);
    const std::string name = reader.text("name").value_or("");
    if (name.empty()) {
        throw ConfigurationError("'predicate' requires parameter 'name'");
    }
    const bool strict = reader.flag("strict", true);
    reader.finish();
    return std::make_shared<Predicate>(getPredicate(name), strict, name);
}

ValidatorPtr ValidatorFactory::createEqual(const Value& params) const {
    if (!isNamedParams(params, "target")) {
        return std::make_shared<Equal>(params);
    }
    ParamReader reader("equal", params);
    Value target = reader.require("target");
    CompareFunction compare;
    if (auto name = reader.text("compare")) {
        compare = getComparator(*name);
    }
    const bool strict = reader.flag("strict", true);
    reader.finish();
    return std::make_shared<Equal>(std::move(target), std::move(compare), strict);
}

ValidatorPtr ValidatorFactory::createRange(const Value& params) const {
    ParamReader reader("range", params);
    auto min = reader.take("min");
    auto max = reader.take("max");
    const bool min_inclusive = reader.flag("min_inclusive", true);
    const bool max_inclusive = reader.flag("max_inclusive", true);
    const bool absorb = reader.flag("absorb_cmp_error", true);
    reader.finish();
    return std::make_shared<Range>(std::move(min), std::move(max), min_inclusive, max_inclusive, absorb);
}

ValidatorPtr ValidatorFactory::createLength(const Value& params) const {
    if (const int64_t* exact = params.tryAs<int64_t>()) {
        return std::make_shared<Length>(Length::exactly(*exact));
    }
    ParamReader reader("length", params);
    auto min = reader.integer("min");
    auto max = reader.integer("max");
    auto equal = reader.integer("equal");
    const bool absorb = reader.flag("absorb_len_error", true);
    reader.finish();
    return std::make_shared<Length>(min, max, equal, absorb);
}

ValidatorPtr ValidatorFactory::createRegexp(const Value& params) const {
    if (const std::string* pattern = params.tryAs<std::string>()) {
        return std::make_shared<Regexp>(*pattern);
    }
    if (!params.is(ValueType::MAP)) {
        throw ConfigurationError("regexp pattern should be a string (but received " + params.repr() + ")");
    }
    ParamReader reader("regexp", params);
    auto pattern = reader.text("pattern");
    if (!pattern) {
        throw ConfigurationError("'regexp' requires parameter 'pattern'");
    }
    PredicateFunction post;
    if (auto name = reader.text("post_validate")) {
        post = getPredicate(*name);
    }
    const bool strict = reader.flag("strict", true);
    const auto max_length = reader.integer("max_length");
    reader.finish();
    if (max_length && *max_length <= 0) {
        throw ConfigurationError("max_length must be positive (but received " + std::to_string(*max_length) + ")");
    }
    return std::make_shared<Regexp>(*pattern, std::move(post), strict,
                                    max_length ? static_cast<std::size_t>(*max_length)
                                               : Regexp::DEFAULT_MAX_LENGTH);
}

ValidatorPtr ValidatorFactory::createInChoices(const Value& params) const {
    if (!isNamedParams(params, "choices")) {
        return std::make_shared<InChoices>(params);
    }
    ParamReader reader("in_choices", params);
    Value choices = reader.require("choices");
    CompareFunction compare;
    if (auto name = reader.text("compare")) {
        compare = getComparator(*name);
    }
    const bool strict = reader.flag("strict", true);
    reader.finish();
    return std::make_shared<InChoices>(choices, std::move(compare), strict);
}

std::vector<ValidatorPtr> ValidatorFactory::createList(const std::string& kind, const Value& params) const {
    const Value::List* specs = params.tryAs<Value::List>();
    if (!specs) {
        throw ConfigurationError("'" + kind + "' expects a list of validator specs (received " +
                                 params.repr() + ")");
    }
    std::vector<ValidatorPtr> validators;
    validators.reserve(specs->size());
    for (const auto& spec : *specs) {
        validators.push_back(createFromSpec(spec));
    }
    return validators;
}

} // namespace BJS::Validation
