// EN: Implementation of the validator primitives.
// FR: Implémentation des validateurs primitifs.

#include "validation/validators.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace BJS::Validation {

namespace {

std::string boolText(bool flag) {
    return flag ? "true" : "false";
}

} // namespace

Value::List iterateValue(const Value& value) {
    switch (value.type()) {
        case ValueType::LIST:
            return value.as<Value::List>();
        case ValueType::STRING: {
            Value::List characters;
            for (auto& character : utf8Split(value.as<std::string>())) {
                characters.emplace_back(std::move(character));
            }
            return characters;
        }
        case ValueType::MAP: {
            Value::List keys;
            for (const auto& entry : value.as<Value::Map>()) {
                keys.emplace_back(entry.first);
            }
            return keys;
        }
        default:
            throw ValueTypeError("value of type " + valueTypeToString(value.type()) + " is not iterable");
    }
}

bool checkedResult(const Value& result, bool strict, const std::string& what) {
    if (strict && !result.is(ValueType::BOOLEAN)) {
        throw ValueTypeError(what + " must return boolean in strict mode (but received " +
                             result.repr() + ")");
    }
    return result.truthy();
}

// EN: Comparators
// FR: Comparateurs
namespace Comparators {

CompareFunction equality() {
    return [](const Value& value, const Value& target) { return Value(value == target); };
}

CompareFunction isClose(double rel_tol, double abs_tol) {
    if (rel_tol < 0.0 || abs_tol < 0.0) {
        throw ConfigurationError("tolerances must be non-negative");
    }
    return [rel_tol, abs_tol](const Value& value, const Value& target) {
        const double a = value.toDouble();
        const double b = target.toDouble();
        if (a == b) {
            return Value(true);
        }
        if (std::isinf(a) || std::isinf(b)) {
            return Value(false);
        }
        const double diff = std::fabs(a - b);
        return Value(diff <= std::max(rel_tol * std::max(std::fabs(a), std::fabs(b)), abs_tol));
    };
}

} // namespace Comparators

// EN: Predicate
// FR: Prédicat
Predicate::Predicate(PredicateFunction pred, bool strict, std::string name)
    : pred_(std::move(pred)), strict_(strict), name_(std::move(name)) {
    if (!pred_) {
        throw ConfigurationError("custom predicate must be a callable function");
    }
}

std::string Predicate::describe() const {
    return "Predicate(" + name_ + ", strict=" + boolText(strict_) + ")";
}

ValidationOutcome Predicate::evaluate(const Value& value) const {
    if (!checkedResult(pred_(value), strict_, "predicate")) {
        return failure(value, "not_satisfied");
    }
    return success(value);
}

const std::unordered_map<std::string, std::string>& Predicate::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"not_satisfied", "custom validation function is not satisfied"},
    };
    return templates;
}

// EN: Equal
// FR: Égalité
Equal::Equal(Value target, CompareFunction compare, bool strict)
    : target_(std::move(target)), compare_(std::move(compare)),
      custom_compare_(static_cast<bool>(compare_)), strict_(strict) {
    if (!compare_) {
        compare_ = Comparators::equality();
    }
}

std::string Equal::describe() const {
    std::string text = "Equal(target=" + target_.repr();
    if (custom_compare_) {
        text += ", compare=<function>";
    }
    return text + ", strict=" + boolText(strict_) + ")";
}

ValidationOutcome Equal::evaluate(const Value& value) const {
    if (!checkedResult(compare_(value, target_), strict_, "compare function")) {
        return failure(value, "not_matched");
    }
    return success(value);
}

const std::unordered_map<std::string, std::string>& Equal::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"not_matched", "value not matching target {target}"},
    };
    return templates;
}

std::optional<std::string> Equal::templateField(const std::string& name) const {
    if (name == "target") {
        return target_.repr();
    }
    return std::nullopt;
}

// EN: Range
// FR: Intervalle
Range::Range(std::optional<Value> min, std::optional<Value> max,
             bool min_inclusive, bool max_inclusive, bool absorb_cmp_error)
    : min_(std::move(min)), max_(std::move(max)), min_inclusive_(min_inclusive),
      max_inclusive_(max_inclusive), absorb_cmp_error_(absorb_cmp_error) {}

Range Range::atLeast(Value min, bool inclusive) {
    return Range(std::move(min), std::nullopt, inclusive, true);
}

Range Range::atMost(Value max, bool inclusive) {
    return Range(std::nullopt, std::move(max), true, inclusive);
}

std::string Range::rangeString() const {
    std::string statement = "?";
    if (min_) {
        statement = min_->toString() + (min_inclusive_ ? " <= " : " < ") + statement;
    }
    if (max_) {
        statement = statement + (max_inclusive_ ? " <= " : " < ") + max_->toString();
    }
    return statement;
}

std::string Range::describe() const {
    std::ostringstream out;
    out << "Range(";
    if (min_) {
        out << "min=" << min_->repr() << ", ";
    }
    if (max_) {
        out << "max=" << max_->repr() << ", ";
    }
    out << "min_inclusive=" << boolText(min_inclusive_)
        << ", max_inclusive=" << boolText(max_inclusive_) << ")";
    return out.str();
}

bool Range::compareLower(const Value& value) const {
    return !min_ || (min_inclusive_ ? value >= *min_ : value > *min_);
}

bool Range::compareUpper(const Value& value) const {
    return !max_ || (max_inclusive_ ? value <= *max_ : value < *max_);
}

ValidationOutcome Range::evaluate(const Value& value) const {
    bool within = false;
    try {
        within = compareLower(value) && compareUpper(value);
    } catch (const ValueTypeError&) {
        if (absorb_cmp_error_) {
            return failure(value, "incomparable");
        }
        throw;
    }
    if (!within) {
        return failure(value, "out_of_range");
    }
    return success(value);
}

const std::unordered_map<std::string, std::string>& Range::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"incomparable", "cannot compare value against the range [{range}]"},
        {"out_of_range", "value outside of range [{range}]"},
    };
    return templates;
}

std::optional<std::string> Range::templateField(const std::string& name) const {
    if (name == "range") {
        return rangeString();
    }
    if (name == "min" && min_) {
        return min_->toString();
    }
    if (name == "max" && max_) {
        return max_->toString();
    }
    return std::nullopt;
}

// EN: Length
// FR: Longueur
Length::Length(std::optional<int64_t> min, std::optional<int64_t> max,
               std::optional<int64_t> equal, bool absorb_len_error)
    : min_(min), max_(max), equal_(equal), absorb_len_error_(absorb_len_error) {
    if (equal_ && (min_ || max_)) {
        throw ConfigurationError("length 'equal' cannot be combined with 'min' or 'max'");
    }
    for (const auto& bound : {min_, max_, equal_}) {
        if (bound && *bound < 0) {
            throw ConfigurationError("length bounds must be non-negative (received " +
                                     std::to_string(*bound) + ")");
        }
    }
}

Length Length::exactly(int64_t length, bool absorb_len_error) {
    return Length(std::nullopt, std::nullopt, length, absorb_len_error);
}

std::string Length::rangeString() const {
    if (equal_) {
        return "? == " + std::to_string(*equal_);
    }
    std::string statement = "?";
    if (min_) {
        statement = std::to_string(*min_) + " <= " + statement;
    }
    if (max_) {
        statement = statement + " <= " + std::to_string(*max_);
    }
    return statement;
}

std::string Length::describe() const {
    if (equal_) {
        return "Length(equal=" + std::to_string(*equal_) + ")";
    }
    std::string text = "Length(";
    if (min_) {
        text += "min=" + std::to_string(*min_);
    }
    if (max_) {
        text += std::string(min_ ? ", " : "") + "max=" + std::to_string(*max_);
    }
    return text + ")";
}

ValidationOutcome Length::evaluate(const Value& value) const {
    int64_t length = 0;
    try {
        length = static_cast<int64_t>(value.length());
    } catch (const ValueTypeError&) {
        if (absorb_len_error_) {
            return failure(value, "uncomputable_length");
        }
        throw;
    }

    bool within = true;
    if (equal_) {
        within = length == *equal_;
    } else {
        within = (!min_ || *min_ <= length) && (!max_ || length <= *max_);
    }
    if (!within) {
        return failure(value, "length_out_of_range");
    }
    return success(value);
}

const std::unordered_map<std::string, std::string>& Length::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"uncomputable_length", "cannot compute length of value"},
        {"length_out_of_range", "length outside of range [{range}]"},
    };
    return templates;
}

std::optional<std::string> Length::templateField(const std::string& name) const {
    if (name == "range") {
        return rangeString();
    }
    if (name == "equal" && equal_) {
        return std::to_string(*equal_);
    }
    return std::nullopt;
}

// EN: Regexp
// FR: Expression régulière
Regexp::Regexp(const std::string& pattern, PredicateFunction post_validate, bool strict, std::size_t max_length)
    : source_(pattern), post_validate_(std::move(post_validate)), strict_(strict), max_length_(max_length) {
    if (max_length_ == 0) {
        throw ConfigurationError("regexp max_length must be positive");
    }
    try {
        regex_ = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw ConfigurationError("invalid regexp pattern '" + pattern + "': " + e.what());
    }
}

Regexp::Regexp(std::regex compiled, std::string source, PredicateFunction post_validate, bool strict,
               std::size_t max_length)
    : regex_(std::move(compiled)), source_(std::move(source)),
      post_validate_(std::move(post_validate)), strict_(strict), max_length_(max_length) {
    if (max_length_ == 0) {
        throw ConfigurationError("regexp max_length must be positive");
    }
}

std::string Regexp::describe() const {
    std::string text = "Regexp(pattern=" + Value(source_).repr();
    if (post_validate_) {
        text += ", post_validate=<function>, strict=" + boolText(strict_);
    }
    if (max_length_ != DEFAULT_MAX_LENGTH) {
        text += ", max_length=" + std::to_string(max_length_);
    }
    return text + ")";
}

ValidationOutcome Regexp::evaluate(const Value& value) const {
    const std::string* text = value.tryAs<std::string>();
    if (!text) {
        return failure(value, "not_string");
    }
    if (text->size() > max_length_) {
        return failure(value, "too_long");
    }

    std::smatch match;
    if (!std::regex_match(*text, match, regex_)) {
        return failure(value, "not_matched");
    }

    if (post_validate_) {
        Value::List groups;
        for (std::size_t i = 1; i < match.size(); ++i) {
            if (match[i].matched) {
                groups.emplace_back(match[i].str());
            } else {
                groups.emplace_back(nullptr);
            }
        }
        if (!checkedResult(post_validate_(Value(std::move(groups))), strict_, "post validation function")) {
            return failure(value, "not_satisfied");
        }
    }
    return success(value);
}

const std::unordered_map<std::string, std::string>& Regexp::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"not_string", "value must be a string"},
        {"too_long", "value is longer than {max_length} bytes and cannot be matched"},
        {"not_matched", "value does not match the regexp pattern: {pattern}"},
        {"not_satisfied", "custom validation function is not satisfied"},
    };
    return templates;
}

std::optional<std::string> Regexp::templateField(const std::string& name) const {
    if (name == "pattern") {
        return source_;
    }
    if (name == "max_length") {
        return std::to_string(max_length_);
    }
    return std::nullopt;
}

// EN: InChoices
// FR: Choix
InChoices::InChoices(const Value& choices, CompareFunction compare, bool strict)
    : compare_(std::move(compare)), strict_(strict) {
    try {
        choices_ = iterateValue(choices);
    } catch (const ValueTypeError& e) {
        throw ConfigurationError(std::string("choices must be iterable: ") + e.what());
    }
    if (!compare_) {
        compare_ = Comparators::equality();
    }
}

std::string InChoices::describe() const {
    return "InChoices(choices=" + Value(choices_).repr() + ")";
}

ValidationOutcome InChoices::evaluate(const Value& value) const {
    for (const auto& choice : choices_) {
        if (checkedResult(compare_(value, choice), strict_, "compare function")) {
            return success(value);
        }
    }
    return failure(value, "not_found");
}

const std::unordered_map<std::string, std::string>& InChoices::errorTemplates() const {
    static const std::unordered_map<std::string, std::string> templates = {
        {"not_found", "value not found in choices"},
    };
    return templates;
}

std::optional<std::string> InChoices::templateField(const std::string& name) const {
    if (name == "choices") {
        return Value(choices_).repr();
    }
    return std::nullopt;
}

} // namespace BJS::Validation
