// EN: Unit tests for the validator primitives and their outcome/adapter semantics
// FR: Tests unitaires pour les validateurs primitifs et la sémantique résultat/adaptateurs

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "validation/validators.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cmath>
#include <string>

using namespace BJS;
using namespace BJS::Validation;
using ::testing::_;
using ::testing::MockFunction;
using ::testing::Return;

// EN: Test fixture for validator tests
// FR: Fixture de test pour les tests de validateurs
class ValidatorsTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::getInstance();
        logger.setLogLevel(LogLevel::ERROR); // EN: Reduce noise during tests / FR: Réduit le bruit pendant les tests
    }

    // EN: Error code of a failing check, empty string when the check passes
    // FR: Code d'erreur d'une vérification en échec, chaîne vide si elle réussit
    static std::string codeOf(const Validator& validator, const Value& value) {
        ValidationOutcome outcome = validator.check(value);
        return outcome ? std::string() : outcome.failure().error_code;
    }
};

// EN: Outcome and adapters
// FR: Résultat et adaptateurs
TEST_F(ValidatorsTest, BooleanAdapterMatchesThrowingAdapter) {
    Range range(Value(0), Value(10));
    for (const Value& value : {Value(-1), Value(0), Value(5), Value(10), Value(11), Value("x")}) {
        bool threw = false;
        try {
            range.validate(value);
        } catch (const ValidationFailed&) {
            threw = true;
        }
        EXPECT_EQ(range(value), !threw) << value.repr();
    }
}

TEST_F(ValidatorsTest, FailureCarriesValueValidatorAndCode) {
    Range range(Value(0), Value(10));
    ValidationOutcome outcome = range.check(Value(42));

    ASSERT_FALSE(outcome.isValid());
    const ValidationFailure& failure = outcome.failure();
    EXPECT_EQ(failure.value, Value(42));
    EXPECT_EQ(failure.validator, &range);
    EXPECT_EQ(failure.validator_kind, "Range");
    EXPECT_EQ(failure.error_code, "out_of_range");
    EXPECT_EQ(failure.message(), "value outside of range [0 <= ? <= 10]");
    EXPECT_THROW(outcome.value(), ValidationFailed);
}

TEST_F(ValidatorsTest, ValidationFailedExposesFailure) {
    Range range(Value(0), Value(10));
    try {
        range.validate(Value(11));
        FAIL() << "expected ValidationFailed";
    } catch (const ValidationFailed& e) {
        EXPECT_EQ(e.errorCode(), "out_of_range");
        EXPECT_EQ(e.value(), Value(11));
        EXPECT_EQ(e.validator(), &range);
        EXPECT_STREQ(e.what(), "value outside of range [0 <= ? <= 10]");
    }
}

TEST_F(ValidatorsTest, SuccessOutcomeHasNoFailure) {
    Range range(Value(0), Value(10));
    ValidationOutcome outcome = range.check(Value(3));
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value(), Value(3));
    EXPECT_THROW(outcome.failure(), Error);
}

TEST_F(ValidatorsTest, UnknownErrorCodeRendersGenericMessage) {
    Range range(Value(0), Value(10));
    EXPECT_EQ(range.renderMessage("no_such_code", Value(1)), "validation failed");
}

TEST_F(ValidatorsTest, ValidationIsIdempotent) {
    Length length(1, 3);
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(length(Value("ab")));
        EXPECT_EQ(codeOf(length, Value("abcd")), "length_out_of_range");
    }
}

// EN: Predicate
// FR: Prédicat
TEST_F(ValidatorsTest, PredicateStrictAndLenient) {
    Predicate is_even([](const Value& v) { return Value(v.as<int64_t>() % 2 == 0); }, true, "is_even");
    EXPECT_TRUE(is_even(Value(4)));
    EXPECT_EQ(codeOf(is_even, Value(3)), "not_satisfied");
    EXPECT_EQ(is_even.renderMessage("not_satisfied", Value(3)), "custom validation function is not satisfied");
    EXPECT_EQ(is_even.describe(), "Predicate(is_even, strict=true)");

    Predicate strict_int([](const Value& v) { return v; });
    EXPECT_THROW(strict_int.check(Value(1)), ValueTypeError);

    Predicate lenient_int([](const Value& v) { return v; }, false);
    EXPECT_TRUE(lenient_int(Value(1)));
    EXPECT_EQ(codeOf(lenient_int, Value(0)), "not_satisfied");
}

TEST_F(ValidatorsTest, PredicateRequiresCallable) {
    EXPECT_THROW(Predicate(PredicateFunction{}), ConfigurationError);
}

TEST_F(ValidatorsTest, PredicateCalledOncePerCheck) {
    MockFunction<Value(const Value&)> mock_predicate;
    EXPECT_CALL(mock_predicate, Call(_))
        .WillOnce(Return(Value(true)))
        .WillOnce(Return(Value(false)));

    Predicate predicate(mock_predicate.AsStdFunction(), true, "mocked");
    EXPECT_TRUE(predicate(Value("first")));
    EXPECT_FALSE(predicate(Value("second")));
}

// EN: Equal / Match
// FR: Égalité / Correspondance
TEST_F(ValidatorsTest, EqualDefaultsToEquality) {
    Equal equal(Value(5));
    EXPECT_TRUE(equal(Value(5)));
    EXPECT_TRUE(equal(Value(5.0)));
    EXPECT_EQ(codeOf(equal, Value(6)), "not_matched");
    EXPECT_EQ(equal.renderMessage("not_matched", Value(6)), "value not matching target 5");
    EXPECT_EQ(equal.describe(), "Equal(target=5, strict=true)");

    Match match(Value("a"));
    EXPECT_EQ(match.renderMessage("not_matched", Value("b")), "value not matching target \"a\"");
}

TEST_F(ValidatorsTest, EqualWithCustomComparator) {
    Equal exact(Value(0.3));
    EXPECT_FALSE(exact(Value(0.1 + 0.2)));

    Equal close(Value(0.3), Comparators::isClose());
    EXPECT_TRUE(close(Value(0.1 + 0.2)));
    EXPECT_THROW(close.check(Value("0.3")), ValueTypeError);
}

TEST_F(ValidatorsTest, EqualStrictComparatorResult) {
    CompareFunction difference = [](const Value& a, const Value& b) {
        return Value(a.as<int64_t>() - b.as<int64_t>());
    };
    Equal strict(Value(3), difference);
    EXPECT_THROW(strict.check(Value(3)), ValueTypeError);

    Equal lenient(Value(3), difference, false);
    EXPECT_TRUE(lenient(Value(4)));
    EXPECT_FALSE(lenient(Value(3)));
}

// EN: Range
// FR: Intervalle
TEST_F(ValidatorsTest, RangeAcceptsInclusiveBounds) {
    Range range(Value(1), Value(5));
    EXPECT_TRUE(range(Value(1)));
    EXPECT_TRUE(range(Value(5)));
    EXPECT_TRUE(range(Value(2.5)));
    EXPECT_EQ(codeOf(range, Value(0)), "out_of_range");
    EXPECT_EQ(range.describe(), "Range(min=1, max=5, min_inclusive=true, max_inclusive=true)");
}

TEST_F(ValidatorsTest, RangeExclusiveBounds) {
    Range range(Value(-12), Value(-6), false);
    EXPECT_EQ(codeOf(range, Value(-12)), "out_of_range");
    EXPECT_TRUE(range(Value(-6)));
    EXPECT_EQ(range.rangeString(), "-12 < ? <= -6");

    Range upper(Value(0), Value(1), true, false);
    EXPECT_EQ(codeOf(upper, Value(1)), "out_of_range");
    EXPECT_EQ(upper.rangeString(), "0 <= ? < 1");
}

TEST_F(ValidatorsTest, RangeOpenEnded) {
    Range at_least = Range::atLeast(Value(18));
    EXPECT_TRUE(at_least(Value(1000)));
    EXPECT_FALSE(at_least(Value(17)));
    EXPECT_EQ(at_least.rangeString(), "18 <= ?");

    Range at_most = Range::atMost(Value("m"), false);
    EXPECT_TRUE(at_most(Value("a")));
    EXPECT_FALSE(at_most(Value("m")));
    EXPECT_EQ(at_most.rangeString(), "? < m");
}

TEST_F(ValidatorsTest, RangeOverTuples) {
    Range range(Value(Value::List{3, 10}), Value(Value::List{3, 11}));
    EXPECT_TRUE(range(Value(Value::List{3, 10, Value()})));
    EXPECT_FALSE(range(Value(Value::List{3, 12})));
}

TEST_F(ValidatorsTest, RangeIncomparableValues) {
    Range tuple_min(Value(Value::List{1}), std::nullopt);
    EXPECT_EQ(codeOf(tuple_min, Value(2)), "incomparable");
    EXPECT_EQ(tuple_min.renderMessage("incomparable", Value(2)), "cannot compare value against the range [[1] <= ?]");

    Range numbers(Value(0), Value(10));
    EXPECT_EQ(codeOf(numbers, Value("5")), "incomparable");

    Range raising(Value(0), Value(10), true, true, false);
    EXPECT_THROW(raising.check(Value("5")), ValueTypeError);
}

TEST_F(ValidatorsTest, RangeRejectsNanAsOutOfRange) {
    Range numbers(Value(0), Value(10));
    EXPECT_EQ(codeOf(numbers, Value(std::nan(""))), "out_of_range");

    Range raising(Value(0), Value(10), true, true, false);
    EXPECT_EQ(codeOf(raising, Value(std::nan(""))), "out_of_range");

    Range nan_bound(Value(std::nan("")), std::nullopt);
    EXPECT_EQ(codeOf(nan_bound, Value(5)), "out_of_range");
}

TEST_F(ValidatorsTest, RangeOverDates) {
    Range range(Value(Date(2020, 1, 1)), Value(Date(2020, 12, 31)));
    EXPECT_TRUE(range(Value(Date(2020, 6, 15))));
    EXPECT_FALSE(range(Value(Date(2021, 1, 1))));
    EXPECT_EQ(range.rangeString(), "2020-01-01 <= ? <= 2020-12-31");
}

// EN: Length
// FR: Longueur
TEST_F(ValidatorsTest, LengthExact) {
    Length length = Length::exactly(4);
    EXPECT_TRUE(length(Value("good")));
    EXPECT_EQ(codeOf(length, Value("not ok")), "length_out_of_range");
    EXPECT_EQ(length.renderMessage("length_out_of_range", Value("not ok")), "length outside of range [? == 4]");
    EXPECT_EQ(length.describe(), "Length(equal=4)");
}

TEST_F(ValidatorsTest, LengthBounds) {
    Length length(1, 3);
    EXPECT_TRUE(length(Value(Value::List{1})));
    EXPECT_TRUE(length(Value(Value::Map{{"a", 1}, {"b", 2}, {"c", 3}})));
    EXPECT_FALSE(length(Value("")));
    EXPECT_FALSE(length(Value("abcd")));
    EXPECT_EQ(length.rangeString(), "1 <= ? <= 3");
    EXPECT_EQ(length.describe(), "Length(min=1, max=3)");

    Length at_most(std::nullopt, 255);
    EXPECT_EQ(at_most.rangeString(), "? <= 255");
}

TEST_F(ValidatorsTest, LengthCountsCodePoints) {
    Length at_most(std::nullopt, 5);
    EXPECT_TRUE(at_most(Value("h\xC3\xA9llo")));
    EXPECT_FALSE(at_most(Value("h\xC3\xA9llo!")));

    Length two = Length::exactly(2);
    EXPECT_TRUE(two(Value("\xC3\xA9t")));
}

TEST_F(ValidatorsTest, LengthUncomputable) {
    Length length(1, std::nullopt);
    EXPECT_EQ(codeOf(length, Value(12)), "uncomputable_length");

    Length raising(1, std::nullopt, std::nullopt, false);
    EXPECT_THROW(raising.check(Value(12)), ValueTypeError);
}

TEST_F(ValidatorsTest, LengthSetupErrors) {
    EXPECT_THROW(Length(0, std::nullopt, 0), ConfigurationError);
    EXPECT_THROW(Length(std::nullopt, 5, 2), ConfigurationError);
    EXPECT_THROW(Length(-1, std::nullopt), ConfigurationError);
    EXPECT_THROW(Length::exactly(-2), ConfigurationError);
}

// EN: Regexp
// FR: Expression régulière
TEST_F(ValidatorsTest, RegexpFullMatch) {
    Regexp regexp(R"(\w+|\d)");
    EXPECT_TRUE(regexp(Value("abc")));
    EXPECT_EQ(codeOf(regexp, Value("no more tests")), "not_matched");
    EXPECT_EQ(regexp.renderMessage("not_matched", Value("x y")),
              "value does not match the regexp pattern: \\w+|\\d");
    EXPECT_EQ(codeOf(regexp, Value(12)), "not_string");
}

TEST_F(ValidatorsTest, RegexpPostValidation) {
    PredicateFunction sum_is_1801 = [](const Value& groups) {
        int64_t total = 0;
        for (const auto& group : groups.as<Value::List>()) {
            total += std::stoll(group.as<std::string>());
        }
        return Value(total == 1801);
    };
    Regexp regexp(R"((\d+):(\d+))", sum_is_1801);

    EXPECT_TRUE(regexp(Value("1234:567")));
    EXPECT_EQ(codeOf(regexp, Value("123:4567")), "not_satisfied");
    EXPECT_EQ(codeOf(regexp, Value("1234567")), "not_matched");
}

TEST_F(ValidatorsTest, RegexpUnmatchedGroupsAreNull) {
    Value captured;
    Regexp regexp(R"((a)?(b))", [&captured](const Value& groups) {
        captured = groups;
        return Value(true);
    });
    EXPECT_TRUE(regexp(Value("b")));
    EXPECT_EQ(captured, Value(Value::List{Value(), "b"}));
}

TEST_F(ValidatorsTest, RegexpInvalidPattern) {
    EXPECT_THROW(Regexp("(unclosed"), ConfigurationError);
    EXPECT_THROW(Regexp("a+", {}, true, 0), ConfigurationError);
}

TEST_F(ValidatorsTest, RegexpRejectsOverlongInput) {
    Regexp regexp(R"(\w+|\d)");
    EXPECT_EQ(regexp.maxLength(), Regexp::DEFAULT_MAX_LENGTH);
    EXPECT_TRUE(regexp(Value(std::string(Regexp::DEFAULT_MAX_LENGTH, 'a'))));

    const Value huge(std::string(100000, 'a'));
    EXPECT_EQ(codeOf(regexp, huge), "too_long");
    EXPECT_THROW(regexp.validate(huge), ValidationFailed);
    EXPECT_EQ(regexp.renderMessage("too_long", huge),
              "value is longer than 8192 bytes and cannot be matched");

    Regexp short_limit("[a-z]+", {}, true, 4);
    EXPECT_TRUE(short_limit(Value("abcd")));
    EXPECT_EQ(codeOf(short_limit, Value("abcde")), "too_long");
    EXPECT_EQ(short_limit.describe(), "Regexp(pattern=\"[a-z]+\", max_length=4)");
}

// EN: InChoices
// FR: Choix
TEST_F(ValidatorsTest, InChoicesWithList) {
    InChoices choices(Value(Value::List{0, 3, 6, 9}));
    EXPECT_TRUE(choices(Value(6)));
    EXPECT_EQ(codeOf(choices, Value(3 + 1e-12)), "not_found");
    EXPECT_EQ(choices.describe(), "InChoices(choices=[0, 3, 6, 9])");

    InChoices close(Value(Value::List{0, 3, 6, 9}), Comparators::isClose());
    EXPECT_TRUE(close(Value(3 + 1e-12)));
}

TEST_F(ValidatorsTest, InChoicesWithStringAndMap) {
    InChoices vowels(Value("aeiou"));
    EXPECT_TRUE(vowels(Value("e")));
    EXPECT_FALSE(vowels(Value("b")));
    EXPECT_FALSE(vowels(Value("ae")));

    InChoices keys(Value(Value::Map{{"red", 1}, {"green", 2}}));
    EXPECT_TRUE(keys(Value("green")));
    EXPECT_FALSE(keys(Value(1)));
}

TEST_F(ValidatorsTest, InChoicesSplitsStringsByCodePoint) {
    InChoices letters(Value("\xC3\xA9t\xC3\xA9"));
    EXPECT_EQ(letters.choices().size(), 3u);
    EXPECT_TRUE(letters(Value("\xC3\xA9")));
    EXPECT_TRUE(letters(Value("t")));
    EXPECT_FALSE(letters(Value("\xC3")));
}

TEST_F(ValidatorsTest, InChoicesRequiresIterable) {
    EXPECT_THROW(InChoices(Value(5)), ConfigurationError);
}

// EN: Iteration helper
// FR: Utilitaire d'itération
TEST_F(ValidatorsTest, IterateValue) {
    EXPECT_EQ(iterateValue(Value("ab")).size(), 2u);
    EXPECT_EQ(iterateValue(Value("\xC3\xA9" "a")), (Value::List{"\xC3\xA9", "a"}));
    EXPECT_EQ(iterateValue(Value(Value::Map{{"k", 1}}))[0], Value("k"));
    EXPECT_THROW(iterateValue(Value(1.5)), ValueTypeError);
}
