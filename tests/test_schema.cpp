// EN: Unit tests for schemas (field aggregation, inheritance order, records, checks)
// FR: Tests unitaires pour les schémas (agrégation des champs, ordre d'héritage, enregistrements, vérifications)

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "schema/schema.hpp"
#include "validation/composition.hpp"
#include "validation/validators.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace BJS;
using namespace BJS::Schema;
using namespace BJS::Validation;
using ::testing::_;
using ::testing::MockFunction;

class SchemaTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::getInstance();
        logger.setLogLevel(LogLevel::ERROR); // EN: Reduce noise during tests / FR: Réduit le bruit pendant les tests

        Field name(ValueType::STRING);
        name.addValidator(Sanitizers::trim()).addValidator(std::make_shared<Length>(1, 32));

        Field age(ValueType::INTEGER);
        age.setDefault(Value(0)).addValidator(std::make_shared<Range>(Value(0), Value(150)));

        person_ = SchemaBuilder("Person")
                      .description("A person with a name and an age")
                      .field("name", name)
                      .field("age", age)
                      .build();
    }

    static SchemaPtr plain(const std::string& name, const std::vector<SchemaPtr>& bases,
                           const std::vector<std::string>& fields) {
        SchemaBuilder builder(name);
        builder.extends(bases);
        for (const auto& field : fields) {
            builder.field(field, Field(ValueType::ANY));
        }
        return builder.build();
    }

    SchemaPtr person_;
};

TEST_F(SchemaTest, FieldRegistryKeepsInsertionOrder) {
    FieldRegistry registry;
    registry.insertOrAssign("b", Field(ValueType::INTEGER).bind("b"));
    registry.insertOrAssign("a", Field(ValueType::INTEGER).bind("a"));
    registry.insertOrAssign("b", Field(ValueType::STRING).bind("b"));

    EXPECT_EQ(registry.names(), (std::vector<std::string>{"b", "a"}));
    EXPECT_EQ(registry.get("b")->dtype(), ValueType::STRING);
    EXPECT_EQ(registry.get("missing"), nullptr);
    EXPECT_EQ(registry.size(), 2u);
}

TEST_F(SchemaTest, MergeRedeclarationKeepsInheritedPosition) {
    FieldRegistry inherited;
    inherited.insertOrAssign("x", Field(ValueType::INTEGER).bind("x"));
    inherited.insertOrAssign("y", Field(ValueType::INTEGER).bind("y"));

    FieldRegistry local;
    local.insertOrAssign("z", Field(ValueType::INTEGER).bind("z"));
    local.insertOrAssign("x", Field(ValueType::STRING).bind("x"));

    FieldRegistry merged = mergeFieldRegistries(inherited, local);
    EXPECT_EQ(merged.names(), (std::vector<std::string>{"x", "y", "z"}));
    EXPECT_EQ(merged.get("x")->dtype(), ValueType::STRING);
}

TEST_F(SchemaTest, SubclassFieldsFollowInheritedOnes) {
    Field id(ValueType::INTEGER);
    Field nickname(ValueType::STRING);
    nickname.setDefault(Value("anon"));
    Field age(ValueType::INTEGER);
    age.setDefault(Value(18));

    SchemaPtr employee = SchemaBuilder("Employee")
                             .extends(person_)
                             .field("id", id)
                             .field("age", age)
                             .field("nickname", nickname)
                             .build();

    EXPECT_EQ(employee->allFields().names(), (std::vector<std::string>{"name", "age", "id", "nickname"}));
    EXPECT_EQ(employee->ownFields().names(), (std::vector<std::string>{"id", "age", "nickname"}));
    EXPECT_EQ(employee->getField("age")->defaultValue(), std::optional<Value>(Value(18)));
    EXPECT_EQ(person_->getField("age")->defaultValue(), std::optional<Value>(Value(0)));
    EXPECT_EQ(employee->signature(), "Employee(*, name, age=18, id, nickname=\"anon\")");

    EXPECT_TRUE(employee->isSubtypeOf(*person_));
    EXPECT_FALSE(person_->isSubtypeOf(*employee));
    EXPECT_TRUE(person_->isSubtypeOf(*person_));
}

// EN: Each ancestor contributes its already-merged fields, most-base first
// FR: Chaque ancêtre apporte ses champs déjà fusionnés, du plus général au plus dérivé
TEST_F(SchemaTest, DiamondInheritanceOrder) {
    SchemaPtr a = plain("A", {}, {"a", "shared"});
    SchemaPtr b = plain("B", {a}, {"b"});
    SchemaPtr c = plain("C", {a}, {"c", "shared"});
    SchemaPtr d = plain("D", {b, c}, {"d"});

    EXPECT_EQ(d->mro(), (std::vector<std::string>{"D", "B", "C", "A"}));
    EXPECT_EQ(d->allFields().names(), (std::vector<std::string>{"a", "shared", "c", "b", "d"}));
    EXPECT_EQ(d->getField("shared"), a->getField("shared"));
    ASSERT_EQ(d->ancestors().size(), 3u);
    EXPECT_EQ(d->ancestors().front(), b);
}

TEST_F(SchemaTest, InconsistentInheritanceIsRejected) {
    SchemaPtr a = plain("A", {}, {"a"});
    SchemaPtr b = plain("B", {a}, {"b"});

    try {
        plain("Broken", {a, b}, {});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(std::string(e.what()), "cannot create a consistent inheritance order for schema 'Broken'");
    }
}

TEST_F(SchemaTest, BuilderChecks) {
    EXPECT_THROW(SchemaBuilder(""), ConfigurationError);
    EXPECT_THROW(SchemaBuilder("S").extends(SchemaPtr{}), ConfigurationError);
    EXPECT_THROW(SchemaBuilder("S").extends(person_).extends(person_), ConfigurationError);

    try {
        SchemaBuilder("S").field("x", Field(ValueType::ANY)).field("x", Field(ValueType::ANY));
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(std::string(e.what()), "field 'x' is declared twice in schema 'S'");
    }

    EXPECT_EQ(SchemaBuilder("Empty").build()->signature(), "Empty()");
}

TEST_F(SchemaTest, CreateSanitizesAndFillsDefaults) {
    Record john = person_->create({{"name", Value("  John ")}, {"age", Value("20")}});
    EXPECT_EQ(john.get("name"), Value("John"));
    EXPECT_EQ(john.get("age"), Value(20));
    EXPECT_EQ(john.repr(), "<Person name=\"John\" age=20>");

    Record baby = person_->create({{"name", Value("Ann")}});
    EXPECT_EQ(baby.get("age"), Value(0));
    EXPECT_TRUE(baby.has("age"));
    EXPECT_EQ(baby.schema(), person_);
}

TEST_F(SchemaTest, CreateRejectsUnknownBeforeMissing) {
    try {
        person_->create({{"nmae", Value("John")}});
        FAIL() << "expected UnknownFieldError";
    } catch (const UnknownFieldError& e) {
        EXPECT_EQ(std::string(e.what()), "unknown field 'nmae' for schema 'Person'");
    }

    try {
        person_->create({{"age", Value(3)}});
        FAIL() << "expected MissingFieldError";
    } catch (const MissingFieldError& e) {
        EXPECT_EQ(std::string(e.what()), "missing required field 'name' for schema 'Person'");
    }

    EXPECT_THROW(person_->create({{"name", Value("John")}, {"age", Value(200)}}), ValidationFailed);
    EXPECT_THROW(person_->create({{"name", Value("John")}, {"age", Value("old")}}), CoercionError);
}

TEST_F(SchemaTest, UnknownFieldStopsCreateBeforeAnySanitizing) {
    MockFunction<Value(const Value&)> coerce;
    MockFunction<Value(const Value&)> predicate;
    EXPECT_CALL(coerce, Call(_)).Times(0);
    EXPECT_CALL(predicate, Call(_)).Times(0);

    Field code(ValueType::STRING);
    code.setCoercion(CoercionPolicy::custom(coerce.AsStdFunction(), "code"))
        .addValidator(std::make_shared<Predicate>(predicate.AsStdFunction()));
    SchemaPtr tagged = SchemaBuilder("Tagged").field("code", code).build();

    EXPECT_THROW(tagged->create({{"code", Value("abc")}, {"extra", Value(1)}}), UnknownFieldError);
}

TEST_F(SchemaTest, DefaultsAreStoredAsGiven) {
    Field level(ValueType::INTEGER);
    level.setDefault(Value("high")).addValidator(std::make_shared<Range>(Value(0), Value(10)));
    SchemaPtr schema = SchemaBuilder("Settings").field("level", level).build();

    Record settings = schema->create({});
    EXPECT_EQ(settings.get("level"), Value("high"));
}

TEST_F(SchemaTest, SetRevalidatesAndKeepsOldValueOnFailure) {
    Record john = person_->create({{"name", Value("John")}, {"age", Value(20)}});

    john.set("age", Value("21"));
    EXPECT_EQ(john.get("age"), Value(21));

    EXPECT_THROW(john.set("age", Value(-5)), ValidationFailed);
    EXPECT_EQ(john.get("age"), Value(21));

    EXPECT_THROW(john.set("email", Value("x@y")), UnknownFieldError);
    EXPECT_THROW(john.get("email"), UnknownFieldError);
}

TEST_F(SchemaTest, RecordEquality) {
    Record first = person_->create({{"name", Value("John")}, {"age", Value(20)}});
    Record second = person_->create({{"name", Value(" John")}, {"age", Value("20")}});
    Record third = person_->create({{"name", Value("John")}});

    EXPECT_EQ(first, second);
    EXPECT_NE(first, third);

    SchemaPtr twin = SchemaBuilder("Person").field("name", Field(ValueType::STRING)).field("age", Field(ValueType::INTEGER)).build();
    EXPECT_NE(first, twin->create({{"name", Value("John")}, {"age", Value(20)}}));
}

TEST_F(SchemaTest, JsonRoundTrip) {
    Record john = person_->fromJson(R"({"name": "John", "age": "20"})");
    EXPECT_EQ(john.get("age"), Value(20));
    EXPECT_EQ(john.toJson(), R"({"age":20,"name":"John"})");

    SchemaPtr event = SchemaBuilder("Event").field("on", Field(ValueType::DATE)).build();
    Record launch = event->fromJson(R"({"on": "2020-03-04"})");
    EXPECT_EQ(launch.get("on"), Value(Date(2020, 3, 4)));
    EXPECT_EQ(launch.toJson(), R"({"on":"2020-03-04"})");
}

TEST_F(SchemaTest, FromJsonErrors) {
    try {
        person_->fromJson("[1, 2]");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(std::string(e.what()), "schema 'Person' expects a JSON object (received array)");
    }
    EXPECT_THROW(person_->fromJson("{\"name\": "), ParseError);
    EXPECT_THROW(person_->fromJson(R"({"name": "John", "email": "j@x"})"), UnknownFieldError);
}

TEST_F(SchemaTest, CheckCollectsEveryIssue) {
    RecordCheck result = person_->check({{"age", Value(200)}, {"email", Value("x")}});
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.schema_name, "Person");
    ASSERT_EQ(result.issues.size(), 3u);

    EXPECT_EQ(result.issuesFor("email").at(0).error_code, "unknown_field");
    EXPECT_EQ(result.issuesFor("name").at(0).error_code, "missing_field");
    EXPECT_EQ(result.issuesFor("age").at(0).error_code, "out_of_range");
    EXPECT_EQ(result.issuesFor("age").at(0).message, "value outside of range [0 <= ? <= 150]");

    std::string report = result.report();
    EXPECT_NE(report.find("=== Record Check Report ==="), std::string::npos);
    EXPECT_NE(report.find("Overall Status: INVALID"), std::string::npos);
    EXPECT_NE(report.find("Field 'name' [missing_field]: missing required field 'name' for schema 'Person'"),
              std::string::npos);
}

TEST_F(SchemaTest, CheckReportsCoercionProblems) {
    Field flag(ValueType::BOOLEAN);
    Field strict_count(ValueType::INTEGER);
    strict_count.setCoercion(CoercionPolicy::disabled());
    SchemaPtr schema = SchemaBuilder("Flags").field("flag", flag).field("count", strict_count).build();

    RecordCheck result = schema->check({{"flag", Value("perhaps")}, {"count", Value("3")}});
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issuesFor("flag").at(0).error_code, "coercion_failed");
    EXPECT_EQ(result.issuesFor("count").at(0).error_code, "type_mismatch");

    RecordCheck clean = person_->check({{"name", Value("John")}});
    EXPECT_TRUE(clean.is_valid);
    EXPECT_EQ(clean.report(), "=== Record Check Report ===\nSchema: Person\nIssues: 0\nOverall Status: VALID\n");
}

TEST_F(SchemaTest, SignatureAndDescribe) {
    EXPECT_EQ(person_->signature(), "Person(*, name, age=0)");

    Field badge(ValueType::STRING);
    badge.setDescription("Badge number");
    SchemaPtr employee = SchemaBuilder("Employee").extends(person_).field("badge", badge).build();

    const std::string doc = employee->describe();
    EXPECT_EQ(doc.rfind("=== Schema: Employee ===\n", 0), 0u);
    EXPECT_NE(doc.find("Extends: Person\n"), std::string::npos);
    EXPECT_NE(doc.find("Fields (3):\n"), std::string::npos);
    EXPECT_NE(doc.find("  age: integer = 0, coercion: automatic"), std::string::npos);
    EXPECT_NE(doc.find("[inherited]"), std::string::npos);
    EXPECT_NE(doc.find("  badge: string (required), coercion: automatic\n      Badge number\n"), std::string::npos);
}
