#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "schema/schema.hpp"
#include "schema/schema_loader.hpp"
#include "validation/composition.hpp"
#include "validation/validators.hpp"
#include <iostream>

using namespace BJS;
using namespace BJS::Schema;
using namespace BJS::Validation;

int main() {
    auto& logger = BJS::Logger::getInstance();
    auto& config = BJS::ConfigManager::getInstance();

    // Settings first, so the logger follows logging.*
    const std::string settings = R"(
logging:
  level: info
  console: true
)";
    config.registerDefaultRules();
    if (!config.loadFromString(settings)) {
        LOG_ERROR("schema_example", "Failed to load settings");
        return 1;
    }
    config.loadEnvironmentOverrides();

    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        for (const auto& error : errors) {
            LOG_ERROR("schema_example", error);
        }
        return 1;
    }
    config.applyLoggingSettings();
    logger.addGlobalMetadata("example", "schema_example");

    LOG_INFO("schema_example", "BJS Schema Example");

    // Schemas declared in code
    Field name(ValueType::STRING);
    name.addValidator(Sanitizers::trim())
        .addValidator(std::make_shared<Length>(1, 64))
        .setDescription("Display name");

    Field age(ValueType::INTEGER);
    age.setDefault(Value(0))
        .addValidator(std::make_shared<Range>(Value(0), Value(150)));

    SchemaPtr person = SchemaBuilder("Person")
                           .description("A person")
                           .field("name", name)
                           .field("age", age)
                           .build();

    std::cout << person->describe() << std::endl;

    try {
        Record john = person->create({{"name", Value("  John ")}, {"age", Value("20")}});
        std::cout << john.repr() << std::endl;
        std::cout << john.toJson(2) << std::endl;

        john.set("age", Value(21));
        std::cout << "After birthday: " << john.repr() << std::endl;

        Record parsed = person->fromJson(R"({"name": "Ann"})");
        std::cout << "Parsed from JSON: " << parsed.repr() << std::endl;
    } catch (const Error& e) {
        LOG_ERROR("schema_example", std::string("Record creation failed: ") + e.what());
        return 1;
    }

    // Non-throwing check
    RecordCheck result = person->check({{"age", Value(200)}, {"nickname", Value("JJ")}});
    std::cout << result.report() << std::endl;

    // Schemas declared in a YAML document
    SchemaCatalog catalog;
    catalog.registerSchema(person);
    SchemaLoader loader(catalog);

    const std::string document = R"(
schemas:
  - name: Student
    extends: Person
    description: A person enrolled in a school
    fields:
      - name: school
        type: string
        validators:
          - non_empty
      - name: enrolled
        type: date
        coerce: iso_date
      - name: grade
        type: string
        default: A
        validators:
          - in_choices: [A, B, C, D, F]
)";

    try {
        loader.loadFromString(document);
        SchemaPtr student = catalog.getSchema("Student");
        std::cout << student->signature() << std::endl;

        Record ann = student->create({{"name", Value("Ann")},
                                      {"school", Value("MIT")},
                                      {"enrolled", Value("2021-09-01")}});
        std::cout << ann.repr() << std::endl;
    } catch (const Error& e) {
        LOG_ERROR("schema_example", std::string("Schema document failed: ") + e.what());
        return 1;
    }

    std::unordered_map<std::string, std::string> metadata;
    metadata["schemas"] = std::to_string(catalog.size());
    LOG_INFO_META("schema_example", "Example completed", metadata);
    logger.flush();
    return 0;
}
