// EN: Unit tests for the ConfigManager (YAML loading, overrides, validation rules)
// FR: Tests unitaires pour le ConfigManager (chargement YAML, surcharges, règles de validation)

#include <gtest/gtest.h>
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace BJS;

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::getInstance();
        logger.setLogLevel(LogLevel::ERROR); // EN: Reduce noise during tests / FR: Réduit le bruit pendant les tests
        ConfigManager::getInstance().reset();
    }

    void TearDown() override {
        ConfigManager::getInstance().reset();
        unsetenv("BJS_LOGGING_LEVEL");
        unsetenv("BJS_LOGGING_CONSOLE");
        unsetenv("BJS_LIMITS_DEPTH");
        unsetenv("BJS_TEST_HOME");
        Logger::getInstance().setLogLevel(LogLevel::ERROR);
    }
};

TEST_F(ConfigManagerTest, ConfigValueConversions) {
    ConfigValue flag(true);
    ConfigValue count(42);
    ConfigValue ratio(2.5);
    ConfigValue text("hello");
    ConfigValue list(std::vector<std::string>{"a.yaml", "b.yaml"});
    ConfigValue empty;

    EXPECT_TRUE(flag.as<bool>());
    EXPECT_EQ(count.as<int>(), 42);
    EXPECT_DOUBLE_EQ(ratio.as<double>(), 2.5);
    EXPECT_EQ(text.as<std::string>(), "hello");
    EXPECT_EQ(list.as<std::vector<std::string>>().size(), 2u);

    EXPECT_FALSE(count.tryAs<std::string>().has_value());
    EXPECT_EQ(count.asOrDefault<std::string>("fallback"), "fallback");
    EXPECT_FALSE(empty.isValid());
    EXPECT_THROW(empty.as<int>(), std::runtime_error);

    EXPECT_EQ(flag.toString(), "true");
    EXPECT_EQ(count.toString(), "42");
    EXPECT_EQ(list.toString(), "[a.yaml, b.yaml]");
    EXPECT_EQ(empty.toString(), "<empty>");
}

TEST_F(ConfigManagerTest, BasicOperations) {
    auto& config = ConfigManager::getInstance();

    config.set("name", ConfigValue("bjs"));
    EXPECT_TRUE(config.has("name"));
    EXPECT_TRUE(config.has("default", "name"));
    EXPECT_EQ(config.get("name").as<std::string>(), "bjs");

    config.set("limits", "depth", ConfigValue(8));
    EXPECT_EQ(config.get("limits", "depth").as<int>(), 8);
    EXPECT_FALSE(config.get("limits", "width").isValid());

    config.remove("limits", "depth");
    EXPECT_FALSE(config.has("limits", "depth"));

    EXPECT_EQ(config.getSectionNames(), (std::vector<std::string>{"default", "limits"}));
    config.reset();
    EXPECT_TRUE(config.getSectionNames().empty());
}

TEST_F(ConfigManagerTest, LoadFromString) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
logging:
  level: debug
  console: false
limits:
  depth: 8
  ratio: 0.75
schemas:
  files: [people.yaml, orders.yaml]
version: 3
)"));

    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "debug");
    EXPECT_FALSE(config.get("logging", "console").as<bool>());
    EXPECT_EQ(config.get("limits", "depth").as<int>(), 8);
    EXPECT_DOUBLE_EQ(config.get("limits", "ratio").as<double>(), 0.75);
    EXPECT_EQ(config.get("schemas", "files").as<std::vector<std::string>>(),
              (std::vector<std::string>{"people.yaml", "orders.yaml"}));
    EXPECT_EQ(config.get("version", "value").as<int>(), 3);

    ConfigSection limits = config.getSection("limits");
    EXPECT_EQ(limits.keys(), (std::vector<std::string>{"depth", "ratio"}));
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousConfiguration) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("limits:\n  depth: 8\n"));

    EXPECT_FALSE(config.loadFromString("limits: [unclosed"));
    EXPECT_FALSE(config.loadFromString("- not\n- a mapping\n"));
    EXPECT_FALSE(config.loadFromString("limits:\n  nested:\n    deep: 1\n"));
    EXPECT_EQ(config.get("limits", "depth").as<int>(), 8);
}

TEST_F(ConfigManagerTest, LoadFromFile) {
    const std::string path = "/tmp/bjs_config_manager_test.yaml";
    {
        std::ofstream file(path);
        file << "logging:\n  level: warn\n";
    }

    auto& config = ConfigManager::getInstance();
    EXPECT_TRUE(config.loadFromFile(path));
    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "warn");
    EXPECT_FALSE(config.loadFromFile("/tmp/bjs_config_manager_missing.yaml"));

    std::remove(path.c_str());
}

TEST_F(ConfigManagerTest, ExpandsEnvironmentVariables) {
    setenv("BJS_TEST_HOME", "/srv/schemas", 1);
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString(R"(
schemas:
  root: ${BJS_TEST_HOME}/main.yaml
  files: ["${BJS_TEST_HOME}/a.yaml"]
  other: ${BJS_UNSET_VARIABLE_FOR_TEST}
)"));

    EXPECT_EQ(config.get("schemas", "root").as<std::string>(), "/srv/schemas/main.yaml");
    EXPECT_EQ(config.get("schemas", "files").as<std::vector<std::string>>(),
              (std::vector<std::string>{"/srv/schemas/a.yaml"}));
    EXPECT_EQ(config.get("schemas", "other").as<std::string>(), "${BJS_UNSET_VARIABLE_FOR_TEST}");
}

TEST_F(ConfigManagerTest, EnvironmentOverridesKeepTypes) {
    auto& config = ConfigManager::getInstance();
    ASSERT_TRUE(config.loadFromString("logging:\n  level: info\n  console: true\nlimits:\n  depth: 8\n"));

    setenv("BJS_LOGGING_LEVEL", "error", 1);
    setenv("BJS_LOGGING_CONSOLE", "off", 1);
    setenv("BJS_LIMITS_DEPTH", "deep", 1);
    config.loadEnvironmentOverrides();

    EXPECT_EQ(config.get("logging", "level").as<std::string>(), "error");
    EXPECT_FALSE(config.get("logging", "console").as<bool>());
    EXPECT_EQ(config.get("limits", "depth").as<int>(), 8);
}

TEST_F(ConfigManagerTest, ValidationRules) {
    auto& config = ConfigManager::getInstance();

    ConfigManager::ValidationRule depth;
    depth.key = "limits.depth";
    depth.type = "int";
    depth.required = true;
    depth.min_value = 1;
    depth.max_value = 16;
    config.addValidationRules({depth});

    std::vector<std::string> errors;
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "Required configuration missing: limits.depth");

    config.set("limits", "depth", ConfigValue(32));
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].rfind("Configuration limits.depth must be <= ", 0), 0u);

    config.set("limits", "depth", ConfigValue("eight"));
    EXPECT_FALSE(config.validate(errors));
    EXPECT_EQ(errors.at(0), "Configuration limits.depth must be an integer");

    config.set("limits", "depth", ConfigValue(4));
    EXPECT_TRUE(config.validate(errors));
    EXPECT_TRUE(errors.empty());
}

TEST_F(ConfigManagerTest, DefaultRules) {
    auto& config = ConfigManager::getInstance();
    config.registerDefaultRules();

    std::vector<std::string> errors;
    EXPECT_TRUE(config.validate(errors));

    ASSERT_TRUE(config.loadFromString("logging:\n  level: loud\n  console: 1\nschemas:\n  files: one.yaml\n"));
    EXPECT_FALSE(config.validate(errors));
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], "Configuration logging.level must be one of: debug, info, warn, error");
    EXPECT_EQ(errors[1], "Configuration logging.console must be a boolean");
    EXPECT_EQ(errors[2], "Configuration schemas.files must be an array");
}

TEST_F(ConfigManagerTest, SectionMacros) {
    CONFIG_SET_SECTION("limits", "depth", 5);
    CONFIG_SET_SECTION("limits", "label", "shallow");

    EXPECT_EQ(CONFIG_GET_SECTION("limits", "depth").as<int>(), 5);
    EXPECT_EQ(CONFIG_GET_SECTION("limits", "label").as<std::string>(), "shallow");
}

TEST_F(ConfigManagerTest, Dump) {
    auto& config = ConfigManager::getInstance();
    config.set("logging", "level", ConfigValue("info"));
    config.set("limits", "depth", ConfigValue(8));
    config.set("limits", "names", ConfigValue(std::vector<std::string>{"a", "b"}));

    EXPECT_EQ(config.dump(), "[limits]\n  depth = 8\n  names = [a, b]\n\n[logging]\n  level = info\n\n");
}

TEST_F(ConfigManagerTest, ApplyLoggingSettings) {
    auto& config = ConfigManager::getInstance();
    auto& logger = Logger::getInstance();

    config.set("logging", "level", ConfigValue("warning"));
    config.set("logging", "console", ConfigValue(false));
    config.applyLoggingSettings();
    EXPECT_EQ(logger.getLogLevel(), LogLevel::WARN);

    config.set("logging", "level", ConfigValue("chatty"));
    config.applyLoggingSettings();
    EXPECT_EQ(logger.getLogLevel(), LogLevel::WARN);
}
