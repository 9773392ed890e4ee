#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

// Forward declaration
namespace YAML { class Node; }

namespace BJS {

// EN: Type-safe configuration value wrapper supporting multiple data types.
// FR: Wrapper de valeur de configuration type-safe supportant plusieurs types de données.
class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;
    ConfigValue(const char* value) : value_(std::string(value)) {}

    template<typename T>
    ConfigValue(const T& value) : value_(value) {}

    // EN: Get value as specific type (throws if type mismatch).
    // FR: Obtient la valeur comme type spécifique (lance exception si type incorrect).
    template<typename T>
    T as() const;

    // EN: Try to get value as specific type (returns nullopt if type mismatch).
    // FR: Tente d'obtenir la valeur comme type spécifique (retourne nullopt si type incorrect).
    template<typename T>
    std::optional<T> tryAs() const;

    // EN: Get value as specific type or return default if type mismatch.
    // FR: Obtient la valeur comme type spécifique ou retourne défaut si type incorrect.
    template<typename T>
    T asOrDefault(const T& default_value) const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Configuration section containing key-value pairs.
// FR: Section de configuration contenant des paires clé-valeur.
class ConfigSection {
public:
    ConfigSection() = default;

    void set(const std::string& key, const ConfigValue& value);
    ConfigValue get(const std::string& key) const;
    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys() const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

private:
    std::unordered_map<std::string, ConfigValue> values_;
};

// EN: Configuration manager with YAML parsing, environment overrides and rule validation.
// FR: Gestionnaire de configuration avec parsing YAML, surcharges d'environnement et validation par règles.
class ConfigManager {
public:
    // EN: Validation rule structure for configuration values.
    // FR: Structure de règle de validation pour les valeurs de configuration.
    struct ValidationRule {
        std::string key;
        std::string type; // "bool", "int", "double", "string", "array"
        bool required = false;
        std::optional<std::string> default_value;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    // EN: Get the singleton instance.
    // FR: Obtient l'instance singleton.
    static ConfigManager& getInstance();

    // EN: Load configuration from YAML file (returns false and logs on failure).
    // FR: Charge la configuration depuis un fichier YAML (retourne false et journalise en cas d'échec).
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: Override every known section.key with PREFIX_SECTION_KEY when set in the environment.
    // FR: Surcharge chaque section.clé connue avec PREFIX_SECTION_KEY si défini dans l'environnement.
    void loadEnvironmentOverrides(const std::string& prefix = "BJS_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Install the library's own rules (logging.*, schemas.files).
    // FR: Installe les règles propres à la bibliothèque (logging.*, schemas.files).
    void registerDefaultRules();

    // EN: Validate current configuration against rules.
    // FR: Valide la configuration actuelle contre les règles.
    bool validate(std::vector<std::string>& errors) const;

    // EN: Push logging.level, logging.file and logging.console into the Logger.
    // FR: Transmet logging.level, logging.file et logging.console au Logger.
    void applyLoggingSettings() const;

    ConfigValue get(const std::string& key) const;
    ConfigValue get(const std::string& section, const std::string& key) const;

    void set(const std::string& key, const ConfigValue& value);
    void set(const std::string& section, const std::string& key, const ConfigValue& value);

    bool has(const std::string& key) const;
    bool has(const std::string& section, const std::string& key) const;

    void remove(const std::string& key);
    void remove(const std::string& section, const std::string& key);

    ConfigSection getSection(const std::string& section) const;
    void setSection(const std::string& section, const ConfigSection& config);
    std::vector<std::string> getSectionNames() const;

    void reset();

    // EN: Dump current configuration as string for debugging.
    // FR: Vide la configuration actuelle en chaîne pour débogage.
    std::string dump() const;

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // EN: Replace all sections from a parsed YAML document.
    // FR: Remplace toutes les sections depuis un document YAML parsé.
    void loadSections(const YAML::Node& yaml);

    ConfigValue getUnlocked(const std::string& section, const std::string& key) const;

    bool validateValue(const std::string& key, const ConfigValue& value,
                       const ValidationRule& rule, std::string& error) const;

    // EN: Parse an environment string using the type of the value it overrides.
    // FR: Parse une chaîne d'environnement selon le type de la valeur surchargée.
    static std::optional<ConfigValue> parseOverride(const std::string& raw, const std::string& type);

    std::string expandVariables(const std::string& value) const;
    std::string getEnvironmentVariable(const std::string& name) const;

    ConfigValue parseYamlValue(const YAML::Node& node) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ConfigSection> sections_;
    std::vector<ValidationRule> validation_rules_;
};

// Template specializations
template<>
inline bool ConfigValue::as<bool>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<bool>(*value_);
}

template<>
inline int ConfigValue::as<int>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<int>(*value_);
}

template<>
inline double ConfigValue::as<double>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<double>(*value_);
}

template<>
inline std::string ConfigValue::as<std::string>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::string>(*value_);
}

template<>
inline std::vector<std::string> ConfigValue::as<std::vector<std::string>>() const {
    if (!value_) throw std::runtime_error("ConfigValue is empty");
    return std::get<std::vector<std::string>>(*value_);
}

#define CONFIG_GET_SECTION(section, key) BJS::ConfigManager::getInstance().get(section, key)
#define CONFIG_SET_SECTION(section, key, value) BJS::ConfigManager::getInstance().set(section, key, BJS::ConfigValue(value))

} // namespace BJS
