// EN: Implementation of the ConfigManager class. Provides YAML configuration parsing, overrides and validation.
// FR: Implémentation de la classe ConfigManager. Fournit le parsing YAML, les surcharges et la validation.

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <regex>
#include <set>
#include <sstream>

namespace BJS {

// EN: ConfigValue template implementation for type conversion.
// FR: Implémentation de template ConfigValue pour la conversion de types.
template<typename T>
std::optional<T> ConfigValue::tryAs() const {
    if (!value_) {
        return std::nullopt;
    }
    if (const T* typed = std::get_if<T>(&*value_)) {
        return *typed;
    }
    return std::nullopt;
}

template<typename T>
T ConfigValue::asOrDefault(const T& default_value) const {
    auto result = tryAs<T>();
    return result ? *result : default_value;
}

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string typeOf(const ConfigValue& value) {
    if (value.tryAs<bool>()) return "bool";
    if (value.tryAs<int>()) return "int";
    if (value.tryAs<double>()) return "double";
    if (value.tryAs<std::vector<std::string>>()) return "array";
    return "string";
}

std::pair<std::string, std::string> splitKey(const std::string& key) {
    size_t dot_pos = key.find('.');
    if (dot_pos == std::string::npos) {
        return {"default", key};
    }
    return {key.substr(0, dot_pos), key.substr(dot_pos + 1)};
}

} // namespace

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }

    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream out;
            out << v;
            return out.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else {
            std::string result = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) result += ", ";
                result += v[i];
            }
            result += "]";
            return result;
        }
    }, *value_);
}

// ConfigSection implementation
void ConfigSection::set(const std::string& key, const ConfigValue& value) {
    values_[key] = value;
}

ConfigValue ConfigSection::get(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() ? it->second : ConfigValue();
}

bool ConfigSection::has(const std::string& key) const {
    return values_.find(key) != values_.end();
}

void ConfigSection::remove(const std::string& key) {
    values_.erase(key);
}

std::vector<std::string> ConfigSection::keys() const {
    std::vector<std::string> result;
    for (const auto& [key, _] : values_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// ConfigManager implementation
ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

// EN: Load configuration from YAML file with error handling.
// FR: Charge la configuration depuis un fichier YAML avec gestion d'erreur.
bool ConfigManager::loadFromFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        if (!std::filesystem::exists(filename)) {
            LOG_ERROR("config", "Configuration file not found: " + filename);
            return false;
        }

        loadSections(YAML::LoadFile(filename));

        LOG_INFO("config", "Configuration loaded from: " + filename);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    std::lock_guard<std::mutex> lock(mutex_);

    try {
        loadSections(YAML::Load(yaml_content));

        LOG_INFO("config", "Configuration loaded from string");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("config", "Failed to load configuration from string: " + std::string(e.what()));
        return false;
    }
}

void ConfigManager::loadSections(const YAML::Node& yaml) {
    if (!yaml.IsMap()) {
        throw std::runtime_error("configuration root must be a mapping");
    }

    // EN: Parse everything first so a failure leaves the current configuration intact.
    // FR: Tout parser d'abord pour qu'un échec laisse la configuration courante intacte.
    std::unordered_map<std::string, ConfigSection> loaded;
    for (const auto& section : yaml) {
        std::string section_name = section.first.as<std::string>();
        ConfigSection config_section;

        if (section.second.IsMap()) {
            for (const auto& item : section.second) {
                config_section.set(item.first.as<std::string>(), parseYamlValue(item.second));
            }
        } else {
            config_section.set("value", parseYamlValue(section.second));
        }

        loaded[section_name] = config_section;
    }
    sections_ = std::move(loaded);
}

ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) const {
    if (!node.IsDefined() || node.IsNull()) {
        return ConfigValue();
    }

    if (node.IsScalar()) {
        const std::string str_val = node.Scalar();

        // Try to parse as bool first
        if (str_val == "true" || str_val == "false") {
            return ConfigValue(str_val == "true");
        }

        // Try to parse as int
        if (str_val.find('.') == std::string::npos) {
            try {
                return ConfigValue(node.as<int>());
            } catch (const YAML::BadConversion&) {
                // Not an int, continue
            }
        }

        // Try to parse as double
        try {
            return ConfigValue(node.as<double>());
        } catch (const YAML::BadConversion&) {
            // Not a double, treat as string
        }

        return ConfigValue(expandVariables(str_val));
    }

    if (node.IsSequence()) {
        std::vector<std::string> array_value;
        for (const auto& item : node) {
            array_value.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(array_value);
    }

    throw std::runtime_error("nested mappings are not supported as configuration values");
}

std::optional<ConfigValue> ConfigManager::parseOverride(const std::string& raw, const std::string& type) {
    try {
        if (type == "bool") {
            const std::string lower = toLower(raw);
            if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return ConfigValue(true);
            if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return ConfigValue(false);
            return std::nullopt;
        }
        if (type == "int") {
            size_t consumed = 0;
            int value = std::stoi(raw, &consumed);
            return consumed == raw.size() ? std::optional<ConfigValue>(ConfigValue(value)) : std::nullopt;
        }
        if (type == "double") {
            size_t consumed = 0;
            double value = std::stod(raw, &consumed);
            return consumed == raw.size() ? std::optional<ConfigValue>(ConfigValue(value)) : std::nullopt;
        }
    } catch (const std::logic_error&) {
        return std::nullopt;
    }

    if (type == "array") {
        std::vector<std::string> items;
        std::stringstream stream(raw);
        std::string item;
        while (std::getline(stream, item, ',')) {
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        return ConfigValue(items);
    }
    return ConfigValue(raw);
}

// EN: Example: BJS_LOGGING_LEVEL overrides logging.level.
// FR: Exemple : BJS_LOGGING_LEVEL surcharge logging.level.
void ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_INFO("config", "Loading environment overrides with prefix: " + prefix);

    // EN: Known keys with the type an override must parse as.
    // FR: Clés connues avec le type qu'une surcharge doit respecter.
    std::map<std::pair<std::string, std::string>, std::string> known;
    for (const auto& rule : validation_rules_) {
        known[splitKey(rule.key)] = rule.type.empty() ? "string" : rule.type;
    }
    for (const auto& [section_name, section] : sections_) {
        for (const auto& key : section.keys()) {
            known[{section_name, key}] = typeOf(section.get(key));
        }
    }

    for (const auto& [location, type] : known) {
        const std::string variable = prefix + toUpper(location.first) + "_" + toUpper(location.second);
        const std::string raw = getEnvironmentVariable(variable);
        if (raw.empty()) {
            continue;
        }

        auto value = parseOverride(raw, type);
        if (!value) {
            LOG_WARN("config", "Ignoring environment override " + variable + ": expected " + type);
            continue;
        }
        sections_[location.first].set(location.second, *value);
        LOG_INFO("config", "Environment override applied: " + location.first + "." + location.second);
    }
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    validation_rules_.insert(validation_rules_.end(), rules.begin(), rules.end());
    LOG_DEBUG("config", "Added " + std::to_string(rules.size()) + " validation rules");
}

void ConfigManager::registerDefaultRules() {
    std::vector<ValidationRule> rules;

    ValidationRule level;
    level.key = "logging.level";
    level.type = "string";
    level.default_value = "info";
    level.allowed_values = {"debug", "info", "warn", "error"};
    level.description = "Minimum log level";
    rules.push_back(level);

    ValidationRule file;
    file.key = "logging.file";
    file.type = "string";
    file.description = "NDJSON log file (console output when absent)";
    rules.push_back(file);

    ValidationRule console;
    console.key = "logging.console";
    console.type = "bool";
    console.default_value = "true";
    console.description = "Write log entries to standard output";
    rules.push_back(console);

    ValidationRule schemas;
    schemas.key = "schemas.files";
    schemas.type = "array";
    schemas.description = "Declarative schema documents loaded at startup";
    rules.push_back(schemas);

    addValidationRules(rules);
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : validation_rules_) {
        const auto [section_name, key_name] = splitKey(rule.key);
        ConfigValue value = getUnlocked(section_name, key_name);

        if (!value.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }

        std::string error;
        if (!validateValue(rule.key, value, rule, error)) {
            errors.push_back(error);
        }
    }

    return errors.empty();
}

void ConfigManager::applyLoggingSettings() const {
    ConfigSection logging = getSection("logging");
    auto& logger = Logger::getInstance();

    if (auto level_name = logging.get("level").tryAs<std::string>()) {
        if (auto level = logLevelFromString(*level_name)) {
            logger.setLogLevel(*level);
        } else {
            LOG_WARN("config", "Unknown logging.level: " + *level_name);
        }
    }
    if (auto file = logging.get("file").tryAs<std::string>()) {
        if (!file->empty()) {
            logger.setOutputFile(*file);
        }
    }
    if (auto console = logging.get("console").tryAs<bool>()) {
        logger.setConsoleOutput(*console);
    }
}

ConfigValue ConfigManager::get(const std::string& key) const {
    return get("default", key);
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return getUnlocked(section, key);
}

ConfigValue ConfigManager::getUnlocked(const std::string& section, const std::string& key) const {
    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.get(key);
    }
    return ConfigValue();
}

void ConfigManager::set(const std::string& key, const ConfigValue& value) {
    set("default", key, value);
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section].set(key, value);
}

bool ConfigManager::has(const std::string& key) const {
    return has("default", key);
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        return section_it->second.has(key);
    }

    return false;
}

void ConfigManager::remove(const std::string& key) {
    remove("default", key);
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto section_it = sections_.find(section);
    if (section_it != sections_.end()) {
        section_it->second.remove(key);
    }
}

ConfigSection ConfigManager::getSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sections_.find(section);
    return it != sections_.end() ? it->second : ConfigSection();
}

void ConfigManager::setSection(const std::string& section, const ConfigSection& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_[section] = config;
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> names;
    for (const auto& [name, _] : sections_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sections_.clear();
    validation_rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<std::string> section_names;
    for (const auto& [name, _] : sections_) {
        section_names.insert(name);
    }

    std::ostringstream oss;
    for (const auto& section_name : section_names) {
        const ConfigSection& section = sections_.at(section_name);
        oss << "[" << section_name << "]\n";
        for (const std::string& key : section.keys()) {
            oss << "  " << key << " = " << section.get(key).toString() << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

bool ConfigManager::validateValue(const std::string& key, const ConfigValue& value,
                                  const ValidationRule& rule, std::string& error) const {
    // Type validation
    if (rule.type == "bool" && !value.tryAs<bool>()) {
        error = "Configuration " + key + " must be a boolean";
        return false;
    } else if (rule.type == "int" && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be an integer";
        return false;
    } else if (rule.type == "double" && !value.tryAs<double>() && !value.tryAs<int>()) {
        error = "Configuration " + key + " must be a number";
        return false;
    } else if (rule.type == "string" && !value.tryAs<std::string>()) {
        error = "Configuration " + key + " must be a string";
        return false;
    } else if (rule.type == "array" && !value.tryAs<std::vector<std::string>>()) {
        error = "Configuration " + key + " must be an array";
        return false;
    }

    // Range validation for numeric types
    if ((rule.type == "int" || rule.type == "double") &&
        (rule.min_value || rule.max_value)) {
        double numeric_value = 0.0;
        if (auto int_val = value.tryAs<int>()) {
            numeric_value = static_cast<double>(*int_val);
        } else if (auto double_val = value.tryAs<double>()) {
            numeric_value = *double_val;
        }

        if (rule.min_value && numeric_value < *rule.min_value) {
            error = "Configuration " + key + " must be >= " + std::to_string(*rule.min_value);
            return false;
        }
        if (rule.max_value && numeric_value > *rule.max_value) {
            error = "Configuration " + key + " must be <= " + std::to_string(*rule.max_value);
            return false;
        }
    }

    // Allowed values validation
    if (!rule.allowed_values.empty()) {
        const std::string str_value = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), str_value) ==
            rule.allowed_values.end()) {
            error = "Configuration " + key + " must be one of: ";
            for (size_t i = 0; i < rule.allowed_values.size(); ++i) {
                if (i > 0) error += ", ";
                error += rule.allowed_values[i];
            }
            return false;
        }
    }

    return true;
}

std::string ConfigManager::expandVariables(const std::string& value) const {
    static const std::regex var_regex(R"(\$\{([^}]+)\})");
    std::string result;
    auto begin = value.cbegin();
    std::smatch match;

    // EN: Unknown variables are left as-is.
    // FR: Les variables inconnues sont laissées telles quelles.
    while (std::regex_search(begin, value.cend(), match, var_regex)) {
        result.append(begin, match[0].first);
        const std::string var_value = getEnvironmentVariable(match[1].str());
        result += var_value.empty() ? match[0].str() : var_value;
        begin = match[0].second;
    }
    result.append(begin, value.cend());
    return result;
}

std::string ConfigManager::getEnvironmentVariable(const std::string& name) const {
    const char* env_value = std::getenv(name.c_str());
    return env_value ? std::string(env_value) : "";
}

// Explicit template instantiations for non-specialized methods only
template std::optional<bool> ConfigValue::tryAs<bool>() const;
template std::optional<int> ConfigValue::tryAs<int>() const;
template std::optional<double> ConfigValue::tryAs<double>() const;
template std::optional<std::string> ConfigValue::tryAs<std::string>() const;
template std::optional<std::vector<std::string>> ConfigValue::tryAs<std::vector<std::string>>() const;

template bool ConfigValue::asOrDefault<bool>(const bool&) const;
template int ConfigValue::asOrDefault<int>(const int&) const;
template double ConfigValue::asOrDefault<double>(const double&) const;
template std::string ConfigValue::asOrDefault<std::string>(const std::string&) const;
template std::vector<std::string> ConfigValue::asOrDefault<std::vector<std::string>>(const std::vector<std::string>&) const;

} // namespace BJS
