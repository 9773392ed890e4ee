// EN: Implementation of the schema catalog and YAML schema loader.
// FR: Implémentation du catalogue de schémas et du chargeur de schémas YAML.

#include "schema/schema_loader.hpp"
#include "infrastructure/logging/logger.hpp"
#include "validation/validator_factory.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace BJS::Schema {

namespace {

const char* const kModule = "schema_loader";

std::string requireString(const YAML::Node& node, const std::string& key, const std::string& context) {
    const YAML::Node value = node[key];
    if (!value || !value.IsScalar()) {
        const std::string prefix = context.empty() ? "" : context + ": ";
        throw ConfigurationError(prefix + "'" + key + "' must be a string");
    }
    return value.as<std::string>();
}

} // namespace

// EN: SchemaCatalog
// FR: Catalogue de schémas
void SchemaCatalog::registerSchema(SchemaPtr schema) {
    if (!schema) {
        throw ConfigurationError("cannot register a null schema");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (schemas_.count(schema->name())) {
            throw ConfigurationError("schema '" + schema->name() + "' is already registered");
        }
        schemas_[schema->name()] = schema;
    }
    LOG_INFO("schema", "Schema registered: " + schema->name());
}

void SchemaCatalog::registerAll(const std::vector<SchemaPtr>& schemas) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::unordered_map<std::string, SchemaPtr> batch;
        for (const auto& schema : schemas) {
            if (!schema) {
                throw ConfigurationError("cannot register a null schema");
            }
            if (schemas_.count(schema->name()) || batch.count(schema->name())) {
                throw ConfigurationError("schema '" + schema->name() + "' is already registered");
            }
            batch[schema->name()] = schema;
        }
        schemas_.insert(batch.begin(), batch.end());
    }
    for (const auto& schema : schemas) {
        LOG_INFO("schema", "Schema registered: " + schema->name());
    }
}

SchemaPtr SchemaCatalog::getSchema(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = schemas_.find(name);
    if (it == schemas_.end()) {
        throw ConfigurationError("unknown schema '" + name + "'");
    }
    return it->second;
}

bool SchemaCatalog::hasSchema(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schemas_.count(name) > 0;
}

std::vector<std::string> SchemaCatalog::getAvailableSchemas() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(schemas_.size());
    for (const auto& entry : schemas_) {
        names.push_back(entry.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t SchemaCatalog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schemas_.size();
}

void SchemaCatalog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    schemas_.clear();
}

// EN: SchemaLoader
// FR: Chargeur de schémas
SchemaLoader::SchemaLoader(SchemaCatalog& catalog) : catalog_(catalog) {}

Value SchemaLoader::yamlToValue(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) {
        return Value();
    }

    if (node.IsScalar()) {
        const std::string str_val = node.Scalar();
        if (node.Tag() == "!") {
            return Value(str_val);
        }
        if (str_val == "true" || str_val == "false") {
            return Value(str_val == "true");
        }
        if (str_val.find('.') == std::string::npos) {
            try {
                return Value(node.as<int64_t>());
            } catch (const YAML::BadConversion&) {
                // Not an integer
            }
        }
        try {
            return Value(node.as<double>());
        } catch (const YAML::BadConversion&) {
            // Not a float
        }
        return Value(str_val);
    }

    if (node.IsSequence()) {
        Value::List items;
        for (const auto& item : node) {
            items.push_back(yamlToValue(item));
        }
        return Value(std::move(items));
    }

    Value::Map members;
    for (const auto& item : node) {
        members[item.first.as<std::string>()] = yamlToValue(item.second);
    }
    return Value(std::move(members));
}

CoercionPolicy SchemaLoader::parseCoercion(const YAML::Node& node) const {
    if (!node) {
        return CoercionPolicy::automatic();
    }
    const Value setting = yamlToValue(node);
    if (const bool* flag = setting.tryAs<bool>()) {
        return *flag ? CoercionPolicy::automatic() : CoercionPolicy::disabled();
    }
    if (const std::string* name = setting.tryAs<std::string>()) {
        return CoercionPolicy::custom(CoercionRegistry::getInstance().getNamedCoercion(*name), *name);
    }
    throw ConfigurationError("coerce must be true, false or a coercion name (but received " + setting.repr() + ")");
}

Field SchemaLoader::buildField(const YAML::Node& node) const {
    const std::string type_name = requireString(node, "type", "");
    const std::optional<ValueType> dtype = valueTypeFromString(type_name);
    if (!dtype) {
        throw ConfigurationError("unknown field type '" + type_name + "'");
    }

    Field field(*dtype);
    field.setCoercion(parseCoercion(node["coerce"]));
    if (node["default"]) {
        field.setDefault(yamlToValue(node["default"]));
    }
    if (node["description"]) {
        field.setDescription(node["description"].as<std::string>());
    }

    if (const YAML::Node validators = node["validators"]) {
        if (!validators.IsSequence()) {
            throw ConfigurationError("validators must be a list");
        }
        const auto& factory = Validation::ValidatorFactory::getInstance();
        for (const auto& spec : validators) {
            field.addValidator(factory.createFromSpec(yamlToValue(spec)));
        }
    }
    return field;
}

SchemaPtr SchemaLoader::buildSchema(const YAML::Node& node,
                                    const std::unordered_map<std::string, SchemaPtr>& staged) const {
    if (!node.IsMap()) {
        throw ConfigurationError("each schema entry must be a mapping");
    }
    const std::string name = requireString(node, "name", "schema");
    const std::string context = "schema '" + name + "'";

    SchemaBuilder builder(name);
    if (node["description"]) {
        builder.description(node["description"].as<std::string>());
    }

    if (const YAML::Node bases = node["extends"]) {
        std::vector<std::string> base_names;
        if (bases.IsScalar()) {
            base_names.push_back(bases.as<std::string>());
        } else if (bases.IsSequence()) {
            for (const auto& base : bases) {
                base_names.push_back(base.as<std::string>());
            }
        } else {
            throw ConfigurationError(context + ": 'extends' must be a name or a list of names");
        }

        for (const auto& base_name : base_names) {
            auto it = staged.find(base_name);
            if (it != staged.end()) {
                builder.extends(it->second);
            } else if (catalog_.hasSchema(base_name)) {
                builder.extends(catalog_.getSchema(base_name));
            } else {
                throw ConfigurationError(context + ": unknown base schema '" + base_name + "'");
            }
        }
    }

    if (const YAML::Node fields = node["fields"]) {
        if (!fields.IsSequence()) {
            throw ConfigurationError(context + ": 'fields' must be a list");
        }
        for (const auto& field_node : fields) {
            if (!field_node.IsMap()) {
                throw ConfigurationError(context + ": each field entry must be a mapping");
            }
            const std::string field_name = requireString(field_node, "name", context + ", field");
            try {
                builder.field(field_name, buildField(field_node));
            } catch (const Error& e) {
                throw ConfigurationError(context + ", field '" + field_name + "': " + e.what());
            } catch (const YAML::Exception& e) {
                throw ConfigurationError(context + ", field '" + field_name + "': " + e.what());
            }
        }
    }

    return builder.build();
}

std::vector<std::string> SchemaLoader::loadFromString(const std::string& yaml_content) {
    YAML::Node document;
    try {
        document = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        LOG_ERROR(kModule, "Failed to parse schema document: " + std::string(e.what()));
        throw ParseError(std::string("malformed YAML schema document: ") + e.what());
    }

    if (!document.IsMap()) {
        throw ConfigurationError("schema document must be a mapping with a 'schemas' list");
    }
    const YAML::Node schemas = document["schemas"];
    if (!schemas || !schemas.IsSequence()) {
        throw ConfigurationError("schema document must contain a 'schemas' list");
    }

    std::unordered_map<std::string, SchemaPtr> staged;
    std::vector<SchemaPtr> ordered;
    try {
        for (const auto& entry : schemas) {
            SchemaPtr schema = buildSchema(entry, staged);
            if (staged.count(schema->name()) || catalog_.hasSchema(schema->name())) {
                throw ConfigurationError("schema '" + schema->name() + "' is already defined");
            }
            staged[schema->name()] = schema;
            ordered.push_back(schema);
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR(kModule, "Invalid schema document: " + std::string(e.what()));
        throw ConfigurationError(std::string("invalid schema document: ") + e.what());
    } catch (const Error& e) {
        LOG_ERROR(kModule, "Invalid schema document: " + std::string(e.what()));
        throw;
    }

    try {
        catalog_.registerAll(ordered);
    } catch (const Error& e) {
        LOG_ERROR(kModule, "Invalid schema document: " + std::string(e.what()));
        throw;
    }

    std::vector<std::string> names;
    for (const auto& schema : ordered) {
        names.push_back(schema->name());
    }

    std::unordered_map<std::string, std::string> metadata;
    metadata["schemas"] = std::to_string(names.size());
    LOG_INFO_META(kModule, "Schema document loaded", metadata);
    return names;
}

std::vector<std::string> SchemaLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        LOG_ERROR(kModule, "Cannot open schema document: " + filename);
        throw ConfigurationError("cannot open schema document '" + filename + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO(kModule, "Loading schema document: " + filename);
    return loadFromString(buffer.str());
}

std::vector<std::string> SchemaLoader::loadConfiguredFiles(const ConfigManager& config) {
    if (!config.has("schemas", "files")) {
        LOG_DEBUG(kModule, "No schema documents configured");
        return {};
    }

    const ConfigValue setting = config.get("schemas", "files");
    std::vector<std::string> files;
    if (auto list = setting.tryAs<std::vector<std::string>>()) {
        files = *list;
    } else if (auto single = setting.tryAs<std::string>()) {
        files.push_back(*single);
    } else {
        throw ConfigurationError("schemas.files must be a list of paths");
    }

    std::vector<std::string> names;
    for (const auto& file : files) {
        std::vector<std::string> loaded = loadFromFile(file);
        names.insert(names.end(), loaded.begin(), loaded.end());
    }
    return names;
}

} // namespace BJS::Schema
