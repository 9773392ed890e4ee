// EN: Schema catalog and declarative YAML schema documents
// FR: Catalogue de schémas et documents de schéma YAML déclaratifs

#pragma once

#include "infrastructure/config/config_manager.hpp"
#include "schema/schema.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace YAML { class Node; }

namespace BJS::Schema {

// EN: Schema types stored by unique name
// FR: Types de schéma stockés par nom unique
class SchemaCatalog {
public:
    SchemaCatalog() = default;

    // EN: Register a schema (throws ConfigurationError on a duplicate name)
    // FR: Enregistre un schéma (lève ConfigurationError si le nom existe déjà)
    void registerSchema(SchemaPtr schema);

    // EN: Register a batch under a single lock. On any duplicate, none of them is registered.
    // FR: Enregistre un lot sous un seul verrou. Au moindre doublon, aucun n'est enregistré.
    void registerAll(const std::vector<SchemaPtr>& schemas);

    // EN: Get a schema by name (throws ConfigurationError when unknown)
    // FR: Obtient un schéma par nom (lève ConfigurationError si inconnu)
    SchemaPtr getSchema(const std::string& name) const;
    bool hasSchema(const std::string& name) const;
    std::vector<std::string> getAvailableSchemas() const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SchemaPtr> schemas_;
};

// EN: Builds schema types from YAML documents into a catalog.
//     A document is loaded as a whole: on error, none of its schemas is registered.
// FR: Construit des types de schéma depuis des documents YAML dans un catalogue.
//     Un document est chargé en entier : en cas d'erreur, aucun de ses schémas n'est enregistré.
class SchemaLoader {
public:
    explicit SchemaLoader(SchemaCatalog& catalog);

    // EN: Load a document and return the names of the schemas it defined
    // FR: Charge un document et retourne les noms des schémas qu'il définit
    std::vector<std::string> loadFromString(const std::string& yaml_content);
    std::vector<std::string> loadFromFile(const std::string& filename);

    // EN: Load every document listed under schemas.files
    // FR: Charge chaque document listé sous schemas.files
    std::vector<std::string> loadConfiguredFiles(const ConfigManager& config);

    // EN: YAML node to Value. Quoted scalars stay strings; plain scalars try bool, int, float, then string.
    // FR: Nœud YAML vers Value. Les scalaires entre guillemets restent des chaînes ; les autres essaient bool, int, float, puis chaîne.
    static Value yamlToValue(const YAML::Node& node);

private:
    SchemaPtr buildSchema(const YAML::Node& node,
                          const std::unordered_map<std::string, SchemaPtr>& staged) const;
    Field buildField(const YAML::Node& node) const;
    CoercionPolicy parseCoercion(const YAML::Node& node) const;

    SchemaCatalog& catalog_;
};

} // namespace BJS::Schema
