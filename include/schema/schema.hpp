// EN: Schema types - ordered field registries merged across inheritance, records and introspection
// FR: Types de schéma - registres de champs ordonnés fusionnés par héritage, enregistrements et introspection

#pragma once

#include "core/errors.hpp"
#include "core/value.hpp"
#include "schema/field.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BJS::Schema {

// EN: Ordered, name-unique field collection. First insertion of a name fixes its position.
// FR: Collection de champs ordonnée et à noms uniques. La première insertion d'un nom fixe sa position.
class FieldRegistry {
public:
    using Entry = std::pair<std::string, FieldPtr>;
    using const_iterator = std::vector<Entry>::const_iterator;

    // EN: Append a new name, or replace the field of an existing name in place
    // FR: Ajoute un nouveau nom, ou remplace sur place le champ d'un nom existant
    void insertOrAssign(const std::string& name, FieldPtr field);

    // EN: Field registered under name, nullptr when absent
    // FR: Champ enregistré sous ce nom, nullptr si absent
    FieldPtr get(const std::string& name) const;
    bool has(const std::string& name) const { return index_.count(name) > 0; }
    std::vector<std::string> names() const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

// EN: One overlay step of the inheritance aggregation: local fields written over the inherited ones.
// FR: Une étape de superposition de l'agrégation par héritage : champs locaux écrits sur les champs hérités.
FieldRegistry mergeFieldRegistries(const FieldRegistry& inherited, const FieldRegistry& local);

// EN: Single problem found by SchemaType::check
// FR: Problème unique trouvé par SchemaType::check
struct FieldIssue {
    std::string field;       // EN: Field or input key / FR: Champ ou clé d'entrée
    std::string error_code;  // EN: Validator code or structural code / FR: Code du validateur ou code structurel
    std::string message;     // EN: Rendered message / FR: Message rendu
};

// EN: Non-throwing construction check result
// FR: Résultat de la vérification de construction sans exception
struct RecordCheck {
    bool is_valid{true};             // EN: No issue found / FR: Aucun problème trouvé
    std::string schema_name;         // EN: Checked schema / FR: Schéma vérifié
    std::vector<FieldIssue> issues;  // EN: Issues in input then registry order / FR: Problèmes dans l'ordre entrée puis registre

    std::vector<FieldIssue> issuesFor(const std::string& field) const;
    std::string report() const;
};

class SchemaType;
class Record;
using SchemaPtr = std::shared_ptr<const SchemaType>;

// EN: Immutable schema type produced by SchemaBuilder
// FR: Type de schéma immuable produit par SchemaBuilder
class SchemaType : public std::enable_shared_from_this<SchemaType> {
public:
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const std::vector<SchemaPtr>& bases() const { return bases_; }

    // EN: C3 linearization of the ancestors, nearest first (this schema excluded)
    // FR: Linéarisation C3 des ancêtres, le plus proche en premier (ce schéma exclu)
    const std::vector<SchemaPtr>& ancestors() const { return ancestors_; }

    // EN: Method resolution order names, this schema first
    // FR: Noms de l'ordre de résolution, ce schéma en premier
    std::vector<std::string> mro() const;

    const FieldRegistry& ownFields() const { return own_fields_; }
    const FieldRegistry& allFields() const { return all_fields_; }
    FieldPtr getField(const std::string& name) const { return all_fields_.get(name); }

    bool isSubtypeOf(const SchemaType& other) const;

    // EN: Atomic construction. Unknown keys, then missing keys, then each field's sanitize pipeline.
    // FR: Construction atomique. Clés inconnues, puis clés manquantes, puis le pipeline de chaque champ.
    Record create(const Value::Map& params) const;

    // EN: Parse a JSON object through each field's parser, then create
    // FR: Parse un objet JSON via le parseur de chaque champ, puis construit
    Record fromJson(const std::string& text) const;

    // EN: Collect every issue create() could raise, without throwing
    // FR: Collecte tous les problèmes que create() pourrait lever, sans exception
    RecordCheck check(const Value::Map& params) const;

    std::string signature() const;
    std::string describe() const;

private:
    friend class SchemaBuilder;

    SchemaType(std::string name, std::string description, std::vector<SchemaPtr> bases,
               std::vector<SchemaPtr> ancestors, FieldRegistry own_fields, FieldRegistry all_fields);

    void requireKnownKeys(const Value::Map& params) const;

    std::string name_;
    std::string description_;
    std::vector<SchemaPtr> bases_;
    std::vector<SchemaPtr> ancestors_;
    FieldRegistry own_fields_;
    FieldRegistry all_fields_;
};

// EN: Fluent declaration of a schema type
// FR: Déclaration fluide d'un type de schéma
class SchemaBuilder {
public:
    explicit SchemaBuilder(std::string name);

    SchemaBuilder& extends(SchemaPtr base);
    SchemaBuilder& extends(const std::vector<SchemaPtr>& bases);
    SchemaBuilder& field(const std::string& name, const Field& field);
    SchemaBuilder& description(const std::string& description);

    // EN: Linearize the bases and aggregate the field registry (throws ConfigurationError)
    // FR: Linéarise les bases et agrège le registre de champs (lève ConfigurationError)
    SchemaPtr build() const;

private:
    std::string name_;
    std::string description_;
    std::vector<SchemaPtr> bases_;
    FieldRegistry own_fields_;
};

// EN: Validated instance of a schema type
// FR: Instance validée d'un type de schéma
class Record {
public:
    const SchemaPtr& schema() const { return schema_; }

    const Value& get(const std::string& name) const;
    bool has(const std::string& name) const { return values_.count(name) > 0; }

    // EN: Sanitize raw and store it; the previous value stays on failure
    // FR: Assainit raw et le stocke ; la valeur précédente reste en cas d'échec
    void set(const std::string& name, const Value& raw);

    const Value::Map& toMap() const { return values_; }
    std::string toJson(int indent = -1) const;
    std::string repr() const;

    bool operator==(const Record& other) const;
    bool operator!=(const Record& other) const { return !(*this == other); }

private:
    friend class SchemaType;

    Record(SchemaPtr schema, Value::Map values);

    FieldPtr requireField(const std::string& name) const;

    SchemaPtr schema_;
    Value::Map values_;
};

} // namespace BJS::Schema
