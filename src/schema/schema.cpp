// EN: Implementation of schema types, inheritance aggregation and records.
// FR: Implémentation des types de schéma, de l'agrégation par héritage et des enregistrements.

#include "schema/schema.hpp"
#include "infrastructure/logging/logger.hpp"
#include "io/json_codec.hpp"

#include <algorithm>
#include <deque>
#include <sstream>

namespace BJS::Schema {

namespace {

// EN: C3 merge of the base linearizations followed by the base list itself
// FR: Fusion C3 des linéarisations des bases suivie de la liste des bases elle-même
std::vector<SchemaPtr> linearize(const std::string& name, const std::vector<SchemaPtr>& bases) {
    std::vector<std::deque<SchemaPtr>> sequences;
    for (const auto& base : bases) {
        std::deque<SchemaPtr> sequence{base};
        sequence.insert(sequence.end(), base->ancestors().begin(), base->ancestors().end());
        sequences.push_back(std::move(sequence));
    }
    sequences.emplace_back(bases.begin(), bases.end());

    std::vector<SchemaPtr> result;
    while (true) {
        sequences.erase(std::remove_if(sequences.begin(), sequences.end(),
                                       [](const std::deque<SchemaPtr>& s) { return s.empty(); }),
                        sequences.end());
        if (sequences.empty()) {
            return result;
        }

        SchemaPtr candidate;
        for (const auto& sequence : sequences) {
            const SchemaPtr& head = sequence.front();
            const bool in_tail = std::any_of(sequences.begin(), sequences.end(),
                [&head](const std::deque<SchemaPtr>& other) {
                    return std::find(std::next(other.begin()), other.end(), head) != other.end();
                });
            if (!in_tail) {
                candidate = head;
                break;
            }
        }
        if (!candidate) {
            throw ConfigurationError("cannot create a consistent inheritance order for schema '" + name + "'");
        }

        result.push_back(candidate);
        for (auto& sequence : sequences) {
            if (sequence.front() == candidate) {
                sequence.pop_front();
            }
        }
    }
}

} // namespace

// EN: FieldRegistry
// FR: Registre de champs
void FieldRegistry::insertOrAssign(const std::string& name, FieldPtr field) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(field);
        return;
    }
    index_[name] = entries_.size();
    entries_.emplace_back(name, std::move(field));
}

FieldPtr FieldRegistry::get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return entries_[it->second].second;
}

std::vector<std::string> FieldRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

FieldRegistry mergeFieldRegistries(const FieldRegistry& inherited, const FieldRegistry& local) {
    FieldRegistry merged = inherited;
    for (const auto& [name, field] : local) {
        merged.insertOrAssign(name, field);
    }
    return merged;
}

// EN: RecordCheck
// FR: Résultat de vérification
std::vector<FieldIssue> RecordCheck::issuesFor(const std::string& field) const {
    std::vector<FieldIssue> filtered;
    for (const auto& issue : issues) {
        if (issue.field == field) {
            filtered.push_back(issue);
        }
    }
    return filtered;
}

std::string RecordCheck::report() const {
    std::ostringstream report;
    report << "=== Record Check Report ===\n";
    report << "Schema: " << schema_name << "\n";
    report << "Issues: " << issues.size() << "\n";
    report << "Overall Status: " << (is_valid ? "VALID" : "INVALID") << "\n";

    if (!issues.empty()) {
        report << "\n=== Issues ===\n";
        for (const auto& issue : issues) {
            report << "Field '" << issue.field << "' [" << issue.error_code << "]: " << issue.message << "\n";
        }
    }
    return report.str();
}

// EN: SchemaType
// FR: Type de schéma
SchemaType::SchemaType(std::string name, std::string description, std::vector<SchemaPtr> bases,
                       std::vector<SchemaPtr> ancestors, FieldRegistry own_fields, FieldRegistry all_fields)
    : name_(std::move(name)), description_(std::move(description)), bases_(std::move(bases)),
      ancestors_(std::move(ancestors)), own_fields_(std::move(own_fields)), all_fields_(std::move(all_fields)) {}

std::vector<std::string> SchemaType::mro() const {
    std::vector<std::string> names{name_};
    for (const auto& ancestor : ancestors_) {
        names.push_back(ancestor->name());
    }
    return names;
}

bool SchemaType::isSubtypeOf(const SchemaType& other) const {
    if (this == &other) {
        return true;
    }
    return std::any_of(ancestors_.begin(), ancestors_.end(),
                       [&other](const SchemaPtr& ancestor) { return ancestor.get() == &other; });
}

void SchemaType::requireKnownKeys(const Value::Map& params) const {
    for (const auto& entry : params) {
        if (!all_fields_.has(entry.first)) {
            throw UnknownFieldError(name_, entry.first);
        }
    }
}

Record SchemaType::create(const Value::Map& params) const {
    try {
        requireKnownKeys(params);
        for (const auto& [field_name, field] : all_fields_) {
            if (!params.count(field_name) && !field->hasDefault()) {
                throw MissingFieldError(name_, field_name);
            }
        }

        Value::Map staging;
        for (const auto& [field_name, field] : all_fields_) {
            auto it = params.find(field_name);
            if (it != params.end()) {
                staging[field_name] = field->sanitize(it->second);
            } else {
                staging[field_name] = *field->defaultValue();
            }
        }
        return Record(shared_from_this(), std::move(staging));
    } catch (const Error& e) {
        std::unordered_map<std::string, std::string> metadata;
        metadata["schema"] = name_;
        metadata["error"] = e.what();
        LOG_DEBUG_META("schema", "Record construction failed", metadata);
        throw;
    }
}

Record SchemaType::fromJson(const std::string& text) const {
    const nlohmann::json document = IO::parseJsonDocument(text);
    if (!document.is_object()) {
        throw ParseError("schema '" + name_ + "' expects a JSON object (received " +
                         std::string(document.type_name()) + ")");
    }

    Value::Map params;
    for (auto it = document.begin(); it != document.end(); ++it) {
        FieldPtr field = all_fields_.get(it.key());
        if (!field) {
            throw UnknownFieldError(name_, it.key());
        }
        params[it.key()] = field->parse(it.value());
    }
    return create(params);
}

RecordCheck SchemaType::check(const Value::Map& params) const {
    RecordCheck result;
    result.schema_name = name_;

    for (const auto& entry : params) {
        if (!all_fields_.has(entry.first)) {
            result.issues.push_back({entry.first, "unknown_field", UnknownFieldError(name_, entry.first).what()});
        }
    }

    for (const auto& [field_name, field] : all_fields_) {
        auto it = params.find(field_name);
        if (it == params.end()) {
            if (!field->hasDefault()) {
                result.issues.push_back({field_name, "missing_field", MissingFieldError(name_, field_name).what()});
            }
            continue;
        }

        Value coerced;
        try {
            coerced = field->coerce(it->second);
        } catch (const FieldTypeError& e) {
            result.issues.push_back({field_name, "type_mismatch", e.what()});
            continue;
        } catch (const CoercionError& e) {
            result.issues.push_back({field_name, "coercion_failed", e.what()});
            continue;
        } catch (const ValueTypeError& e) {
            result.issues.push_back({field_name, "coercion_failed", e.what()});
            continue;
        }

        Validation::ValidationOutcome outcome = field->runValidators(coerced);
        if (!outcome) {
            result.issues.push_back({field_name, outcome.failure().error_code, outcome.failure().message()});
        }
    }

    result.is_valid = result.issues.empty();
    return result;
}

std::string SchemaType::signature() const {
    std::ostringstream out;
    out << name_ << "(";
    if (!all_fields_.empty()) {
        out << "*";
        for (const auto& [field_name, field] : all_fields_) {
            out << ", " << field_name;
            if (field->hasDefault()) {
                out << "=" << field->defaultValue()->repr();
            }
        }
    }
    out << ")";
    return out.str();
}

std::string SchemaType::describe() const {
    std::ostringstream doc;
    doc << "=== Schema: " << name_ << " ===\n";
    if (!description_.empty()) {
        doc << description_ << "\n";
    }
    if (!bases_.empty()) {
        doc << "Extends: ";
        for (size_t i = 0; i < bases_.size(); ++i) {
            doc << (i > 0 ? ", " : "") << bases_[i]->name();
        }
        doc << "\n";
    }
    doc << "Signature: " << signature() << "\n";
    doc << "Fields (" << all_fields_.size() << "):\n";
    for (const auto& [field_name, field] : all_fields_) {
        doc << "  " << field_name << ": " << field->describe();
        if (!own_fields_.has(field_name)) {
            doc << " [inherited]";
        }
        doc << "\n";
        if (!field->description().empty()) {
            doc << "      " << field->description() << "\n";
        }
    }
    return doc.str();
}

// EN: SchemaBuilder
// FR: Constructeur de schéma
SchemaBuilder::SchemaBuilder(std::string name) : name_(std::move(name)) {
    if (name_.empty()) {
        throw ConfigurationError("schema name must not be empty");
    }
}

SchemaBuilder& SchemaBuilder::extends(SchemaPtr base) {
    if (!base) {
        throw ConfigurationError("schema '" + name_ + "' received a null base");
    }
    if (std::find(bases_.begin(), bases_.end(), base) != bases_.end()) {
        throw ConfigurationError("duplicate base '" + base->name() + "' for schema '" + name_ + "'");
    }
    bases_.push_back(std::move(base));
    return *this;
}

SchemaBuilder& SchemaBuilder::extends(const std::vector<SchemaPtr>& bases) {
    for (const auto& base : bases) {
        extends(base);
    }
    return *this;
}

SchemaBuilder& SchemaBuilder::field(const std::string& name, const Field& field) {
    if (own_fields_.has(name)) {
        throw ConfigurationError("field '" + name + "' is declared twice in schema '" + name_ + "'");
    }
    own_fields_.insertOrAssign(name, field.bind(name));
    return *this;
}

SchemaBuilder& SchemaBuilder::description(const std::string& description) {
    description_ = description;
    return *this;
}

SchemaPtr SchemaBuilder::build() const {
    std::vector<SchemaPtr> ancestors = linearize(name_, bases_);

    FieldRegistry all_fields;
    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        all_fields = mergeFieldRegistries(all_fields, (*it)->allFields());
    }
    all_fields = mergeFieldRegistries(all_fields, own_fields_);

    SchemaPtr schema(new SchemaType(name_, description_, bases_, std::move(ancestors), own_fields_,
                                    std::move(all_fields)));
    LOG_DEBUG("schema", "Schema built: " + name_ + " (" + std::to_string(schema->allFields().size()) + " fields)");
    return schema;
}

// EN: Record
// FR: Enregistrement
Record::Record(SchemaPtr schema, Value::Map values) : schema_(std::move(schema)), values_(std::move(values)) {}

FieldPtr Record::requireField(const std::string& name) const {
    FieldPtr field = schema_->getField(name);
    if (!field) {
        throw UnknownFieldError(schema_->name(), name);
    }
    return field;
}

const Value& Record::get(const std::string& name) const {
    requireField(name);
    return values_.at(name);
}

void Record::set(const std::string& name, const Value& raw) {
    FieldPtr field = requireField(name);
    values_[name] = field->sanitize(raw);
}

std::string Record::toJson(int indent) const {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [field_name, field] : schema_->allFields()) {
        object[field_name] = field->format(values_.at(field_name));
    }
    return object.dump(indent);
}

std::string Record::repr() const {
    std::ostringstream out;
    out << "<" << schema_->name();
    for (const auto& entry : schema_->allFields()) {
        out << " " << entry.first << "=" << values_.at(entry.first).repr();
    }
    out << ">";
    return out.str();
}

bool Record::operator==(const Record& other) const {
    return schema_ == other.schema_ && values_ == other.values_;
}

} // namespace BJS::Schema
