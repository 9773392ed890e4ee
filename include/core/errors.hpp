// EN: Exception taxonomy shared by every BJS module.
// FR: Taxonomie des exceptions partagée par tous les modules BJS.

#pragma once

#include <stdexcept>
#include <string>

namespace BJS {

// EN: Base class of all library errors.
// FR: Classe de base de toutes les erreurs de la bibliothèque.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// EN: Malformed validator, field or schema setup (caller or library bug).
// FR: Configuration invalide d'un validateur, champ ou schéma (bug appelant ou bibliothèque).
class ConfigurationError : public Error {
public:
    using Error::Error;
};

// EN: Operation not supported by the kinds of its operands (incomparable values, no length...).
// FR: Opération non supportée par les types des opérandes (valeurs incomparables, pas de longueur...).
class ValueTypeError : public Error {
public:
    using Error::Error;
};

// EN: Value has an acceptable kind but its content cannot be converted.
// FR: La valeur a un type acceptable mais son contenu ne peut pas être converti.
class CoercionError : public Error {
public:
    using Error::Error;
};

// EN: Raised by the parser collaborator on malformed external input.
// FR: Levée par le collaborateur parseur sur une entrée externe malformée.
class ParseError : public Error {
public:
    using Error::Error;
};

// EN: Value does not conform to the declared type of a field.
// FR: La valeur ne respecte pas le type déclaré d'un champ.
class FieldTypeError : public Error {
public:
    FieldTypeError(const std::string& field_name, const std::string& expected_type,
                   const std::string& actual_type, const std::string& input_repr)
        : Error("field '" + field_name + "' expects " + expected_type + " (received " +
                input_repr + " of type " + actual_type + ")"),
          field_name_(field_name), expected_type_(expected_type),
          actual_type_(actual_type), input_repr_(input_repr) {}

    const std::string& fieldName() const { return field_name_; }
    const std::string& expectedType() const { return expected_type_; }
    const std::string& actualType() const { return actual_type_; }
    const std::string& inputRepr() const { return input_repr_; }

private:
    std::string field_name_;
    std::string expected_type_;
    std::string actual_type_;
    std::string input_repr_;
};

// EN: Input key with no matching field in the schema registry.
// FR: Clé d'entrée sans champ correspondant dans le registre du schéma.
class UnknownFieldError : public Error {
public:
    UnknownFieldError(const std::string& schema_name, const std::string& field_name)
        : Error("unknown field '" + field_name + "' for schema '" + schema_name + "'"),
          schema_name_(schema_name), field_name_(field_name) {}

    const std::string& schemaName() const { return schema_name_; }
    const std::string& fieldName() const { return field_name_; }

private:
    std::string schema_name_;
    std::string field_name_;
};

// EN: Field without default missing from the construction input.
// FR: Champ sans valeur par défaut absent de l'entrée de construction.
class MissingFieldError : public Error {
public:
    MissingFieldError(const std::string& schema_name, const std::string& field_name)
        : Error("missing required field '" + field_name + "' for schema '" + schema_name + "'"),
          schema_name_(schema_name), field_name_(field_name) {}

    const std::string& schemaName() const { return schema_name_; }
    const std::string& fieldName() const { return field_name_; }

private:
    std::string schema_name_;
    std::string field_name_;
};

} // namespace BJS
