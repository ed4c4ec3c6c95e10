#pragma once
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class FieldType { String, Number, Integer, Boolean, Array, Object };

struct FieldSpec {
    std::string name;
    FieldType type{FieldType::String};
    bool required{true};
    std::vector<std::string> allowed;   // string enum, compared case-insensitively
    std::optional<double> min;
    std::optional<double> max;
    std::vector<FieldSpec> fields;      // object members
    std::shared_ptr<FieldSpec> element; // array element
    bool allow_extra{true};             // unknown object members
};

struct ValidationReport {
    bool ok{true};
    std::vector<std::string> errors;
};

ValidationReport validate_structure(const nlohmann::json& doc, const FieldSpec& root);

FieldSpec string_field(std::string name, bool required = true);
FieldSpec enum_field(std::string name, std::vector<std::string> allowed, bool required = true);
FieldSpec number_field(std::string name, double min, double max, bool required = true);
FieldSpec integer_field(std::string name, double min, double max, bool required = true);
FieldSpec bool_field(std::string name, bool required = true);
FieldSpec object_field(std::string name, std::vector<FieldSpec> fields, bool required = true);
FieldSpec array_field(std::string name, FieldSpec element, bool required = true);
FieldSpec string_array(std::string name, bool required = true);
