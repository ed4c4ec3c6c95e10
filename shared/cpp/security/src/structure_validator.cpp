#include "../include/structure_validator.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>

using json = nlohmann::json;

namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

const char* type_name(FieldType t) {
    switch (t) {
        case FieldType::String: return "string";
        case FieldType::Number: return "number";
        case FieldType::Integer: return "integer";
        case FieldType::Boolean: return "boolean";
        case FieldType::Array: return "array";
        case FieldType::Object: return "object";
    }
    return "value";
}

void check(const json& v, const FieldSpec& spec, const std::string& path, ValidationReport& rep) {
    auto fail = [&](const std::string& msg) {
        rep.ok = false;
        rep.errors.push_back(path + ": " + msg);
    };

    switch (spec.type) {
        case FieldType::String: {
            if (!v.is_string()) return fail("expected string");
            if (!spec.allowed.empty()) {
                std::string s = lower(v.get<std::string>());
                bool found = std::any_of(spec.allowed.begin(), spec.allowed.end(),
                                         [&](const std::string& a) { return lower(a) == s; });
                if (!found) fail("value '" + v.get<std::string>() + "' not in allowed set");
            }
            return;
        }
        case FieldType::Boolean:
            if (!v.is_boolean()) fail("expected boolean");
            return;
        case FieldType::Number:
        case FieldType::Integer: {
            if (!v.is_number()) return fail(std::string("expected ") + type_name(spec.type));
            double d = v.get<double>();
            // models often emit 7.0 for an integer field
            if (spec.type == FieldType::Integer && std::floor(d) != d) return fail("expected integer");
            if (spec.min && d < *spec.min) fail("below minimum");
            if (spec.max && d > *spec.max) fail("above maximum");
            return;
        }
        case FieldType::Array: {
            if (!v.is_array()) return fail("expected array");
            if (!spec.element) return;
            for (std::size_t i = 0; i < v.size(); ++i) {
                check(v[i], *spec.element, path + "[" + std::to_string(i) + "]", rep);
            }
            return;
        }
        case FieldType::Object: {
            if (!v.is_object()) return fail("expected object");
            std::set<std::string> known;
            for (const auto& f : spec.fields) {
                known.insert(f.name);
                std::string child = path.empty() ? f.name : path + "." + f.name;
                auto it = v.find(f.name);
                if (it == v.end() || it->is_null()) {
                    if (f.required) {
                        rep.ok = false;
                        rep.errors.push_back(child + ": missing required field");
                    }
                    continue;
                }
                check(*it, f, child, rep);
            }
            if (!spec.allow_extra) {
                for (auto it = v.begin(); it != v.end(); ++it) {
                    if (!known.count(it.key())) {
                        rep.ok = false;
                        rep.errors.push_back((path.empty() ? it.key() : path + "." + it.key()) + ": unexpected field");
                    }
                }
            }
            return;
        }
    }
}
}

ValidationReport validate_structure(const json& doc, const FieldSpec& root) {
    ValidationReport rep;
    check(doc, root, root.name, rep);
    return rep;
}

FieldSpec string_field(std::string name, bool required) {
    FieldSpec f;
    f.name = std::move(name);
    f.type = FieldType::String;
    f.required = required;
    return f;
}

FieldSpec enum_field(std::string name, std::vector<std::string> allowed, bool required) {
    FieldSpec f = string_field(std::move(name), required);
    f.allowed = std::move(allowed);
    return f;
}

FieldSpec number_field(std::string name, double min, double max, bool required) {
    FieldSpec f;
    f.name = std::move(name);
    f.type = FieldType::Number;
    f.required = required;
    f.min = min;
    f.max = max;
    return f;
}

FieldSpec integer_field(std::string name, double min, double max, bool required) {
    FieldSpec f = number_field(std::move(name), min, max, required);
    f.type = FieldType::Integer;
    return f;
}

FieldSpec bool_field(std::string name, bool required) {
    FieldSpec f;
    f.name = std::move(name);
    f.type = FieldType::Boolean;
    f.required = required;
    return f;
}

FieldSpec object_field(std::string name, std::vector<FieldSpec> fields, bool required) {
    FieldSpec f;
    f.name = std::move(name);
    f.type = FieldType::Object;
    f.required = required;
    f.fields = std::move(fields);
    return f;
}

FieldSpec array_field(std::string name, FieldSpec element, bool required) {
    FieldSpec f;
    f.name = std::move(name);
    f.type = FieldType::Array;
    f.required = required;
    f.element = std::make_shared<FieldSpec>(std::move(element));
    return f;
}

FieldSpec string_array(std::string name, bool required) {
    return array_field(std::move(name), string_field("item"), required);
}
