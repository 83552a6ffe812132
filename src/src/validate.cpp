#include <string>
#include "sg/validate.h"
#include "sg/debug.h"
#include "sg/schema_resolver.h"
#include <cmath>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>
#include <vector>

namespace sg {

static std::string value_preview(const Dictionary& d, size_t maxlen = 80) {
    std::string s = d.dump();
    if (s.size() > maxlen) s = s.substr(0, maxlen - 3) + "...";
    return s;
}

// Render a `type` keyword the way it appears in messages: "string" or "string,null".
static std::string schema_type_text(const Dictionary* type) {
    if (type == nullptr) return "undefined";
    if (type->isArrayObject()) {
        std::string out;
        for (auto const& t : type->elements()) {
            if (!out.empty()) out.push_back(',');
            out += t.isString() ? t.asString() : t.dump();
        }
        return out;
    }
    return type->isString() ? type->asString() : type->dump();
}

static std::string trace_path(const TraversalInfo& info) {
    std::string out = "root";
    for (auto const& e : info.valuePath()) {
        if (std::holds_alternative<std::monostate>(e.key)) continue;
        out += "/" + to_string(e.key);
    }
    return out;
}

// A numeric keyword, or nullptr when absent or not a number.
static const Dictionary* number_field(const Dictionary& schema, const char* name) {
    const Dictionary* v = schemaField(schema, name);
    return v != nullptr && v->isNumber() ? v : nullptr;
}

size_t utf16Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) == 0x80) continue;
        n += c >= 0xF0 ? 2 : 1;
    }
    return n;
}

std::optional<ValidationError> ValidationEngine::validate(const Dictionary& value,
                                                          const Dictionary& schema,
                                                          TraversalInfo& info) {
    if (debugEnabled()) {
        std::cerr << "validate enter: path='" << trace_path(info) << "' value=" << value_preview(value)
                  << " schema_keys={";
        bool firstk = true;
        for (auto const& k : schema.keys()) {
            if (!firstk) std::cerr << ",";
            firstk = false;
            std::cerr << k;
        }
        std::cerr << "}\n";
    }

    if (auto err = validateSingleSchema(value, schema, info)) return err;
    if (auto err = validateConditional(value, schema, info)) return err;
    if (auto err = validateAllOf(value, schema, info)) return err;
    if (auto err = validateAnyOf(value, schema, info)) return err;
    if (auto err = validateOneOf(value, schema, info)) return err;
    if (auto err = validateNoneOf(value, schema, info)) return err;
    return std::nullopt;
}

namespace {

// Marks the engine as trying a branch for the lifetime of the scope.
class SpeculativeScope {
  public:
    explicit SpeculativeScope(int& depth) : m_depth(depth) { ++m_depth; }
    ~SpeculativeScope() { --m_depth; }
    SpeculativeScope(const SpeculativeScope&) = delete;
    SpeculativeScope& operator=(const SpeculativeScope&) = delete;

  private:
    int& m_depth;
};

}  // namespace

bool ValidationEngine::matches(const Dictionary& value, const Dictionary& schema, TraversalInfo& info) {
    SpeculativeScope scope(m_speculative_depth);
    return !validate(value, schema, info).has_value();
}

ValidationError ValidationEngine::fail(const std::string& message,
                                       const Dictionary& value,
                                       const Dictionary& schema,
                                       const TraversalInfo& info) const {
    if (m_speculative_depth > 0) return ValidationError(message, info);
    return ValidationError(message, value, schema, info);
}

std::optional<ValidationError> ValidationEngine::validateConditional(const Dictionary& value,
                                                                     const Dictionary& schema,
                                                                     TraversalInfo& info) {
    const Dictionary* if_schema = schemaField(schema, "if");
    if (if_schema == nullptr || !if_schema->isMappedObject()) return std::nullopt;

    bool okay;
    {
        SchemaScope scope(info, std::string("if"), *if_schema);
        okay = matches(value, *if_schema, info);
    }

    const char* branch = okay ? "then" : "else";
    const Dictionary* next_schema = schemaField(schema, branch);
    if (next_schema == nullptr || !next_schema->isMappedObject()) return std::nullopt;

    SchemaScope scope(info, std::string(branch), *next_schema);
    return validate(value, *next_schema, info);
}

std::optional<ValidationError> ValidationEngine::validateAllOf(const Dictionary& value,
                                                               const Dictionary& schema,
                                                               TraversalInfo& info) {
    const Dictionary* sub_schemas = schemaField(schema, "allOf");
    if (sub_schemas == nullptr || !sub_schemas->isArrayObject()) return std::nullopt;

    SchemaScope list_scope(info, std::string("allOf"), *sub_schemas);
    for (int i = 0; i < sub_schemas->size(); ++i) {
        const Dictionary& sub_schema = sub_schemas->at(i);
        SchemaScope scope(info, i, sub_schema);
        if (auto err = validate(value, sub_schema, info)) return err;
    }
    return std::nullopt;
}

std::optional<ValidationError> ValidationEngine::validateAnyOf(const Dictionary& value,
                                                               const Dictionary& schema,
                                                               TraversalInfo& info) {
    const Dictionary* sub_schemas = schemaField(schema, "anyOf");
    if (sub_schemas == nullptr || !sub_schemas->isArrayObject()) return std::nullopt;

    SchemaScope list_scope(info, std::string("anyOf"), *sub_schemas);
    for (int i = 0; i < sub_schemas->size(); ++i) {
        const Dictionary& sub_schema = sub_schemas->at(i);
        SchemaScope scope(info, i, sub_schema);
        if (matches(value, sub_schema, info)) return std::nullopt;
    }

    return fail("0 anyOf schemas matched", value, schema, info);
}

std::optional<ValidationError> ValidationEngine::validateOneOf(const Dictionary& value,
                                                               const Dictionary& schema,
                                                               TraversalInfo& info) {
    const Dictionary* sub_schemas = schemaField(schema, "oneOf");
    if (sub_schemas == nullptr || !sub_schemas->isArrayObject()) return std::nullopt;

    SchemaScope list_scope(info, std::string("oneOf"), *sub_schemas);
    int count = 0;
    for (int i = 0; i < sub_schemas->size(); ++i) {
        const Dictionary& sub_schema = sub_schemas->at(i);
        SchemaScope scope(info, i, sub_schema);
        if (matches(value, sub_schema, info)) ++count;
    }

    if (count != 1) {
        return fail(std::to_string(count) + " oneOf schemas matched", value, schema, info);
    }
    return std::nullopt;
}

// `not` holds a list of schemas, none of which may match.
std::optional<ValidationError> ValidationEngine::validateNoneOf(const Dictionary& value,
                                                                const Dictionary& schema,
                                                                TraversalInfo& info) {
    const Dictionary* sub_schemas = schemaField(schema, "not");
    if (sub_schemas == nullptr || !sub_schemas->isArrayObject()) return std::nullopt;

    SchemaScope list_scope(info, std::string("not"), *sub_schemas);
    for (int i = 0; i < sub_schemas->size(); ++i) {
        const Dictionary& sub_schema = sub_schemas->at(i);
        SchemaScope scope(info, i, sub_schema);
        if (!matches(value, sub_schema, info)) continue;
        return fail("not[" + std::to_string(i) + "] schema matched", value, schema, info);
    }
    return std::nullopt;
}

std::optional<ValidationError> ValidationEngine::validateSingleSchema(const Dictionary& value,
                                                                      const Dictionary& schema,
                                                                      TraversalInfo& info) {
    const std::string type = valueTypeName(value);
    if (!isValueTypeAny(value, schema)) {
        return fail("Value type " + type + " does not match schema type " +
                        schema_type_text(schemaField(schema, "type")),
                    value, schema, info);
    }

    const Dictionary* schema_const = schemaField(schema, "const");
    if (schema_const != nullptr && *schema_const != value) {
        return fail("Invalid constant value", value, schema, info);
    }

    const Dictionary* schema_enum = schemaField(schema, "enum");
    if (schema_enum != nullptr && schema_enum->isArrayObject()) {
        bool found = false;
        for (auto const& candidate : schema_enum->elements()) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) return fail("Invalid enum value", value, schema, info);
    }

    switch (value.type()) {
        case Dictionary::Integer:
        case Dictionary::Double:
            return validateNumber(value, schema, info);
        case Dictionary::String:
            return validateString(value, schema, info);
        case Dictionary::Array:
            return validateArray(value, schema, info);
        case Dictionary::Object:
            return validateObject(value, schema, info);
        case Dictionary::Boolean:
        case Dictionary::Null:
            break;
    }
    return std::nullopt;
}

std::optional<ValidationError> ValidationEngine::validateNumber(const Dictionary& value,
                                                                const Dictionary& schema,
                                                                TraversalInfo& info) {
    const double x = value.asDouble();

    if (auto multiple_of = number_field(schema, "multipleOf")) {
        const double m = multiple_of->asDouble();
        if (std::floor(x / m) * m != x)
            return fail("Number is not a multiple of " + multiple_of->asString(), value, schema, info);
    }

    if (auto minimum = number_field(schema, "minimum")) {
        if (x < minimum->asDouble())
            return fail("Number is less than " + minimum->asString(), value, schema, info);
    }

    if (auto exclusive_minimum = number_field(schema, "exclusiveMinimum")) {
        if (x <= exclusive_minimum->asDouble())
            return fail("Number is less than or equal to " + exclusive_minimum->asString(), value,
                        schema, info);
    }

    if (auto maximum = number_field(schema, "maximum")) {
        if (x > maximum->asDouble())
            return fail("Number is greater than " + maximum->asString(), value, schema, info);
    }

    if (auto exclusive_maximum = number_field(schema, "exclusiveMaximum")) {
        if (x >= exclusive_maximum->asDouble())
            return fail("Number is greater than or equal to " + exclusive_maximum->asString(), value,
                        schema, info);
    }

    return std::nullopt;
}

std::optional<ValidationError> ValidationEngine::validateString(const Dictionary& value,
                                                                const Dictionary& schema,
                                                                TraversalInfo& info) {
    const std::string& s = value.asString();
    const double length = static_cast<double>(utf16Length(s));

    if (auto min_length = number_field(schema, "minLength")) {
        if (length < min_length->asDouble()) return fail("String length too short", value, schema, info);
    }

    if (auto max_length = number_field(schema, "maxLength")) {
        if (length > max_length->asDouble()) return fail("String length too long", value, schema, info);
    }

    const Dictionary* pattern = schemaField(schema, "pattern");
    if (pattern != nullptr && pattern->isString()) {
        const Dictionary* pattern_flags = schemaField(schema, "patternFlags");
        const std::string flags = pattern_flags != nullptr && pattern_flags->isString() ? pattern_flags->asString() : "";

        std::shared_ptr<const std::regex> regex;
        try {
            regex = m_regex_cache.get(pattern->asString(), flags);
        } catch (const std::regex_error& e) {
            return fail(std::string("Pattern is invalid (") + e.what() + ")", value, schema, info);
        } catch (const std::invalid_argument& e) {
            return fail(std::string("Pattern is invalid (") + e.what() + ")", value, schema, info);
        }

        if (!std::regex_search(s, *regex)) {
            return fail("Pattern match failed", value, schema, info);
        }
    }

    return std::nullopt;
}

std::optional<ValidationError> ValidationEngine::validateArray(const Dictionary& value,
                                                               const Dictionary& schema,
                                                               TraversalInfo& info) {
    if (auto min_items = number_field(schema, "minItems")) {
        if (value.size() < min_items->asDouble()) return fail("Array length too short", value, schema, info);
    }

    if (auto max_items = number_field(schema, "maxItems")) {
        if (value.size() > max_items->asDouble()) return fail("Array length too long", value, schema, info);
    }

    for (int i = 0; i < value.size(); ++i) {
        SchemaPath schema_path;
        const Dictionary* property_schema = resolveProperty(schema, i, &value, &schema_path);
        if (property_schema == nullptr) {
            return fail("No schema found for array[" + std::to_string(i) + "]", value, schema, info);
        }

        const Dictionary& property_value = value.at(i);
        PropertyScope scope(info, schema_path, i, property_value);
        if (auto err = validate(property_value, *property_schema, info)) return err;
    }

    return std::nullopt;
}

std::optional<ValidationError> ValidationEngine::validateObject(const Dictionary& value,
                                                                const Dictionary& schema,
                                                                TraversalInfo& info) {
    const std::vector<std::string> properties = value.keys();

    const Dictionary* required = schemaField(schema, "required");
    if (required != nullptr && required->isArrayObject()) {
        for (auto const& property : required->elements()) {
            if (!property.isString() || !value.has(property.asString())) {
                const std::string name = property.isString() ? property.asString() : property.dump();
                return fail("Missing property " + name, value, schema, info);
            }
        }
    }

    if (auto min_properties = number_field(schema, "minProperties")) {
        if (value.size() < min_properties->asDouble())
            return fail("Not enough object properties", value, schema, info);
    }

    if (auto max_properties = number_field(schema, "maxProperties")) {
        if (value.size() > max_properties->asDouble())
            return fail("Too many object properties", value, schema, info);
    }

    for (auto const& property : properties) {
        SchemaPath schema_path;
        const Dictionary* property_schema = resolveProperty(schema, property, &value, &schema_path);
        if (property_schema == nullptr) {
            return fail("No schema found for " + property, value, schema, info);
        }

        const Dictionary& property_value = value.at(property);
        PropertyScope scope(info, schema_path, property, property_value);
        if (auto err = validate(property_value, *property_schema, info)) return err;
    }

    return std::nullopt;
}

std::optional<ValidationError> validate(const Dictionary& value, const Dictionary& schema) {
    ValidationEngine engine;
    TraversalInfo info(value, schema);
    return engine.validate(value, schema, info);
}

Dictionary clone(const Dictionary& value) { return value; }

}  // namespace sg
