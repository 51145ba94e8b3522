#include "schema/schema.hpp"

#include "report/json_pointer.hpp"

#include <algorithm>
#include <array>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace jtdv::schema {

namespace {

using JsonValue = core::json::Value;
using report::PathSegments;

constexpr std::array<std::string_view, 13> kKeywords = {
    "definitions", "nullable",  "metadata",           "ref",
    "type",        "enum",      "elements",           "properties",
    "optionalProperties",       "additionalProperties", "values",
    "discriminator",            "mapping",
};

constexpr std::array<std::pair<std::string_view, TypeName>, 11> kTypeNames = {{
    {"boolean", TypeName::kBoolean},
    {"float32", TypeName::kFloat32},
    {"float64", TypeName::kFloat64},
    {"int8", TypeName::kInt8},
    {"uint8", TypeName::kUint8},
    {"int16", TypeName::kInt16},
    {"uint16", TypeName::kUint16},
    {"int32", TypeName::kInt32},
    {"uint32", TypeName::kUint32},
    {"string", TypeName::kString},
    {"timestamp", TypeName::kTimestamp},
}};

bool Fail(SchemaErrorKind kind, const PathSegments& path, std::string message,
          SchemaError& error) {
  error.kind = kind;
  error.path = report::ToJsonPointer(path);
  error.message = std::move(message);
  return false;
}

const JsonValue* GetField(const JsonValue& object_value, std::string_view key) {
  const auto it = object_value.object_value.find(std::string(key));
  if (it == object_value.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

bool IsKeyword(std::string_view key) {
  return std::find(kKeywords.begin(), kKeywords.end(), key) != kKeywords.end();
}

bool RequireType(const JsonValue& member, JsonValue::Type expected, std::string_view keyword,
                 PathSegments& path, SchemaError& error) {
  if (member.type == expected) {
    return true;
  }
  path.push_back(std::string(keyword));
  Fail(SchemaErrorKind::kShape, path,
       std::string(keyword) + " must be a JSON " + core::json::ToString(expected) + ", got " +
           core::json::ToString(member.type),
       error);
  path.pop_back();
  return false;
}

bool CheckShape(const JsonValue& json, PathSegments& path, SchemaError& error);

bool CheckShapeOfMap(const JsonValue& member, std::string_view keyword, PathSegments& path,
                     SchemaError& error) {
  if (!RequireType(member, JsonValue::Type::kObject, keyword, path, error)) {
    return false;
  }
  path.push_back(std::string(keyword));
  for (const auto& [name, child] : member.object_value) {
    path.push_back(name);
    if (!CheckShape(child, path, error)) {
      return false;
    }
    path.pop_back();
  }
  path.pop_back();
  return true;
}

// First pass: every node is an object with known, correctly typed keywords.
// Runs over the whole document before any form rules are applied so a typo
// deep in the tree is reported as a parse failure, not as a form error.
bool CheckShape(const JsonValue& json, PathSegments& path, SchemaError& error) {
  if (json.type != JsonValue::Type::kObject) {
    return Fail(SchemaErrorKind::kShape, path,
                std::string("schema must be a JSON object, got ") +
                    core::json::ToString(json.type),
                error);
  }

  for (const auto& [key, member] : json.object_value) {
    if (!IsKeyword(key)) {
      return Fail(SchemaErrorKind::kShape, path, "unknown keyword '" + key + "'", error);
    }

    if (key == "definitions" || key == "properties" || key == "optionalProperties" ||
        key == "mapping") {
      if (!CheckShapeOfMap(member, key, path, error)) {
        return false;
      }
    } else if (key == "nullable" || key == "additionalProperties") {
      if (!RequireType(member, JsonValue::Type::kBool, key, path, error)) {
        return false;
      }
    } else if (key == "metadata") {
      if (!RequireType(member, JsonValue::Type::kObject, key, path, error)) {
        return false;
      }
    } else if (key == "ref" || key == "type" || key == "discriminator") {
      if (!RequireType(member, JsonValue::Type::kString, key, path, error)) {
        return false;
      }
    } else if (key == "enum") {
      if (!RequireType(member, JsonValue::Type::kArray, key, path, error)) {
        return false;
      }
      for (std::size_t i = 0; i < member.array_value.size(); ++i) {
        if (member.array_value[i].type != JsonValue::Type::kString) {
          path.push_back("enum");
          path.push_back(std::to_string(i));
          Fail(SchemaErrorKind::kShape, path, "enum values must be strings", error);
          return false;
        }
      }
    } else if (key == "elements" || key == "values") {
      path.push_back(key);
      if (!CheckShape(member, path, error)) {
        return false;
      }
      path.pop_back();
    }
  }

  return true;
}

bool Convert(const JsonValue& json, PathSegments& path, Schema& schema, SchemaError& error);

bool ConvertMap(const JsonValue& member, std::string_view keyword, PathSegments& path,
                Schema::Map& out, SchemaError& error) {
  path.push_back(std::string(keyword));
  for (const auto& [name, child_json] : member.object_value) {
    path.push_back(name);
    Schema child;
    if (!Convert(child_json, path, child, error)) {
      return false;
    }
    out.emplace(name, std::move(child));
    path.pop_back();
  }
  path.pop_back();
  return true;
}

bool ConvertChild(const JsonValue& member, std::string_view keyword, PathSegments& path,
                  std::unique_ptr<Schema>& out, SchemaError& error) {
  path.push_back(std::string(keyword));
  out = std::make_unique<Schema>();
  if (!Convert(member, path, *out, error)) {
    return false;
  }
  path.pop_back();
  return true;
}

// Second pass: decide the form and build the typed node. Input is known to be
// shape-valid.
bool Convert(const JsonValue& json, PathSegments& path, Schema& schema, SchemaError& error) {
  const JsonValue* definitions = GetField(json, "definitions");
  const JsonValue* nullable = GetField(json, "nullable");
  const JsonValue* metadata = GetField(json, "metadata");
  const JsonValue* ref = GetField(json, "ref");
  const JsonValue* type = GetField(json, "type");
  const JsonValue* enum_values = GetField(json, "enum");
  const JsonValue* elements = GetField(json, "elements");
  const JsonValue* properties = GetField(json, "properties");
  const JsonValue* optional_properties = GetField(json, "optionalProperties");
  const JsonValue* additional_properties = GetField(json, "additionalProperties");
  const JsonValue* values = GetField(json, "values");
  const JsonValue* discriminator = GetField(json, "discriminator");
  const JsonValue* mapping = GetField(json, "mapping");

  std::vector<std::string_view> forms;
  if (ref != nullptr) {
    forms.push_back("ref");
  }
  if (type != nullptr) {
    forms.push_back("type");
  }
  if (enum_values != nullptr) {
    forms.push_back("enum");
  }
  if (elements != nullptr) {
    forms.push_back("elements");
  }
  if (properties != nullptr || optional_properties != nullptr ||
      additional_properties != nullptr) {
    forms.push_back("properties");
  }
  if (values != nullptr) {
    forms.push_back("values");
  }
  if (discriminator != nullptr || mapping != nullptr) {
    forms.push_back("discriminator");
  }

  if (forms.size() > 1U) {
    std::string joined;
    for (const auto form : forms) {
      if (!joined.empty()) {
        joined += ", ";
      }
      joined += form;
    }
    return Fail(SchemaErrorKind::kForm, path,
                "schema mixes keywords from more than one form (" + joined + ")", error);
  }

  if (definitions != nullptr) {
    schema.has_definitions = true;
    if (!ConvertMap(*definitions, "definitions", path, schema.definitions, error)) {
      return false;
    }
  }
  if (nullable != nullptr) {
    schema.nullable = nullable->bool_value;
  }
  if (metadata != nullptr) {
    schema.metadata = metadata->object_value;
  }

  if (ref != nullptr) {
    schema.form = Form::kRef;
    schema.ref = ref->string_value;
    return true;
  }

  if (type != nullptr) {
    schema.form = Form::kType;
    if (!ParseTypeName(type->string_value, schema.type)) {
      path.push_back("type");
      Fail(SchemaErrorKind::kForm, path, "unknown type '" + type->string_value + "'", error);
      return false;
    }
    return true;
  }

  if (enum_values != nullptr) {
    schema.form = Form::kEnum;
    std::set<std::string> seen;
    for (const auto& item : enum_values->array_value) {
      if (!seen.insert(item.string_value).second) {
        path.push_back("enum");
        Fail(SchemaErrorKind::kForm, path, "enum contains duplicated value '" +
                                               item.string_value + "'",
             error);
        return false;
      }
      schema.enum_values.push_back(item.string_value);
    }
    return true;
  }

  if (elements != nullptr) {
    schema.form = Form::kElements;
    return ConvertChild(*elements, "elements", path, schema.elements, error);
  }

  if (!forms.empty() && forms.front() == "properties") {
    schema.form = Form::kProperties;
    if (properties == nullptr && optional_properties == nullptr) {
      return Fail(SchemaErrorKind::kForm, path,
                  "additionalProperties requires properties or optionalProperties", error);
    }
    if (properties != nullptr) {
      schema.has_properties = true;
      if (!ConvertMap(*properties, "properties", path, schema.properties, error)) {
        return false;
      }
    }
    if (optional_properties != nullptr) {
      schema.has_optional_properties = true;
      if (!ConvertMap(*optional_properties, "optionalProperties", path,
                      schema.optional_properties, error)) {
        return false;
      }
    }
    if (additional_properties != nullptr) {
      schema.additional_properties = additional_properties->bool_value;
    }
    return true;
  }

  if (values != nullptr) {
    schema.form = Form::kValues;
    return ConvertChild(*values, "values", path, schema.values, error);
  }

  if (discriminator != nullptr || mapping != nullptr) {
    schema.form = Form::kDiscriminator;
    if (discriminator == nullptr) {
      return Fail(SchemaErrorKind::kForm, path, "mapping requires discriminator", error);
    }
    if (mapping == nullptr) {
      return Fail(SchemaErrorKind::kForm, path, "discriminator requires mapping", error);
    }
    schema.discriminator = discriminator->string_value;
    return ConvertMap(*mapping, "mapping", path, schema.mapping, error);
  }

  schema.form = Form::kEmpty;
  return true;
}

bool CheckNode(const Schema& root, const Schema& schema, bool is_root, PathSegments& path,
               SchemaError& error);

bool CheckMap(const Schema& root, const Schema::Map& map, std::string_view keyword,
              PathSegments& path, SchemaError& error) {
  path.push_back(std::string(keyword));
  for (const auto& [name, child] : map) {
    path.push_back(name);
    if (!CheckNode(root, child, false, path, error)) {
      return false;
    }
    path.pop_back();
  }
  path.pop_back();
  return true;
}

bool CheckMapping(const Schema& root, const Schema& schema, PathSegments& path,
                  SchemaError& error) {
  path.push_back("mapping");
  for (const auto& [tag_value, child] : schema.mapping) {
    path.push_back(tag_value);
    if (child.form != Form::kProperties) {
      return Fail(SchemaErrorKind::kStructure, path,
                  "discriminator mapping '" + tag_value + "' must be a properties-form schema",
                  error);
    }
    if (child.nullable) {
      return Fail(SchemaErrorKind::kStructure, path,
                  "discriminator mapping '" + tag_value + "' must not be nullable", error);
    }
    if (child.properties.count(schema.discriminator) != 0U ||
        child.optional_properties.count(schema.discriminator) != 0U) {
      return Fail(SchemaErrorKind::kStructure, path,
                  "discriminator mapping '" + tag_value +
                      "' must not redeclare the discriminator property '" +
                      schema.discriminator + "'",
                  error);
    }
    if (!CheckNode(root, child, false, path, error)) {
      return false;
    }
    path.pop_back();
  }
  path.pop_back();
  return true;
}

bool CheckNode(const Schema& root, const Schema& schema, bool is_root, PathSegments& path,
               SchemaError& error) {
  if (!is_root && schema.has_definitions) {
    return Fail(SchemaErrorKind::kStructure, path,
                "definitions are only allowed on the root schema", error);
  }
  if (!CheckMap(root, schema.definitions, "definitions", path, error)) {
    return false;
  }

  switch (schema.form) {
  case Form::kEmpty:
  case Form::kType:
    return true;
  case Form::kRef:
    if (root.definitions.count(schema.ref) == 0U) {
      return Fail(SchemaErrorKind::kStructure, path, "no such definition: '" + schema.ref + "'",
                  error);
    }
    return true;
  case Form::kEnum:
    if (schema.enum_values.empty()) {
      return Fail(SchemaErrorKind::kStructure, path, "enum must contain at least one value",
                  error);
    }
    return true;
  case Form::kElements:
    path.push_back("elements");
    if (!CheckNode(root, *schema.elements, false, path, error)) {
      return false;
    }
    path.pop_back();
    return true;
  case Form::kProperties:
    for (const auto& entry : schema.properties) {
      if (schema.optional_properties.count(entry.first) != 0U) {
        return Fail(SchemaErrorKind::kStructure, path,
                    "property '" + entry.first +
                        "' is declared in both properties and optionalProperties",
                    error);
      }
    }
    return CheckMap(root, schema.properties, "properties", path, error) &&
           CheckMap(root, schema.optional_properties, "optionalProperties", path, error);
  case Form::kValues:
    path.push_back("values");
    if (!CheckNode(root, *schema.values, false, path, error)) {
      return false;
    }
    path.pop_back();
    return true;
  case Form::kDiscriminator:
    return CheckMapping(root, schema, path, error);
  }

  return true;
}

// Rejects definitions whose ref chain loops without reaching a schema that
// inspects the instance.
bool CheckRefChains(const Schema& root, SchemaError& error) {
  for (const auto& [name, definition] : root.definitions) {
    std::set<std::string> seen{name};
    const Schema* current = &definition;
    while (current->form == Form::kRef) {
      if (!seen.insert(current->ref).second) {
        const PathSegments path{"definitions", name};
        return Fail(SchemaErrorKind::kStructure, path,
                    "definition '" + name +
                        "' leads into a cycle of refs that never reaches a non-ref schema",
                    error);
      }
      current = &root.definitions.at(current->ref);
    }
  }
  return true;
}

} // namespace

bool ParseTypeName(std::string_view raw, TypeName& type) {
  for (const auto& [name, value] : kTypeNames) {
    if (name == raw) {
      type = value;
      return true;
    }
  }
  return false;
}

const char* ToString(SchemaErrorKind kind) {
  switch (kind) {
  case SchemaErrorKind::kShape:
    return "failed to parse schema";
  case SchemaErrorKind::kForm:
    return "malformed schema";
  case SchemaErrorKind::kStructure:
    return "invalid schema";
  }
  return "invalid schema";
}

std::string Describe(const SchemaError& error) {
  if (error.path.empty()) {
    return error.message;
  }
  return error.message + " (at " + error.path + ")";
}

bool FromJson(const core::json::Value& json, Schema& schema, SchemaError& error) {
  PathSegments path;
  if (!CheckShape(json, path, error)) {
    return false;
  }

  path.clear();
  schema = Schema{};
  return Convert(json, path, schema, error);
}

bool CheckStructure(const Schema& root, SchemaError& error) {
  PathSegments path;
  return CheckNode(root, root, true, path, error) && CheckRefChains(root, error);
}

} // namespace jtdv::schema
