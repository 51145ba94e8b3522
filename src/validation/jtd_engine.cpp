#include "validation/jtd_engine.hpp"

#include "validation/timestamp.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jtdv::validation {

namespace {

using JsonValue = core::json::Value;
using schema::Form;
using schema::Schema;
using schema::TypeName;

bool IsIntegerInRange(const JsonValue& instance, double min, double max) {
  if (instance.type != JsonValue::Type::kNumber) {
    return false;
  }
  const double value = instance.number_value;
  if (!std::isfinite(value) || std::trunc(value) != value) {
    return false;
  }
  return value >= min && value <= max;
}

bool MatchesType(TypeName type, const JsonValue& instance) {
  switch (type) {
  case TypeName::kBoolean:
    return instance.type == JsonValue::Type::kBool;
  case TypeName::kFloat32:
  case TypeName::kFloat64:
    return instance.type == JsonValue::Type::kNumber;
  case TypeName::kInt8:
    return IsIntegerInRange(instance, -128.0, 127.0);
  case TypeName::kUint8:
    return IsIntegerInRange(instance, 0.0, 255.0);
  case TypeName::kInt16:
    return IsIntegerInRange(instance, -32768.0, 32767.0);
  case TypeName::kUint16:
    return IsIntegerInRange(instance, 0.0, 65535.0);
  case TypeName::kInt32:
    return IsIntegerInRange(instance, -2147483648.0, 2147483647.0);
  case TypeName::kUint32:
    return IsIntegerInRange(instance, 0.0, 4294967295.0);
  case TypeName::kString:
    return instance.type == JsonValue::Type::kString;
  case TypeName::kTimestamp:
    return instance.type == JsonValue::Type::kString &&
           IsRfc3339Timestamp(instance.string_value);
  }
  return false;
}

// Depth-first walk of one instance against the loaded schema.
//
// `schema_frames_` holds one schema path per ref being followed; the back
// frame is the path errors are reported against. Walk methods return false
// once the run for this instance must stop, either because max_errors was
// reached or because a fatal condition was recorded.
class InstanceWalker {
public:
  InstanceWalker(const Schema& root, const ValidationOptions& options)
      : root_(root), options_(options) {
    schema_frames_.emplace_back();
  }

  ValidationResult Run(const JsonValue& instance) {
    Walk(root_, instance, nullptr);
    if (fatal_) {
      return ValidationResult::Fatal(fatal_kind_, std::move(fatal_detail_));
    }
    return ValidationResult::Ok(std::move(errors_));
  }

private:
  bool Walk(const Schema& schema, const JsonValue& instance, const std::string* parent_tag) {
    if (schema.nullable && instance.type == JsonValue::Type::kNull) {
      return true;
    }

    switch (schema.form) {
    case Form::kEmpty:
      return true;
    case Form::kRef:
      return WalkRef(schema, instance);
    case Form::kType:
      if (!MatchesType(schema.type, instance)) {
        return PushError("type");
      }
      return true;
    case Form::kEnum:
      return WalkEnum(schema, instance);
    case Form::kElements:
      return WalkElements(schema, instance);
    case Form::kProperties:
      return WalkProperties(schema, instance, parent_tag);
    case Form::kValues:
      return WalkValues(schema, instance);
    case Form::kDiscriminator:
      return WalkDiscriminator(schema, instance);
    }
    return true;
  }

  bool WalkRef(const Schema& schema, const JsonValue& instance) {
    const std::uint64_t refs_followed = schema_frames_.size() - 1U;
    if (options_.max_depth.has_value() && refs_followed >= *options_.max_depth) {
      return Fatal(FatalKind::kMaxDepthExceeded,
                   "max depth of " + std::to_string(*options_.max_depth) +
                       " exceeded while following ref '" + schema.ref + "'");
    }

    const auto it = root_.definitions.find(schema.ref);
    if (it == root_.definitions.end()) {
      // CheckSchema rejects dangling refs, so this only fires if it was skipped.
      return Fatal(FatalKind::kSchemaNotLoaded, "no such definition: '" + schema.ref + "'");
    }

    schema_frames_.push_back({"definitions", schema.ref});
    const bool keep_going = Walk(it->second, instance, nullptr);
    schema_frames_.pop_back();
    return keep_going;
  }

  bool WalkEnum(const Schema& schema, const JsonValue& instance) {
    if (instance.type == JsonValue::Type::kString) {
      for (const auto& value : schema.enum_values) {
        if (value == instance.string_value) {
          return true;
        }
      }
    }
    return PushError("enum");
  }

  bool WalkElements(const Schema& schema, const JsonValue& instance) {
    if (instance.type != JsonValue::Type::kArray) {
      return PushError("elements");
    }

    PushSchemaToken("elements");
    for (std::size_t i = 0; i < instance.array_value.size(); ++i) {
      instance_path_.push_back(std::to_string(i));
      const bool keep_going = Walk(*schema.elements, instance.array_value[i], nullptr);
      instance_path_.pop_back();
      if (!keep_going) {
        return false;
      }
    }
    PopSchemaToken();
    return true;
  }

  bool WalkMembers(const Schema::Map& members, std::string_view keyword, bool required,
                   const JsonValue& instance) {
    PushSchemaToken(std::string(keyword));
    for (const auto& [name, member_schema] : members) {
      PushSchemaToken(name);
      const auto it = instance.object_value.find(name);
      if (it != instance.object_value.end()) {
        instance_path_.push_back(name);
        const bool keep_going = Walk(member_schema, it->second, nullptr);
        instance_path_.pop_back();
        if (!keep_going) {
          return false;
        }
      } else if (required && !PushError()) {
        return false;
      }
      PopSchemaToken();
    }
    PopSchemaToken();
    return true;
  }

  bool WalkProperties(const Schema& schema, const JsonValue& instance,
                      const std::string* parent_tag) {
    if (instance.type != JsonValue::Type::kObject) {
      return PushError(schema.has_properties ? "properties" : "optionalProperties");
    }

    if (!WalkMembers(schema.properties, "properties", true, instance) ||
        !WalkMembers(schema.optional_properties, "optionalProperties", false, instance)) {
      return false;
    }

    if (schema.additional_properties) {
      return true;
    }

    for (const auto& entry : instance.object_value) {
      const std::string& name = entry.first;
      if (schema.properties.count(name) != 0U || schema.optional_properties.count(name) != 0U) {
        continue;
      }
      if (parent_tag != nullptr && name == *parent_tag) {
        continue;
      }
      instance_path_.push_back(name);
      const bool keep_going = PushError();
      instance_path_.pop_back();
      if (!keep_going) {
        return false;
      }
    }
    return true;
  }

  bool WalkValues(const Schema& schema, const JsonValue& instance) {
    if (instance.type != JsonValue::Type::kObject) {
      return PushError("values");
    }

    PushSchemaToken("values");
    for (const auto& [name, member] : instance.object_value) {
      instance_path_.push_back(name);
      const bool keep_going = Walk(*schema.values, member, nullptr);
      instance_path_.pop_back();
      if (!keep_going) {
        return false;
      }
    }
    PopSchemaToken();
    return true;
  }

  bool WalkDiscriminator(const Schema& schema, const JsonValue& instance) {
    if (instance.type != JsonValue::Type::kObject) {
      return PushError("discriminator");
    }

    const auto tag = instance.object_value.find(schema.discriminator);
    if (tag == instance.object_value.end()) {
      return PushError("discriminator");
    }

    if (tag->second.type != JsonValue::Type::kString) {
      instance_path_.push_back(schema.discriminator);
      const bool keep_going = PushError("discriminator");
      instance_path_.pop_back();
      return keep_going;
    }

    const auto mapped = schema.mapping.find(tag->second.string_value);
    if (mapped == schema.mapping.end()) {
      instance_path_.push_back(schema.discriminator);
      const bool keep_going = PushError("mapping");
      instance_path_.pop_back();
      return keep_going;
    }

    PushSchemaToken("mapping");
    PushSchemaToken(mapped->first);
    if (!Walk(mapped->second, instance, &schema.discriminator)) {
      return false;
    }
    PopSchemaToken();
    PopSchemaToken();
    return true;
  }

  void PushSchemaToken(std::string token) {
    schema_frames_.back().push_back(std::move(token));
  }

  void PopSchemaToken() {
    schema_frames_.back().pop_back();
  }

  // Records an error at the current paths, with `keyword` appended to the
  // schema path when given.
  bool PushError(std::string_view keyword = {}) {
    ValidationError error;
    error.instance_path = instance_path_;
    error.schema_path = schema_frames_.back();
    if (!keyword.empty()) {
      error.schema_path.emplace_back(keyword);
    }
    errors_.push_back(std::move(error));

    return !(options_.max_errors.has_value() && errors_.size() >= *options_.max_errors);
  }

  bool Fatal(FatalKind kind, std::string detail) {
    fatal_ = true;
    fatal_kind_ = kind;
    fatal_detail_ = std::move(detail);
    return false;
  }

  const Schema& root_;
  const ValidationOptions& options_;
  report::PathSegments instance_path_;
  std::vector<report::PathSegments> schema_frames_;
  std::vector<ValidationError> errors_;
  bool fatal_ = false;
  FatalKind fatal_kind_ = FatalKind::kMaxDepthExceeded;
  std::string fatal_detail_;
};

} // namespace

const char* ToString(FatalKind kind) {
  switch (kind) {
  case FatalKind::kMaxDepthExceeded:
    return "max depth exceeded";
  case FatalKind::kSchemaNotLoaded:
    return "schema not loaded";
  }
  return "max depth exceeded";
}

bool JtdEngine::ParseSchema(const core::json::Value& document, schema::SchemaError& error) {
  loaded_ = false;
  if (!schema::FromJson(document, root_, error)) {
    return false;
  }
  loaded_ = true;
  return true;
}

bool JtdEngine::CheckSchema(schema::SchemaError& error) const {
  if (!loaded_) {
    error.kind = schema::SchemaErrorKind::kStructure;
    error.path.clear();
    error.message = "no schema has been parsed";
    return false;
  }
  return schema::CheckStructure(root_, error);
}

ValidationResult JtdEngine::Validate(const core::json::Value& instance,
                                     const ValidationOptions& options) const {
  if (!loaded_) {
    return ValidationResult::Fatal(FatalKind::kSchemaNotLoaded, "no schema has been parsed");
  }
  InstanceWalker walker(root_, options);
  return walker.Run(instance);
}

std::unique_ptr<IValidationEngine> CreateJtdEngine() {
  return std::make_unique<JtdEngine>();
}

} // namespace jtdv::validation
