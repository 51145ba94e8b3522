#pragma once

#include "core/json_dom.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace jtdv::schema {

// The eight mutually exclusive JSON Typedef schema forms (RFC 8927 section 2.2).
enum class Form {
  kEmpty,
  kRef,
  kType,
  kEnum,
  kElements,
  kProperties,
  kValues,
  kDiscriminator,
};

enum class TypeName {
  kBoolean,
  kFloat32,
  kFloat64,
  kInt8,
  kUint8,
  kInt16,
  kUint16,
  kInt32,
  kUint32,
  kString,
  kTimestamp,
};

bool ParseTypeName(std::string_view raw, TypeName& type);

// Typed, immutable-after-load representation of a JSON Typedef schema.
//
// Only the members relevant to `form` carry meaning; the rest stay empty.
// `definitions` is only ever populated on the root (enforced by
// CheckStructure).
struct Schema {
  using Map = std::map<std::string, Schema>;

  Form form = Form::kEmpty;
  bool nullable = false;
  bool has_definitions = false;
  Map definitions;
  core::json::Value::Object metadata;

  // kRef
  std::string ref;

  // kType
  TypeName type = TypeName::kBoolean;

  // kEnum, in declaration order
  std::vector<std::string> enum_values;

  // kElements / kValues
  std::unique_ptr<Schema> elements;
  std::unique_ptr<Schema> values;

  // kProperties
  bool has_properties = false;
  bool has_optional_properties = false;
  Map properties;
  Map optional_properties;
  bool additional_properties = false;

  // kDiscriminator
  std::string discriminator;
  Map mapping;
};

enum class SchemaErrorKind {
  // Document is not shaped like a schema: not an object, unknown keyword,
  // keyword with the wrong JSON type.
  kShape,
  // Keywords are well-typed but combine into no valid form, or carry an
  // unknown type name / duplicated enum value.
  kForm,
  // Form is fine but the schema is unsound: dangling ref, empty enum,
  // non-root definitions, bad discriminator mapping.
  kStructure,
};

const char* ToString(SchemaErrorKind kind);

struct SchemaError {
  SchemaErrorKind kind = SchemaErrorKind::kShape;
  // JSON Pointer to the offending schema node ("" for the root).
  std::string path;
  std::string message;
};

// Renders "<message> (at <path>)" or just the message for root-level errors.
std::string Describe(const SchemaError& error);

// Converts a parsed JSON document into the typed schema model.
//
// Contract:
// - Returns false with `error.kind` set to kShape or kForm on failure.
// - Does not check cross-references; call CheckStructure afterwards.
bool FromJson(const core::json::Value& json, Schema& schema, SchemaError& error);

// Structural soundness check over a converted root schema.
//
// Contract:
// - Returns false with `error.kind == kStructure` on the first violation
//   found in a depth-first walk.
bool CheckStructure(const Schema& root, SchemaError& error);

} // namespace jtdv::schema
