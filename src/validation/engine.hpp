#pragma once

#include "core/json_dom.hpp"
#include "report/json_pointer.hpp"
#include "schema/schema.hpp"
#include "validation/options.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace jtdv::validation {

// One schema/instance mismatch. Both paths are raw segments, root first.
struct ValidationError {
  report::PathSegments instance_path;
  report::PathSegments schema_path;
};

enum class FatalKind {
  kMaxDepthExceeded,
  kSchemaNotLoaded,
};

const char* ToString(FatalKind kind);

// Outcome of validating one instance.
//
// kOk carries zero or more ordinary errors (a failing-but-well-formed
// instance). kFatal means the engine could not finish and the run must stop;
// `errors` is empty in that case.
struct ValidationResult {
  enum class Status {
    kOk,
    kFatal,
  };

  Status status = Status::kOk;
  std::vector<ValidationError> errors;
  FatalKind fatal_kind = FatalKind::kMaxDepthExceeded;
  std::string fatal_detail;

  static ValidationResult Ok(std::vector<ValidationError> errors) {
    ValidationResult result;
    result.errors = std::move(errors);
    return result;
  }

  static ValidationResult Fatal(FatalKind kind, std::string detail) {
    ValidationResult result;
    result.status = Status::kFatal;
    result.fatal_kind = kind;
    result.fatal_detail = std::move(detail);
    return result;
  }

  bool IsFatal() const {
    return status == Status::kFatal;
  }
};

// Capability boundary between the driver and a schema language.
//
// Contract:
// - ParseSchema is called once with the schema document; on failure `error`
//   is populated with kind kShape or kForm.
// - CheckSchema runs after a successful ParseSchema; on failure `error.kind`
//   is kStructure.
// - Validate never mutates the loaded schema and may be called any number of
//   times; the same instance always produces the same result.
class IValidationEngine {
public:
  virtual ~IValidationEngine() = default;

  virtual bool ParseSchema(const core::json::Value& document, schema::SchemaError& error) = 0;

  virtual bool CheckSchema(schema::SchemaError& error) const = 0;

  virtual ValidationResult Validate(const core::json::Value& instance,
                                    const ValidationOptions& options) const = 0;
};

// JSON Typedef (RFC 8927) engine.
std::unique_ptr<IValidationEngine> CreateJtdEngine();

} // namespace jtdv::validation
