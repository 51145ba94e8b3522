#pragma once

#include "schema/schema.hpp"
#include "validation/engine.hpp"

namespace jtdv::validation {

// RFC 8927 JSON Typedef implementation of the engine contract.
//
// Errors are produced depth-first, object members in key order, so output is
// stable across runs. Following a `ref` starts a fresh schema path at
// /definitions/<name>; each ref counts one level against max_depth.
class JtdEngine final : public IValidationEngine {
public:
  JtdEngine() = default;

  bool ParseSchema(const core::json::Value& document, schema::SchemaError& error) override;

  bool CheckSchema(schema::SchemaError& error) const override;

  ValidationResult Validate(const core::json::Value& instance,
                            const ValidationOptions& options) const override;

private:
  schema::Schema root_;
  bool loaded_ = false;
};

} // namespace jtdv::validation
