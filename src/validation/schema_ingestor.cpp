#include "validation/schema_ingestor.hpp"

#include "core/json_dom.hpp"
#include "schema/schema.hpp"

namespace jtdv::validation {

bool IngestSchema(std::istream& input, IValidationEngine& engine, SchemaIngestError& error) {
  core::json::Value document;
  std::string parse_error;
  switch (core::json::ParseDocument(input, document, parse_error)) {
  case core::json::StreamParser::Status::kValue:
    break;
  case core::json::StreamParser::Status::kReadError:
    error.kind = SchemaIngestError::Kind::kRead;
    error.message = "failed to read schema: " + parse_error;
    return false;
  case core::json::StreamParser::Status::kEnd:
  case core::json::StreamParser::Status::kError:
    error.kind = SchemaIngestError::Kind::kParse;
    error.message = std::string(schema::ToString(schema::SchemaErrorKind::kShape)) + ": " +
                    parse_error;
    return false;
  }

  schema::SchemaError schema_error;
  if (!engine.ParseSchema(document, schema_error)) {
    error.kind = SchemaIngestError::Kind::kParse;
    error.message =
        std::string(schema::ToString(schema_error.kind)) + ": " + schema::Describe(schema_error);
    return false;
  }

  if (!engine.CheckSchema(schema_error)) {
    error.kind = SchemaIngestError::Kind::kInvalid;
    error.message =
        std::string(schema::ToString(schema_error.kind)) + ": " + schema::Describe(schema_error);
    return false;
  }

  return true;
}

} // namespace jtdv::validation
