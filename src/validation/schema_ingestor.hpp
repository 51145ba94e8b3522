#pragma once

#include "validation/engine.hpp"

#include <istream>
#include <string>

namespace jtdv::validation {

struct SchemaIngestError {
  enum class Kind {
    // Malformed JSON, wrong document shape or illegal keyword combination.
    kParse,
    // Well-formed schema that fails the structural check.
    kInvalid,
    // The source could not be read.
    kRead,
  };

  Kind kind = Kind::kParse;
  std::string message;
};

// Reads exactly one JSON document from `input`, hands it to `engine` and runs
// the engine's structural check.
//
// Contract:
// - Returns true only when the engine holds a schema that passed
//   CheckSchema; the caller may then validate instances.
// - On failure `error.message` is one human-readable line that names the
//   stage ("failed to read schema", "failed to parse schema",
//   "malformed schema", "invalid schema").
bool IngestSchema(std::istream& input, IValidationEngine& engine, SchemaIngestError& error);

} // namespace jtdv::validation
