#pragma once

#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "instances/instance_stream.hpp"
#include "report/error_reporter.hpp"
#include "validation/engine.hpp"
#include "validation/options.hpp"

#include <cstdint>
#include <string>

namespace jtdv::validation {

// Validates a single instance against the engine's loaded schema.
ValidationResult ValidateInstance(const IValidationEngine& engine,
                                  const core::json::Value& instance,
                                  const ValidationOptions& options);

struct RunResult {
  enum class Status {
    // Stream fully consumed. `failed` tells whether any instance had errors.
    kCompleted,
    kInstanceParseFailed,
    kReadFailed,
    kMaxDepthExceeded,
    kEngineFailed,
  };

  Status status = Status::kCompleted;
  bool failed = false;
  std::uint64_t instances_read = 0;
  std::uint64_t instances_failed = 0;
  // Human-readable cause for every status other than kCompleted.
  std::string detail;

  bool Clean() const {
    return status == Status::kCompleted && !failed;
  }
};

// Drives the instance loop: pull, validate, report, repeat.
//
// Instances are processed strictly one at a time in stream order; each
// instance's errors reach `reporter` before the next instance is parsed. The
// first fatal condition (parse failure or engine fatal) ends the run
// immediately with the matching status; ordinary validation errors never do.
RunResult RunValidation(const IValidationEngine& engine, instances::InstanceStream& stream,
                        const ValidationOptions& options, report::ErrorReporter& reporter,
                        core::logging::Logger& logger);

} // namespace jtdv::validation
