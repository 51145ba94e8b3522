#pragma once

#include "validation/engine.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace jtdv::report {

// External form of one validation error: both paths as JSON Pointers.
struct ErrorIndicator {
  std::string instance_path;
  std::string schema_path;
};

ErrorIndicator ToErrorIndicator(const validation::ValidationError& error);

// Serializes as {"instancePath":"...","schemaPath":"..."} with no whitespace.
std::string ToJson(const ErrorIndicator& indicator);

// Output sink for per-instance validation results.
//
// Writes one indicator object per line (NDJSON) to `out` for every error of
// every failing instance, in the order instances are reported. In quiet mode
// nothing is written. Any instance with at least one error marks the run as
// failed, quiet or not. Never throws and never fails the run on its own.
class ErrorReporter {
public:
  ErrorReporter(std::ostream& out, bool quiet) : out_(&out), quiet_(quiet) {}

  void ReportInstance(const std::vector<validation::ValidationError>& errors);

  bool RunFailed() const {
    return failed_instances_ > 0U;
  }

  std::uint64_t FailedInstances() const {
    return failed_instances_;
  }

  std::uint64_t IndicatorsWritten() const {
    return indicators_written_;
  }

private:
  std::ostream* out_;
  bool quiet_ = false;
  std::uint64_t failed_instances_ = 0;
  std::uint64_t indicators_written_ = 0;
};

} // namespace jtdv::report
