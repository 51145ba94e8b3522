#pragma once

namespace jtdv::core::errors {

// Stable process-exit contract for CI and shell pipelines.
//
// 0 and 1 keep the meaning scripts expect from a validator:
// - 0 every instance matched the schema
// - 1 at least one instance produced a validation error
//
// Every other value is a fatal condition that stopped the run early. They are
// kept distinct so wrappers can tell a bad schema from bad input data without
// scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kInstanceInvalid = 1,
  kUsage = 2,
  kIoFailed = 3,
  kSchemaParseFailed = 10,
  kSchemaInvalid = 11,
  kInstanceParseFailed = 20,
  kMaxDepthExceeded = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace jtdv::core::errors
