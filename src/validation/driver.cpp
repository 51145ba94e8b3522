#include "validation/driver.hpp"

#include <utility>

namespace jtdv::validation {

namespace {

RunResult::Status ToRunStatus(FatalKind kind) {
  switch (kind) {
  case FatalKind::kMaxDepthExceeded:
    return RunResult::Status::kMaxDepthExceeded;
  case FatalKind::kSchemaNotLoaded:
    return RunResult::Status::kEngineFailed;
  }
  return RunResult::Status::kEngineFailed;
}

} // namespace

ValidationResult ValidateInstance(const IValidationEngine& engine,
                                  const core::json::Value& instance,
                                  const ValidationOptions& options) {
  return engine.Validate(instance, options);
}

RunResult RunValidation(const IValidationEngine& engine, instances::InstanceStream& stream,
                        const ValidationOptions& options, report::ErrorReporter& reporter,
                        core::logging::Logger& logger) {
  RunResult result;

  logger.Debug("validation started",
               {{"max_depth", DescribeLimit(options.max_depth)},
                {"max_errors", DescribeLimit(options.max_errors)},
                {"quiet", options.quiet ? "true" : "false"}});

  while (true) {
    core::json::Value instance;
    std::string error;
    const instances::InstanceStream::Status pulled = stream.Next(instance, error);
    if (pulled == instances::InstanceStream::Status::kEnd) {
      break;
    }
    if (pulled == instances::InstanceStream::Status::kError) {
      logger.Error("failed to parse instance", {{"error", error}});
      result.status = RunResult::Status::kInstanceParseFailed;
      result.failed = true;
      result.detail = "failed to parse instance: " + error;
      return result;
    }
    if (pulled == instances::InstanceStream::Status::kReadError) {
      logger.Error("failed to read instances", {{"error", error}});
      result.status = RunResult::Status::kReadFailed;
      result.failed = true;
      result.detail = "failed to read instances: " + error;
      return result;
    }

    ++result.instances_read;
    const std::string index = std::to_string(result.instances_read);

    ValidationResult validated = ValidateInstance(engine, instance, options);
    if (validated.IsFatal()) {
      logger.Error("failed to validate instance",
                   {{"instance", index}, {"reason", ToString(validated.fatal_kind)},
                    {"detail", validated.fatal_detail}});
      result.status = ToRunStatus(validated.fatal_kind);
      result.failed = true;
      result.detail =
          "failed to validate instance " + index + ": " + std::move(validated.fatal_detail);
      return result;
    }

    if (validated.errors.empty()) {
      logger.Debug("instance valid", {{"instance", index}});
      continue;
    }

    logger.Info("instance invalid",
                {{"instance", index}, {"error_count", std::to_string(validated.errors.size())}});
    ++result.instances_failed;
    result.failed = true;
    reporter.ReportInstance(validated.errors);
  }

  logger.Debug("validation finished",
               {{"instances", std::to_string(result.instances_read)},
                {"failed_instances", std::to_string(result.instances_failed)}});
  return result;
}

} // namespace jtdv::validation
