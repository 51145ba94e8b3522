#include "report/error_reporter.hpp"

#include "core/json_utils.hpp"
#include "report/json_pointer.hpp"

namespace jtdv::report {

ErrorIndicator ToErrorIndicator(const validation::ValidationError& error) {
  return ErrorIndicator{ToJsonPointer(error.instance_path), ToJsonPointer(error.schema_path)};
}

std::string ToJson(const ErrorIndicator& indicator) {
  std::string out;
  out.reserve(indicator.instance_path.size() + indicator.schema_path.size() + 34U);
  out += "{\"instancePath\":";
  core::AppendJsonString(out, indicator.instance_path);
  out += ",\"schemaPath\":";
  core::AppendJsonString(out, indicator.schema_path);
  out.push_back('}');
  return out;
}

void ErrorReporter::ReportInstance(const std::vector<validation::ValidationError>& errors) {
  if (errors.empty()) {
    return;
  }

  ++failed_instances_;
  if (quiet_) {
    return;
  }

  for (const auto& error : errors) {
    (*out_) << ToJson(ToErrorIndicator(error)) << '\n';
    ++indicators_written_;
  }
  out_->flush();
}

} // namespace jtdv::report
