#include "jtdv/cli/router.hpp"

#include "core/errors/exit_codes.hpp"
#include "instances/instance_stream.hpp"
#include "report/error_reporter.hpp"
#include "validation/driver.hpp"
#include "validation/engine.hpp"
#include "validation/schema_ingestor.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace jtdv::cli {

namespace {

constexpr std::string_view kVersion = "0.1.0";
constexpr std::string_view kStdinLabel = "<stdin>";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitInstanceInvalid = core::errors::ToInt(core::errors::ExitCode::kInstanceInvalid);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitIoFailed = core::errors::ToInt(core::errors::ExitCode::kIoFailed);
constexpr int kExitSchemaParseFailed =
    core::errors::ToInt(core::errors::ExitCode::kSchemaParseFailed);
constexpr int kExitSchemaInvalid = core::errors::ToInt(core::errors::ExitCode::kSchemaInvalid);
constexpr int kExitInstanceParseFailed =
    core::errors::ToInt(core::errors::ExitCode::kInstanceParseFailed);
constexpr int kExitMaxDepthExceeded =
    core::errors::ToInt(core::errors::ExitCode::kMaxDepthExceeded);

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  jtd-validate [options] <schema> [instances]\n"
      << "\n"
      << "Validates a stream of JSON instances against a JSON Typedef schema.\n"
      << "Use '-' to read the schema or the instances from standard input (not both).\n"
      << "Instances default to standard input.\n"
      << "\n"
      << "options:\n"
      << "  -q, --quiet              print no error indicators (implies --max-errors 1)\n"
      << "      --max-depth <N>      max refs followed at once (0 = unbounded, default)\n"
      << "      --max-errors <N>     max errors reported per instance (0 = unbounded)\n"
      << "      --log-level <level>  debug|info|warn|error (default: warn)\n"
      << "  -h, --help               print this help\n"
      << "  -V, --version            print the version\n";
}

bool IsStdin(std::string_view source) {
  return source == kStdinSource;
}

std::string SourceLabel(std::string_view source) {
  return IsStdin(source) ? std::string(kStdinLabel) : std::string(source);
}

// Splits `--flag=value` into its parts; leaves `value` empty for bare flags.
bool SplitInlineValue(std::string_view token, std::string_view& flag, std::string_view& value) {
  const std::size_t equals = token.find('=');
  if (equals == std::string_view::npos || token.rfind("--", 0) != 0U) {
    flag = token;
    value = {};
    return false;
  }
  flag = token.substr(0, equals);
  value = token.substr(equals + 1U);
  return true;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view flag,
               bool has_inline, std::string_view inline_value, std::string& value,
               std::string& error) {
  if (has_inline) {
    value = std::string(inline_value);
    return true;
  }
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = std::string(args[i + 1]);
  ++i;
  return true;
}

// Owns whichever stream a source name resolves to. std::cin is borrowed,
// files are opened here and closed when the holder goes out of scope.
class InputSource {
public:
  bool Open(std::string_view source, std::string& error) {
    if (IsStdin(source)) {
      stream_ = &std::cin;
      return true;
    }

    std::error_code ec;
    if (std::filesystem::is_directory(std::filesystem::path(source), ec)) {
      error = "unable to open '" + std::string(source) + "': is a directory";
      return false;
    }

    file_ = std::make_unique<std::ifstream>(std::string(source), std::ios::binary);
    if (!*file_) {
      error = "unable to open '" + std::string(source) + "'";
      return false;
    }
    stream_ = file_.get();
    return true;
  }

  std::istream& Stream() {
    return *stream_;
  }

private:
  std::unique_ptr<std::ifstream> file_;
  std::istream* stream_ = nullptr;
};

int ToExitCode(const validation::RunResult& result) {
  switch (result.status) {
  case validation::RunResult::Status::kCompleted:
    return result.failed ? kExitInstanceInvalid : kExitSuccess;
  case validation::RunResult::Status::kInstanceParseFailed:
    return kExitInstanceParseFailed;
  case validation::RunResult::Status::kReadFailed:
    return kExitIoFailed;
  case validation::RunResult::Status::kMaxDepthExceeded:
    return kExitMaxDepthExceeded;
  case validation::RunResult::Status::kEngineFailed:
    return kExitSchemaInvalid;
  }
  return kExitInstanceInvalid;
}

int ToExitCode(validation::SchemaIngestError::Kind kind) {
  switch (kind) {
  case validation::SchemaIngestError::Kind::kParse:
    return kExitSchemaParseFailed;
  case validation::SchemaIngestError::Kind::kInvalid:
    return kExitSchemaInvalid;
  case validation::SchemaIngestError::Kind::kRead:
    return kExitIoFailed;
  }
  return kExitSchemaParseFailed;
}

int CommandValidate(const CliOptions& options) {
  validation::ValidationOptions limits;
  std::string error;
  if (!validation::ResolveValidationOptions(options.raw_limits, limits, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  const std::string instances_source =
      options.instances_source.value_or(std::string(kStdinSource));
  if (IsStdin(options.schema_source) && IsStdin(instances_source)) {
    std::cerr << "error: schema and instances cannot both be read from standard input; "
                 "pass an instances file when the schema is '-'\n";
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);

  logger.SetSource(SourceLabel(options.schema_source));
  InputSource schema_input;
  if (!schema_input.Open(options.schema_source, error)) {
    logger.Error("schema source unavailable", {{"error", error}});
    std::cerr << "error: failed to open schema: " << error << '\n';
    return kExitIoFailed;
  }

  std::unique_ptr<validation::IValidationEngine> engine = validation::CreateJtdEngine();
  validation::SchemaIngestError ingest_error;
  if (!validation::IngestSchema(schema_input.Stream(), *engine, ingest_error)) {
    logger.Error("schema rejected", {{"error", ingest_error.message}});
    std::cerr << "error: " << ingest_error.message << '\n';
    return ToExitCode(ingest_error.kind);
  }
  logger.Debug("schema loaded");

  logger.SetSource(SourceLabel(instances_source));
  InputSource instances_input;
  if (!instances_input.Open(instances_source, error)) {
    logger.Error("instances source unavailable", {{"error", error}});
    std::cerr << "error: failed to open instances: " << error << '\n';
    return kExitIoFailed;
  }

  instances::InstanceStream stream(instances_input.Stream());
  report::ErrorReporter reporter(std::cout, limits.quiet);
  const validation::RunResult result =
      validation::RunValidation(*engine, stream, limits, reporter, logger);

  if (result.status != validation::RunResult::Status::kCompleted) {
    std::cerr << "error: " << result.detail << '\n';
  }

  logger.Info("run finished", {{"instances", std::to_string(result.instances_read)},
                               {"failed_instances", std::to_string(result.instances_failed)}});
  return ToExitCode(result);
}

} // namespace

bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error) {
  std::vector<std::string> positionals;
  bool options_ended = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];

    if (options_ended || token == kStdinSource || token.empty() || token.front() != '-') {
      positionals.emplace_back(token);
      continue;
    }
    if (token == "--") {
      options_ended = true;
      continue;
    }

    std::string_view flag;
    std::string_view inline_value;
    const bool has_inline = SplitInlineValue(token, flag, inline_value);

    if (flag == "-q" || flag == "--quiet") {
      if (has_inline) {
        error = "--quiet does not take a value";
        return false;
      }
      options.raw_limits.quiet = true;
      continue;
    }
    if (flag == "-h" || flag == "--help") {
      options.show_help = true;
      continue;
    }
    if (flag == "-V" || flag == "--version") {
      options.show_version = true;
      continue;
    }
    if (flag == "--max-depth") {
      std::string value;
      if (!TakeValue(args, i, flag, has_inline, inline_value, value, error)) {
        return false;
      }
      options.raw_limits.max_depth = std::move(value);
      continue;
    }
    if (flag == "--max-errors") {
      std::string value;
      if (!TakeValue(args, i, flag, has_inline, inline_value, value, error)) {
        return false;
      }
      options.raw_limits.max_errors = std::move(value);
      continue;
    }
    if (flag == "--log-level") {
      std::string value;
      if (!TakeValue(args, i, flag, has_inline, inline_value, value, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }

    error = "unknown option: " + std::string(token);
    return false;
  }

  if (options.show_help || options.show_version) {
    return true;
  }

  if (positionals.empty()) {
    error = "missing required argument: <schema>";
    return false;
  }
  if (positionals.size() > 2U) {
    error = "too many arguments: expected <schema> [instances]";
    return false;
  }

  options.schema_source = positionals[0];
  if (positionals.size() == 2U) {
    options.instances_source = positionals[1];
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  const std::vector<std::string_view> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  CliOptions options;
  std::string error;
  if (!ParseCliOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  if (options.show_help) {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (options.show_version) {
    std::cout << "jtd-validate " << kVersion << '\n';
    return kExitSuccess;
  }

  return CommandValidate(options);
}

} // namespace jtdv::cli
