#pragma once

#include "core/logging/logger.hpp"
#include "validation/options.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jtdv::cli {

// Source name that selects standard input.
inline constexpr std::string_view kStdinSource = "-";

// Command-line surface after tokenizing, before any numeric resolution or I/O.
struct CliOptions {
  std::string schema_source;
  // Absent => standard input.
  std::optional<std::string> instances_source;
  validation::RawOptions raw_limits;
  core::logging::LogLevel log_level = core::logging::LogLevel::kWarn;
  bool show_help = false;
  bool show_version = false;
};

// Tokenizes `args` (argv without the program name).
//
// Accepts flags before, between or after the positionals, `--flag value` and
// `--flag=value` spellings, and `--` to end option parsing. Returns false with
// `error` set on unknown flags, missing flag values or a wrong positional
// count. Numeric flag values are kept raw; they are resolved later.
bool ParseCliOptions(const std::vector<std::string_view>& args, CliOptions& options,
                     std::string& error);

// Runs `jtd-validate` end to end and returns the process exit code. See
// core/errors/exit_codes.hpp for the stable contract:
//   0 => every instance valid
//   1 => at least one instance had validation errors
//   2 => usage error or invalid option value
//   3 => a source could not be opened or read
//   10/11 => schema failed to parse / is invalid
//   20 => an instance failed to parse
//   30 => max depth exceeded while following refs
int Dispatch(int argc, char** argv);

} // namespace jtdv::cli
