#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace jtdv::validation {

// Flag values exactly as they arrived on the command line.
struct RawOptions {
  std::optional<std::string> max_depth;
  std::optional<std::string> max_errors;
  bool quiet = false;
};

// Effective limits for every instance in a run. std::nullopt means unbounded.
struct ValidationOptions {
  std::optional<std::uint64_t> max_depth;
  std::optional<std::uint64_t> max_errors;
  bool quiet = false;
};

// Accepts plain decimal digits only: no sign, no whitespace, no overflow.
bool ParseNonNegativeInteger(std::string_view raw, std::uint64_t& value);

// Resolves raw flags into one immutable ValidationOptions.
//
// Precedence for max_errors:
//   explicit --max-errors N  => N (0 => unbounded)
//   absent, quiet            => 1
//   absent, not quiet        => unbounded
// max_depth has no coupling: absent or 0 => unbounded.
//
// Returns false with `error` naming the flag and raw value when a numeric flag
// does not parse.
bool ResolveValidationOptions(const RawOptions& raw, ValidationOptions& options,
                              std::string& error);

std::string DescribeLimit(const std::optional<std::uint64_t>& limit);

} // namespace jtdv::validation
