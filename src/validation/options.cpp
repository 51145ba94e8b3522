#include "validation/options.hpp"

#include <charconv>
#include <system_error>

namespace jtdv::validation {

namespace {

bool ResolveLimit(const std::optional<std::string>& raw, std::string_view flag,
                  std::optional<std::uint64_t>& limit, std::string& error) {
  limit.reset();
  if (!raw.has_value()) {
    return true;
  }

  std::uint64_t parsed = 0;
  if (!ParseNonNegativeInteger(*raw, parsed)) {
    error = "invalid value for " + std::string(flag) + ": '" + *raw +
            "' (expected a non-negative integer)";
    return false;
  }
  if (parsed != 0U) {
    limit = parsed;
  }
  return true;
}

} // namespace

bool ParseNonNegativeInteger(std::string_view raw, std::uint64_t& value) {
  if (raw.empty()) {
    return false;
  }
  // from_chars already rejects whitespace and '+', but accepts '-' for
  // unsigned targets on some standard libraries.
  if (raw.front() < '0' || raw.front() > '9') {
    return false;
  }

  std::uint64_t parsed = 0;
  const char* begin = raw.data();
  const char* end = raw.data() + raw.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return false;
  }

  value = parsed;
  return true;
}

bool ResolveValidationOptions(const RawOptions& raw, ValidationOptions& options,
                              std::string& error) {
  ValidationOptions resolved;
  resolved.quiet = raw.quiet;

  if (!ResolveLimit(raw.max_depth, "--max-depth", resolved.max_depth, error)) {
    return false;
  }

  if (raw.max_errors.has_value()) {
    if (!ResolveLimit(raw.max_errors, "--max-errors", resolved.max_errors, error)) {
      return false;
    }
  } else if (raw.quiet) {
    // Nothing is printed in quiet mode, so the first error decides the outcome.
    resolved.max_errors = 1U;
  }

  options = resolved;
  return true;
}

std::string DescribeLimit(const std::optional<std::uint64_t>& limit) {
  return limit.has_value() ? std::to_string(*limit) : std::string("unbounded");
}

} // namespace jtdv::validation
