#include "validation/options.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>

using jtdv::validation::ParseNonNegativeInteger;
using jtdv::validation::RawOptions;
using jtdv::validation::ResolveValidationOptions;
using jtdv::validation::ValidationOptions;

TEST_CASE("Defaults resolve to unbounded limits", "[validation][options]") {
  ValidationOptions options;
  std::string error;
  REQUIRE(ResolveValidationOptions(RawOptions{}, options, error));
  REQUIRE_FALSE(options.max_depth.has_value());
  REQUIRE_FALSE(options.max_errors.has_value());
  REQUIRE_FALSE(options.quiet);
}

TEST_CASE("Quiet implies one error when max-errors is absent", "[validation][options]") {
  RawOptions raw;
  raw.quiet = true;

  ValidationOptions options;
  std::string error;
  REQUIRE(ResolveValidationOptions(raw, options, error));
  REQUIRE(options.quiet);
  REQUIRE(options.max_errors == std::uint64_t{1});
  REQUIRE_FALSE(options.max_depth.has_value());
}

TEST_CASE("Explicit max-errors wins over quiet", "[validation][options]") {
  RawOptions raw;
  raw.quiet = true;
  raw.max_errors = "5";

  ValidationOptions options;
  std::string error;
  REQUIRE(ResolveValidationOptions(raw, options, error));
  REQUIRE(options.max_errors == std::uint64_t{5});

  raw.max_errors = "0";
  REQUIRE(ResolveValidationOptions(raw, options, error));
  REQUIRE_FALSE(options.max_errors.has_value());
}

TEST_CASE("Zero max-depth means unbounded", "[validation][options]") {
  RawOptions raw;
  raw.max_depth = "0";

  ValidationOptions options;
  std::string error;
  REQUIRE(ResolveValidationOptions(raw, options, error));
  REQUIRE_FALSE(options.max_depth.has_value());

  raw.max_depth = "32";
  REQUIRE(ResolveValidationOptions(raw, options, error));
  REQUIRE(options.max_depth == std::uint64_t{32});
}

TEST_CASE("Invalid numeric values name the flag and raw value", "[validation][options]") {
  ValidationOptions options;
  std::string error;

  RawOptions raw;
  raw.max_depth = "ten";
  REQUIRE_FALSE(ResolveValidationOptions(raw, options, error));
  REQUIRE(error.find("--max-depth") != std::string::npos);
  REQUIRE(error.find("'ten'") != std::string::npos);

  raw = RawOptions{};
  raw.max_errors = "-1";
  REQUIRE_FALSE(ResolveValidationOptions(raw, options, error));
  REQUIRE(error.find("--max-errors") != std::string::npos);
  REQUIRE(error.find("'-1'") != std::string::npos);
}

TEST_CASE("Non-negative integer parsing is strict", "[validation][options]") {
  std::uint64_t value = 0;
  REQUIRE(ParseNonNegativeInteger("0", value));
  REQUIRE(value == 0U);
  REQUIRE(ParseNonNegativeInteger("18446744073709551615", value));
  REQUIRE(value == UINT64_MAX);

  REQUIRE_FALSE(ParseNonNegativeInteger("", value));
  REQUIRE_FALSE(ParseNonNegativeInteger("+1", value));
  REQUIRE_FALSE(ParseNonNegativeInteger("-1", value));
  REQUIRE_FALSE(ParseNonNegativeInteger(" 1", value));
  REQUIRE_FALSE(ParseNonNegativeInteger("1 ", value));
  REQUIRE_FALSE(ParseNonNegativeInteger("1.5", value));
  REQUIRE_FALSE(ParseNonNegativeInteger("18446744073709551616", value));
}
