#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

using jtdv::tests::common::AssertContains;
using jtdv::tests::common::AssertEqual;
using jtdv::tests::common::AssertExitCode;
using jtdv::tests::common::CreateUniqueTempDir;
using jtdv::tests::common::DispatchCaptured;
using jtdv::tests::common::DispatchOutput;
using jtdv::tests::common::RemovePathBestEffort;
using jtdv::tests::common::WriteFixture;

int main() {
  const fs::path temp_root = CreateUniqueTempDir("jtdv-stdin-sources");
  const fs::path schema = WriteFixture(temp_root, "schema.json", R"({"enum": ["on", "off"]})");
  const fs::path instances = WriteFixture(temp_root, "instances.json", R"("on" "dim" "off")");

  const std::string expected = "{\"instancePath\":\"\",\"schemaPath\":\"/enum\"}\n";

  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", schema.string(), instances.string()});
    AssertExitCode(out.exit_code, 1, "both sources from files");
    AssertEqual(out.stdout_text, expected, "file sources");
  }

  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", schema.string()}, R"("on" "dim" "off")");
    AssertExitCode(out.exit_code, 1, "instances default to stdin");
    AssertEqual(out.stdout_text, expected, "default stdin instances");
  }

  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", schema.string(), "-"}, R"("on" "dim" "off")");
    AssertExitCode(out.exit_code, 1, "explicit '-' for instances");
    AssertEqual(out.stdout_text, expected, "explicit stdin instances");
  }

  {
    const DispatchOutput out = DispatchCaptured({"jtd-validate", "-", instances.string()},
                                                R"({"enum": ["on", "off"]})");
    AssertExitCode(out.exit_code, 1, "schema from stdin");
    AssertEqual(out.stdout_text, expected, "stdin schema");
  }

  {
    const DispatchOutput out = DispatchCaptured({"jtd-validate", "-"}, R"({} "a")");
    AssertExitCode(out.exit_code, 2, "schema and instances both on stdin");
    AssertContains(out.stderr_text, "cannot both be read from standard input");
  }

  {
    const DispatchOutput out = DispatchCaptured({"jtd-validate", "-", "-"}, "{}");
    AssertExitCode(out.exit_code, 2, "'-' given twice");
  }

  // `--` ends option parsing; everything after it is positional.
  {
    const fs::path dashed = WriteFixture(temp_root, "-dashed.json", R"("on")");
    const DispatchOutput out = DispatchCaptured(
        {"jtd-validate", "--log-level=debug", "--", schema.string(), dashed.string()});
    AssertExitCode(out.exit_code, 0, "-- ends option parsing");
    AssertContains(out.stderr_text, "level=DEBUG");
    AssertContains(out.stderr_text, "msg=\"schema loaded\"");
  }

  RemovePathBestEffort(temp_root);
  std::cout << "stdin_sources_smoke: ok\n";
  return 0;
}
