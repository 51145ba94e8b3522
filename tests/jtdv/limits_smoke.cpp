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
  const fs::path temp_root = CreateUniqueTempDir("jtdv-limits");

  const fs::path triple = WriteFixture(temp_root, "triple.json", R"({
    "properties": {"a": {"type": "string"}, "b": {"type": "string"}, "c": {"type": "string"}}
  })");
  const fs::path chain = WriteFixture(temp_root, "chain.json", R"({
    "definitions": {"outer": {"ref": "inner"}, "inner": {"type": "string"}},
    "ref": "outer"
  })");

  {
    const DispatchOutput out = DispatchCaptured({"jtd-validate", "--max-errors", "1", triple.string()},
                                                R"({"a": 1, "b": 2, "c": 3})");
    AssertExitCode(out.exit_code, 1, "--max-errors 1");
    AssertEqual(out.stdout_text, "{\"instancePath\":\"/a\",\"schemaPath\":\"/properties/a/type\"}\n",
                "--max-errors 1 keeps the first error only");
  }

  {
    const DispatchOutput out = DispatchCaptured({"jtd-validate", "--max-errors=0", triple.string()},
                                                R"({"a": 1, "b": 2, "c": 3})");
    AssertExitCode(out.exit_code, 1, "--max-errors 0");
    AssertContains(out.stdout_text, "/properties/c/type");
  }

  // The chain follows two refs; a budget of one is fatal on the first instance
  // and nothing after it is validated.
  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", "--max-depth", "1", chain.string()}, R"("a" 1 2)");
    AssertExitCode(out.exit_code, 30, "--max-depth 1");
    AssertEqual(out.stdout_text, "", "no indicators after a depth failure");
    AssertContains(out.stderr_text,
                   "error: failed to validate instance 1: max depth of 1 exceeded while "
                   "following ref 'inner'");
  }

  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", "--max-depth", "2", chain.string()}, R"("a" 1)");
    AssertExitCode(out.exit_code, 1, "--max-depth 2");
    AssertEqual(out.stdout_text,
                "{\"instancePath\":\"\",\"schemaPath\":\"/definitions/inner/type\"}\n",
                "ref errors report the definition path");
  }

  // Indicators already written stay written when a later instance is malformed.
  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", chain.string()}, R"(1 "a" {"x": )");
    AssertExitCode(out.exit_code, 20, "malformed third instance");
    AssertEqual(out.stdout_text,
                "{\"instancePath\":\"\",\"schemaPath\":\"/definitions/inner/type\"}\n",
                "output before the parse failure");
    AssertContains(out.stderr_text, "error: failed to parse instance: instance 3:");
  }

  RemovePathBestEffort(temp_root);
  std::cout << "limits_smoke: ok\n";
  return 0;
}
