#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

using jtdv::tests::common::AssertEqual;
using jtdv::tests::common::AssertExitCode;
using jtdv::tests::common::CreateUniqueTempDir;
using jtdv::tests::common::DispatchCaptured;
using jtdv::tests::common::DispatchOutput;
using jtdv::tests::common::RemovePathBestEffort;
using jtdv::tests::common::WriteFixture;

int main() {
  const fs::path temp_root = CreateUniqueTempDir("jtdv-quiet-mode");
  const fs::path schema = WriteFixture(temp_root, "schema.json", R"({"values": {"type": "uint8"}})");

  {
    const DispatchOutput out = DispatchCaptured({"jtd-validate", "--quiet", schema.string()},
                                                R"({"a": 1} {"a": -1, "b": 300})");
    AssertExitCode(out.exit_code, 1, "quiet failing run");
    AssertEqual(out.stdout_text, "", "quiet prints no indicators");
  }

  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", "-q", schema.string()}, R"({"a": 1} {"b": 2})");
    AssertExitCode(out.exit_code, 0, "quiet passing run");
    AssertEqual(out.stdout_text, "", "quiet passing output");
  }

  // Quiet still honours an explicit error budget and exit status.
  {
    const DispatchOutput out = DispatchCaptured(
        {"jtd-validate", "-q", "--max-errors", "5", schema.string()}, R"({"a": "x"})");
    AssertExitCode(out.exit_code, 1, "quiet with explicit --max-errors");
    AssertEqual(out.stdout_text, "", "quiet with explicit --max-errors output");
  }

  RemovePathBestEffort(temp_root);
  std::cout << "quiet_mode_smoke: ok\n";
  return 0;
}
