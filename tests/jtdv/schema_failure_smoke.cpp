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
  const fs::path temp_root = CreateUniqueTempDir("jtdv-schema-failure");

  {
    const fs::path schema = WriteFixture(temp_root, "broken.json", R"({"type": )");
    const DispatchOutput out = DispatchCaptured({"jtd-validate", schema.string()}, R"("a")");
    AssertExitCode(out.exit_code, 10, "schema is not JSON");
    AssertContains(out.stderr_text, "error: failed to parse schema: parse error at byte");
    AssertEqual(out.stdout_text, "", "no indicators for a broken schema");
  }

  {
    const fs::path schema = WriteFixture(temp_root, "shape.json", R"({"type": "strin"})");
    const DispatchOutput out = DispatchCaptured({"jtd-validate", schema.string()}, R"("a")");
    AssertExitCode(out.exit_code, 10, "unknown type name");
    AssertContains(out.stderr_text, "unknown type 'strin'");
  }

  {
    const fs::path schema = WriteFixture(temp_root, "mixed.json", R"({"type": "string", "enum": ["a"]})");
    const DispatchOutput out = DispatchCaptured({"jtd-validate", schema.string()}, R"("a")");
    AssertExitCode(out.exit_code, 10, "mixed forms");
    AssertContains(out.stderr_text, "error: malformed schema:");
  }

  // Schema problems win over anything wrong with the instances.
  {
    const fs::path schema = WriteFixture(temp_root, "dangling.json", R"({"ref": "missing"})");
    const DispatchOutput malformed =
        DispatchCaptured({"jtd-validate", schema.string()}, R"({"oops": )");
    AssertExitCode(malformed.exit_code, 11, "dangling ref with malformed instances");
    AssertContains(malformed.stderr_text, "error: invalid schema: no such definition: 'missing'");

    const DispatchOutput empty = DispatchCaptured({"jtd-validate", schema.string()}, "");
    AssertExitCode(empty.exit_code, 11, "dangling ref with no instances");

    const DispatchOutput missing_instances = DispatchCaptured(
        {"jtd-validate", schema.string(), (temp_root / "absent.json").string()});
    AssertExitCode(missing_instances.exit_code, 11, "dangling ref with unopenable instances");
  }

  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", (temp_root / "no-such-schema.json").string()});
    AssertExitCode(out.exit_code, 3, "missing schema file");
    AssertContains(out.stderr_text, "error: failed to open schema: unable to open");
  }

  {
    const fs::path schema = WriteFixture(temp_root, "ok.json", "{}");
    const DispatchOutput out = DispatchCaptured(
        {"jtd-validate", schema.string(), (temp_root / "no-such-instances.json").string()});
    AssertExitCode(out.exit_code, 3, "missing instances file");
    AssertContains(out.stderr_text, "error: failed to open instances: unable to open");
  }

  // Directories open as streams but cannot be read; both sides report I/O.
  {
    const fs::path directory = temp_root / "a-directory";
    fs::create_directories(directory);

    const DispatchOutput as_schema = DispatchCaptured({"jtd-validate", directory.string()}, "1");
    AssertExitCode(as_schema.exit_code, 3, "directory as schema");
    AssertContains(as_schema.stderr_text, "error: failed to open schema: unable to open");
    AssertContains(as_schema.stderr_text, "is a directory");

    const fs::path schema = WriteFixture(temp_root, "any.json", "{}");
    const DispatchOutput as_instances =
        DispatchCaptured({"jtd-validate", schema.string(), directory.string()});
    AssertExitCode(as_instances.exit_code, 3, "directory as instances");
    AssertContains(as_instances.stderr_text, "error: failed to open instances: unable to open");
    AssertContains(as_instances.stderr_text, "is a directory");
    AssertEqual(as_instances.stdout_text, "", "no indicators for an unreadable source");
  }

  RemovePathBestEffort(temp_root);
  std::cout << "schema_failure_smoke: ok\n";
  return 0;
}
