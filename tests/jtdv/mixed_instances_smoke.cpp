#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

using jtdv::tests::common::AssertEqual;
using jtdv::tests::common::AssertExitCode;
using jtdv::tests::common::CreateUniqueTempDir;
using jtdv::tests::common::DispatchCaptured;
using jtdv::tests::common::DispatchOutput;
using jtdv::tests::common::RemovePathBestEffort;
using jtdv::tests::common::WriteFixture;

int main() {
  const fs::path temp_root = CreateUniqueTempDir("jtdv-mixed-instances");
  const fs::path schema = WriteFixture(temp_root, "schema.json", R"({"type": "string"})");

  // Three instances on stdin with no separators needed between documents.
  {
    const DispatchOutput out =
        DispatchCaptured({"jtd-validate", schema.string()}, R"("abc" 123 "def")");
    AssertExitCode(out.exit_code, 1, "one failing instance");
    AssertEqual(out.stdout_text, "{\"instancePath\":\"\",\"schemaPath\":\"/type\"}\n",
                "indicator for the failing instance");
  }

  {
    const fs::path instances = WriteFixture(temp_root, "valid.json", "\"a\"\n\"b\"\n");
    const DispatchOutput out = DispatchCaptured({"jtd-validate", schema.string(), instances.string()});
    AssertExitCode(out.exit_code, 0, "all instances valid");
    AssertEqual(out.stdout_text, "", "no indicators for valid instances");
    AssertEqual(out.stderr_text, "", "default log level stays quiet on success");
  }

  // Indicators keep instance order and per-instance error order.
  {
    const fs::path person = WriteFixture(temp_root, "person.json", R"({
      "properties": {"name": {"type": "string"}, "tags": {"elements": {"type": "string"}}}
    })");
    const fs::path instances = WriteFixture(
        temp_root, "people.json",
        R"({"name": 1, "tags": ["x", 2]} {"name": "ok", "tags": []} {"tags": [], "extra": true})");
    const DispatchOutput out = DispatchCaptured({"jtd-validate", person.string(), instances.string()});
    AssertExitCode(out.exit_code, 1, "people");
    AssertEqual(out.stdout_text,
                "{\"instancePath\":\"/name\",\"schemaPath\":\"/properties/name/type\"}\n"
                "{\"instancePath\":\"/tags/1\",\"schemaPath\":\"/properties/tags/elements/type\"}\n"
                "{\"instancePath\":\"\",\"schemaPath\":\"/properties/name\"}\n"
                "{\"instancePath\":\"/extra\",\"schemaPath\":\"\"}\n",
                "people indicators");
  }

  {
    const DispatchOutput out = DispatchCaptured({"jtd-validate", schema.string()}, "");
    AssertExitCode(out.exit_code, 0, "empty instance stream");
    AssertEqual(out.stdout_text, "", "empty stream output");
  }

  // Identical schema and input give byte-identical output and exit status,
  // including member order for several errors within one object.
  {
    const fs::path record = WriteFixture(temp_root, "record.json", R"({
      "properties": {"zeta": {"type": "int8"}, "alpha": {"type": "int8"}},
      "optionalProperties": {"mid": {"values": {"type": "boolean"}}}
    })");
    const std::string input =
        R"({"zeta": "x", "mid": {"q": 1, "b": 2}, "alpha": 1000, "extra": null, "aaa": 0} {"zeta": 1})";

    const DispatchOutput first = DispatchCaptured({"jtd-validate", record.string()}, input);
    const DispatchOutput second = DispatchCaptured({"jtd-validate", record.string()}, input);
    AssertExitCode(first.exit_code, 1, "first run");
    AssertExitCode(second.exit_code, first.exit_code, "repeated run");
    AssertEqual(second.stdout_text, first.stdout_text, "repeated run output");
    AssertEqual(first.stdout_text,
                "{\"instancePath\":\"/alpha\",\"schemaPath\":\"/properties/alpha/type\"}\n"
                "{\"instancePath\":\"/zeta\",\"schemaPath\":\"/properties/zeta/type\"}\n"
                "{\"instancePath\":\"/mid/b\",\"schemaPath\":\"/optionalProperties/mid/values/type\"}\n"
                "{\"instancePath\":\"/mid/q\",\"schemaPath\":\"/optionalProperties/mid/values/type\"}\n"
                "{\"instancePath\":\"/aaa\",\"schemaPath\":\"\"}\n"
                "{\"instancePath\":\"/extra\",\"schemaPath\":\"\"}\n"
                "{\"instancePath\":\"\",\"schemaPath\":\"/properties/alpha\"}\n",
                "error order within an instance");
  }

  RemovePathBestEffort(temp_root);
  std::cout << "mixed_instances_smoke: ok\n";
  return 0;
}
