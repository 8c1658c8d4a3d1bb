#include "../common/assertions.hpp"
#include "../common/capture_fixtures.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "core/json_utils.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

using dscapture::tests::common::AssertContains;
using dscapture::tests::common::AssertEqual;
using dscapture::tests::common::AssertTrue;
using dscapture::tests::common::CaptureTree;
using dscapture::tests::common::DispatchCaptured;
using dscapture::tests::common::DispatchOutput;
using dscapture::tests::common::WriteFile;

std::string SectionJson(const dscapture::params::ParamSet& params) {
  std::string json = "{";
  bool first = true;
  for (const std::string& key : params.Keys()) {
    if (!first) {
      json += ",";
    }
    first = false;
    json += dscapture::core::QuoteJson(key) + ":" + dscapture::core::QuoteJson(params.GetString(key));
  }
  return json + "}";
}

fs::path WriteParams(const fs::path& path, const dscapture::params::CaptureParams& params) {
  WriteFile(path, "{\"task\":" + SectionJson(params.task) +
                      ",\"manager\":" + SectionJson(params.manager) + "}\n");
  return path;
}

void AssertInformationalCommands() {
  const DispatchOutput version = DispatchCaptured({"dscapture", "version"});
  AssertTrue(version.exit_code == 0, "version should succeed");
  AssertEqual(version.stdout_text, "dscapture 0.1.0\n", "version text");

  const DispatchOutput help = DispatchCaptured({"dscapture", "--help"});
  AssertTrue(help.exit_code == 0, "help should succeed");
  AssertContains(help.stdout_text, "dscapture capture <params.json>");

  const DispatchOutput unknown = DispatchCaptured({"dscapture", "archive"});
  AssertTrue(unknown.exit_code == 2, "unknown subcommand is a usage error");
  AssertContains(unknown.stderr_text, "error: unknown subcommand: archive");

  const DispatchOutput bare = DispatchCaptured({"dscapture"});
  AssertTrue(bare.exit_code == 2, "missing subcommand is a usage error");
}

void AssertCheckParams(const CaptureTree& tree) {
  const fs::path valid = WriteParams(
      tree.root / "valid.json",
      dscapture::tests::common::MakeCaptureParams(tree, "QC_Shew_10", "LTQ_FT"));
  const DispatchOutput ok = DispatchCaptured({"dscapture", "check-params", valid.string()});
  AssertTrue(ok.exit_code == 0, "valid params should pass: " + ok.stderr_text);
  AssertContains(ok.stdout_text, "(dataset QC_Shew_10, LTQ_FT)");

  const fs::path nested = tree.root / "nested.json";
  WriteFile(nested, R"({"task":{"Dataset":{"name":"x"}}})");
  const DispatchOutput bad = DispatchCaptured({"dscapture", "check-params", nested.string()});
  AssertTrue(bad.exit_code == 10, "nested values are invalid params");
  AssertContains(bad.stderr_text, "parameter 'task.Dataset' must be a string, number, or boolean");

  const fs::path spaced = WriteParams(
      tree.root / "spaced.json",
      dscapture::tests::common::MakeCaptureParams(tree, "QC Shew", "LTQ_FT"));
  const DispatchOutput space = DispatchCaptured({"dscapture", "check-params", spaced.string()});
  AssertTrue(space.exit_code == 10, "dataset names with spaces are invalid params");
  AssertContains(space.stderr_text, "Dataset name contains a space");

  const DispatchOutput missing =
      DispatchCaptured({"dscapture", "check-params", (tree.root / "absent.json").string()});
  AssertTrue(missing.exit_code == 10, "missing params file");
  AssertContains(missing.stderr_text, "params file not found");
}

void AssertCaptureWritesResult(const CaptureTree& tree) {
  WriteFile(tree.source_dir() / "QC_Shew_11.raw", "spectra");
  const fs::path params = WriteParams(
      tree.root / "capture.json",
      dscapture::tests::common::MakeCaptureParams(tree, "QC_Shew_11", "LTQ_FT"));
  const fs::path result_path = tree.root / "out" / "result.json";

  const DispatchOutput captured =
      DispatchCaptured({"dscapture", "capture", params.string(), "--log-level", "warn", "--result",
                        result_path.string()});
  AssertTrue(captured.exit_code == 0, "capture should succeed: " + captured.stdout_text);
  AssertContains(captured.stdout_text, "closeout=CLOSEOUT_SUCCESS retry=RETRY_NOT_NEEDED");
  dscapture::tests::common::AssertExists(tree.dataset_dir("QC_Shew_11") / "QC_Shew_11.raw");

  const std::string json = dscapture::tests::common::ReadFileToString(result_path);
  AssertContains(json, "\"closeout\":\"CLOSEOUT_SUCCESS\"");
  AssertContains(json, "\"closeout_code\":0");

  const fs::path missing_params = WriteParams(
      tree.root / "missing.json",
      dscapture::tests::common::MakeCaptureParams(tree, "QC_Shew_12", "LTQ_FT"));
  const DispatchOutput failed = DispatchCaptured({"dscapture", "capture", missing_params.string()});
  AssertTrue(failed.exit_code == 1, "missing source data fails the job");
  AssertContains(failed.stdout_text, "closeout=CLOSEOUT_FAILED");

  const DispatchOutput bad_level = DispatchCaptured(
      {"dscapture", "capture", params.string(), "--log-level", "chatty"});
  AssertTrue(bad_level.exit_code == 2, "bad log level is a usage error");
}

} // namespace

int main() {
  CaptureTree tree;
  tree.root = dscapture::tests::common::CreateUniqueTempDir("dscapture-cli");
  fs::create_directories(tree.source_dir());

  AssertInformationalCommands();
  AssertCheckParams(tree);
  AssertCaptureWritesResult(tree);

  dscapture::tests::common::RemovePathBestEffort(tree.root);
  return 0;
}
