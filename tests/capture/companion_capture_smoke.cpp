#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "capture/companion_capture.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using dscapture::tests::common::AssertEqual;
using dscapture::tests::common::AssertExists;
using dscapture::tests::common::AssertMissing;
using dscapture::tests::common::AssertTrue;
using dscapture::tests::common::WriteFile;

// Mid-February 2012, local time.
std::chrono::system_clock::time_point FebruaryNoon2012() {
  std::tm local{};
  local.tm_year = 2012 - 1900;
  local.tm_mon = 1;
  local.tm_mday = 15;
  local.tm_hour = 12;
  local.tm_isdst = -1;
  return std::chrono::system_clock::from_time_t(std::mktime(&local));
}

void AssertSearchOrder() {
  const std::vector<std::string> names =
      dscapture::capture::MethodSearchDirectories("DS_X", FebruaryNoon2012());
  AssertTrue(names.size() == 4U, "dataset plus three quarters back to 2011_3");
  AssertEqual(names[0], "DS_X", "dataset directory first");
  AssertEqual(names[1], "2012_1", "current quarter");
  AssertEqual(names[3], "2011_3", "oldest quarter");

  AssertTrue(dscapture::capture::HasMethodTimestamp(
                 "Cheetah_01.04.2012_08.46.17_DS_X_Cheetah_11-09-32.lcmethod"),
             "timestamped method name");
  AssertTrue(!dscapture::capture::HasMethodTimestamp("Plain_DS_X.lcmethod"),
             "plain method name");
}

void AssertDatasetMethodsAreCapturedAndRetired(dscapture::core::logging::Logger& logger,
                                               const fs::path& root) {
  const fs::path methods = root / "MethodFiles";
  const std::string method_name = "Cheetah_01.04.2012_08.46.17_DS_X.lcmethod";
  WriteFile(methods / "DS_X" / method_name, "method");
  const fs::path dataset_dir = root / "storage" / "DS_X";
  fs::create_directories(dataset_dir);

  dscapture::capture::CompanionCaptureSettings settings;
  settings.method_files_dir = methods.string();
  settings.host_name = "worker07";
  dscapture::capture::CompanionCapture companion(logger, settings);
  companion.set_clock(FebruaryNoon2012());

  const dscapture::capture::CompanionCaptureResult result = companion.Capture("DS_X", dataset_dir);
  AssertTrue(result.success, "capture should succeed");
  AssertTrue(result.copied_files.size() == 1U, "one method file copied");
  AssertExists(dataset_dir / method_name);
  AssertExists(methods / "x_DS_X" / method_name);
  AssertMissing(methods / "DS_X");

  // Quarter directories are searched when no dataset directory exists; the
  // untimestamped name is accepted on the second pass.
  WriteFile(methods / "2011_4" / "Plain_DS_Y.lcmethod", "method");
  const fs::path second_dir = root / "storage" / "DS_Y";
  fs::create_directories(second_dir);
  const dscapture::capture::CompanionCaptureResult quarter = companion.Capture("DS_Y", second_dir);
  AssertTrue(quarter.copied_files.size() == 1U, "quarter method file copied");
  AssertExists(methods / "2011_4" / "Plain_DS_Y.lcmethod");
}

void AssertStaleDirectoriesAreDeleted(dscapture::core::logging::Logger& logger,
                                      const fs::path& root) {
  const fs::path methods = root / "Cleanup";
  WriteFile(methods / "x_Old" / "a.lcmethod", "old");
  WriteFile(methods / "x_Recent" / "b.lcmethod", "recent");
  fs::last_write_time(methods / "x_Old" / "a.lcmethod",
                      fs::file_time_type::clock::now() - std::chrono::hours(24 * 30));

  dscapture::capture::CompanionCaptureSettings settings;
  settings.method_files_dir = methods.string();
  dscapture::capture::CompanionCapture companion(logger, settings);
  AssertTrue(companion.DeleteStaleMethodDirectories() == 1U, "one stale directory");
  AssertMissing(methods / "x_Old");
  AssertExists(methods / "x_Recent");
}

void AssertDisabledOrMissingRootIsNotAnError(dscapture::core::logging::Logger& logger,
                                             const fs::path& root) {
  dscapture::capture::CompanionCaptureSettings disabled;
  disabled.method_files_dir = "NA";
  dscapture::capture::CompanionCapture off(logger, disabled);
  const auto skipped = off.Capture("DS_Z", root);
  AssertTrue(skipped.success && skipped.copied_files.empty(), "disabled capture is a no-op");

  dscapture::capture::CompanionCaptureSettings missing;
  missing.method_files_dir = (root / "no_such_root").string();
  dscapture::capture::CompanionCapture absent(logger, missing);
  AssertTrue(absent.Capture("DS_Z", root).success, "missing method root only warns");
}

} // namespace

int main() {
  const fs::path root = dscapture::tests::common::CreateUniqueTempDir("dscapture-companion");
  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kDebug, log);

  AssertSearchOrder();
  AssertDatasetMethodsAreCapturedAndRetired(logger, root);
  AssertStaleDirectoriesAreDeleted(logger, root);
  AssertDisabledOrMissingRootIsNotAnError(logger, root);

  dscapture::tests::common::RemovePathBestEffort(root);
  return 0;
}
