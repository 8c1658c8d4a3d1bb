#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "capture/readiness.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace {

using dscapture::tests::common::AssertContains;
using dscapture::tests::common::AssertTrue;
using dscapture::tests::common::WriteFile;

void AppendAfterDelay(const fs::path& file, std::chrono::milliseconds delay) {
  std::this_thread::sleep_for(delay);
  std::ofstream output(file, std::ios::binary | std::ios::app);
  output << "more acquisition data";
}

} // namespace

int main() {
  const fs::path root = dscapture::tests::common::CreateUniqueTempDir("dscapture-readiness");
  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kDebug, log);
  dscapture::capture::ReadinessDetector detector(logger, 30);
  detector.set_poll_interval(std::chrono::milliseconds(50));

  const fs::path stable_file = root / "stable.raw";
  WriteFile(stable_file, "complete");
  const dscapture::capture::ReadinessCheck stable = detector.CheckFile(stable_file, 1);
  AssertTrue(stable.stable, "unchanged file must be stable");
  AssertTrue(!stable.fault.has_value(), "stable file has no fault");

  // Freshly written items use the configured interval; missing ones the floor.
  AssertTrue(detector.SleepIntervalForFile(stable_file) == 30, "fresh file keeps base interval");
  AssertTrue(detector.SleepIntervalForFile(root / "missing.raw") ==
                 dscapture::capture::kMinAgedSleepSeconds,
             "missing file uses the minimum interval");

  const fs::path growing_file = root / "growing.raw";
  WriteFile(growing_file, "partial");
  std::thread writer(AppendAfterDelay, growing_file, std::chrono::milliseconds(200));
  const dscapture::capture::ReadinessCheck growing = detector.CheckFile(growing_file, 1);
  writer.join();
  AssertTrue(!growing.stable, "growing file must not be stable");
  AssertContains(growing.message, "File size changed from 7 bytes to 28 bytes");

  AssertTrue(detector.CheckFile(root / "missing.raw", 1).stable,
             "missing file is left for the copy step to report");

  const fs::path folder = root / "Dataset.d";
  WriteFile(folder / "analysis.baf", "baf");
  WriteFile(folder / "sub" / "ser", "ser");
  std::thread folder_writer(AppendAfterDelay, folder / "sub" / "ser", std::chrono::milliseconds(200));
  const dscapture::capture::ReadinessCheck folder_check = detector.CheckDirectory(folder, 1);
  folder_writer.join();
  AssertTrue(!folder_check.stable, "directory with a growing file must not be stable");
  AssertContains(folder_check.message, "Directory size changed from 6 bytes");

  AssertTrue(detector.CheckDirectory(folder, 1).stable, "settled directory must be stable");
  AssertTrue(detector.CheckDirectory(root / "absent", 1).fault.has_value(),
             "unreadable directory reports a fault");

  dscapture::tests::common::RemovePathBestEffort(root);
  return 0;
}
