#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

inline constexpr std::string_view kDefaultMethodFilesDir =
    "/mnt/proto-5/BionetXfer/Run_Complete_Trigger/MethodFiles";

// Oldest year/quarter directory that is searched.
constexpr int kFirstMethodFileYear = 2011;
constexpr int kFirstMethodFileQuarter = 3;
constexpr int kStaleMethodDirectoryDays = 14;

struct CompanionCaptureSettings {
  // Empty or "na" disables capture.
  std::string method_files_dir{kDefaultMethodFilesDir};
  std::string host_name;
  // Stale cleanup also runs outside the evening window on hosts with this prefix.
  std::string cleanup_host_prefix;
};

struct CompanionCaptureResult {
  // False only for an unexpected error.
  bool success = true;
  std::vector<std::filesystem::path> copied_files;
};

// Directory names searched in order: the dataset name, then YYYY_Q from the
// quarter containing `now` back to 2011_3.
std::vector<std::string> MethodSearchDirectories(std::string_view dataset_name,
                                                 std::chrono::system_clock::time_point now);

// Matches names like
// Cheetah_01.04.2012_08.46.17_Dataset_P28_D01_3Jan12_Cheetah_11-09-32.lcmethod
bool HasMethodTimestamp(std::string_view file_name);

// Copies LC method files that belong to a dataset into its storage directory.
class CompanionCapture {
public:
  CompanionCapture(core::logging::Logger& logger, CompanionCaptureSettings settings);

  CompanionCaptureResult Capture(std::string_view dataset_name,
                                 const std::filesystem::path& dataset_dir);

  // Deletes x_* directories under the method root whose entries are all more
  // than 14 days old. Returns the number of directories removed.
  std::size_t DeleteStaleMethodDirectories();

  void set_clock(std::chrono::system_clock::time_point now) {
    fixed_now_ = now;
  }

private:
  std::chrono::system_clock::time_point Now() const;
  bool CleanupWindowOpen() const;
  std::vector<std::filesystem::path> FindMethodFiles(const std::filesystem::path& root,
                                                     std::string_view dataset_name) const;
  void RetireDatasetDirectory(const std::filesystem::path& root, std::string_view dataset_name,
                              const std::vector<std::filesystem::path>& method_files);

  core::logging::Logger& logger_;
  CompanionCaptureSettings settings_;
  bool cleanup_done_ = false;
  std::chrono::system_clock::time_point fixed_now_{};
};

} // namespace dscapture::capture
