#include "capture/companion_capture.hpp"

#include "capture/conflict_resolver.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"
#include "core/time_utils.hpp"

#include <ctime>
#include <regex>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

bool IsDisabled(const std::string& method_files_dir) {
  const std::string trimmed = core::TrimAscii(method_files_dir);
  return trimmed.empty() || core::EqualsIgnoreCase(trimmed, "na");
}

} // namespace

std::vector<std::string> MethodSearchDirectories(std::string_view dataset_name,
                                                 const std::chrono::system_clock::time_point now) {
  std::vector<std::string> names{std::string(dataset_name)};

  std::tm local_time{};
  if (!core::ToLocalTime(now, local_time)) {
    return names;
  }

  int year = local_time.tm_year + 1900;
  int quarter = local_time.tm_mon / 3 + 1;
  while (year > kFirstMethodFileYear ||
         (year == kFirstMethodFileYear && quarter >= kFirstMethodFileQuarter)) {
    names.push_back(std::to_string(year) + "_" + std::to_string(quarter));
    if (quarter > 1) {
      --quarter;
    } else {
      quarter = 4;
      --year;
    }
  }
  return names;
}

bool HasMethodTimestamp(std::string_view file_name) {
  static const std::regex kTimestampPattern(R"(.+\d+\.\d+\.\d+_\d+\.\d+\.\d+_.+\.lcmethod)",
                                            std::regex::icase);
  return std::regex_match(file_name.begin(), file_name.end(), kTimestampPattern);
}

CompanionCapture::CompanionCapture(core::logging::Logger& logger,
                                   CompanionCaptureSettings settings)
    : logger_(logger), settings_(std::move(settings)) {}

std::chrono::system_clock::time_point CompanionCapture::Now() const {
  if (fixed_now_ != std::chrono::system_clock::time_point{}) {
    return fixed_now_;
  }
  return std::chrono::system_clock::now();
}

bool CompanionCapture::CleanupWindowOpen() const {
  if (!settings_.cleanup_host_prefix.empty() &&
      core::StartsWithIgnoreCase(settings_.host_name, settings_.cleanup_host_prefix)) {
    return true;
  }
  std::tm local_time{};
  if (!core::ToLocalTime(Now(), local_time)) {
    return false;
  }
  return local_time.tm_hour == 18 || local_time.tm_hour == 19;
}

std::vector<fs::path> CompanionCapture::FindMethodFiles(const fs::path& root,
                                                        std::string_view dataset_name) const {
  const std::vector<std::string> directories = MethodSearchDirectories(dataset_name, Now());
  const std::string pattern = "*_" + std::string(dataset_name) + ".lcmethod";

  // First pass insists on the timestamped naming; the second accepts any match.
  for (int pass = 1; pass <= 2; ++pass) {
    for (const std::string& directory : directories) {
      std::vector<fs::path> found;
      for (const fs::path& file : core::FindEntries(root / directory, pattern, core::EntryKind::kFile)) {
        if (pass == 2 || HasMethodTimestamp(file.filename().string())) {
          found.push_back(file);
        }
      }
      if (!found.empty()) {
        return found;
      }
    }
  }
  return {};
}

CompanionCaptureResult CompanionCapture::Capture(std::string_view dataset_name,
                                                 const fs::path& dataset_dir) {
  CompanionCaptureResult result;
  if (IsDisabled(settings_.method_files_dir)) {
    return result;
  }

  const fs::path root(settings_.method_files_dir);
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      logger_.Error("Exception copying LCMethod file for " + std::string(dataset_name),
                    {{"path", root.string()}, {"error", ec.message()}});
      result.success = false;
      return result;
    }
    logger_.Warn("LCMethods directory not found: " + root.string());
    return result;
  }

  const std::vector<fs::path> method_files = FindMethodFiles(root, dataset_name);
  for (const fs::path& method_file : method_files) {
    const fs::path target = dataset_dir / method_file.filename();
    fs::copy_file(method_file, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      logger_.Warn("Exception copying LCMethod file " + method_file.string() + ": " + ec.message());
      ec.clear();
      continue;
    }
    result.copied_files.push_back(target);
  }

  if (!method_files.empty()) {
    logger_.Info("Captured LCMethod files",
                 {{"count", std::to_string(result.copied_files.size())},
                  {"path", method_files.front().parent_path().string()}});
    if (core::EqualsIgnoreCase(method_files.front().parent_path().filename().string(),
                               dataset_name)) {
      RetireDatasetDirectory(root, dataset_name, method_files);
    }
  }

  if (!cleanup_done_ && CleanupWindowOpen()) {
    cleanup_done_ = true;
    DeleteStaleMethodDirectories();
  }
  return result;
}

void CompanionCapture::RetireDatasetDirectory(const fs::path& root, std::string_view dataset_name,
                                              const std::vector<fs::path>& method_files) {
  const fs::path source_dir = root / std::string(dataset_name);
  const fs::path retired_dir = root / (std::string(kSupersededPrefix) + std::string(dataset_name));

  std::error_code ec;
  if (!fs::exists(retired_dir, ec)) {
    fs::rename(source_dir, retired_dir, ec);
    if (ec) {
      logger_.Warn("Exception renaming source LCMethods directory for " +
                   std::string(dataset_name) + ": " + ec.message());
    }
    return;
  }

  // The x_ directory already exists; move the files into it.
  for (const fs::path& method_file : method_files) {
    fs::copy_file(method_file, retired_dir / method_file.filename(),
                  fs::copy_options::overwrite_existing, ec);
    if (!ec) {
      fs::remove(method_file, ec);
    }
    if (ec) {
      logger_.Warn("Exception renaming source LCMethods directory for " +
                   std::string(dataset_name) + ": " + ec.message());
      return;
    }
  }
  // Only removed when nothing else is left behind.
  fs::remove(source_dir, ec);
}

std::size_t CompanionCapture::DeleteStaleMethodDirectories() {
  const fs::path root(settings_.method_files_dir);
  std::size_t deleted = 0;

  for (const fs::path& directory : core::FindEntries(root, "x_*", core::EntryKind::kDirectory)) {
    bool safe_to_delete = true;
    for (const fs::path& entry : core::FindEntries(directory, "*", core::EntryKind::kAny)) {
      std::error_code ec;
      const auto write_time = fs::last_write_time(entry, ec);
      if (ec || core::AgeInDays(write_time) <= kStaleMethodDirectoryDays) {
        safe_to_delete = false;
        break;
      }
    }
    if (!safe_to_delete) {
      continue;
    }

    std::error_code ec;
    fs::remove_all(directory, ec);
    if (ec) {
      logger_.Error("Exception deleting old LCMethods directory",
                    {{"path", directory.string()}, {"error", ec.message()}});
      continue;
    }
    ++deleted;
    logger_.Info("Deleted old LCMethods directory: " + directory.string());
  }
  return deleted;
}

} // namespace dscapture::capture
