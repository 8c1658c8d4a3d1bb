#include "capture/source_locator.hpp"

#include "capture/filename_fixer.hpp"
#include "capture/instrument_policy.hpp"
#include "capture/shape_resolver.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/path_utils.hpp"
#include "core/string_utils.hpp"
#include "share/share_connection.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

std::string TrimLeading(std::string_view text, std::string_view chars) {
  const std::size_t begin = text.find_first_not_of(chars);
  return begin == std::string_view::npos ? std::string() : std::string(text.substr(begin));
}

std::string JoinSegments(const std::vector<std::string>& parts) {
  std::string joined;
  for (const std::string& part : parts) {
    if (!joined.empty()) {
      joined.push_back('/');
    }
    joined += part;
  }
  return joined;
}

bool IsShareVolume(std::string_view vol) {
  return vol.size() >= 2U && (vol[0] == '\\' || vol[0] == '/') && vol[1] == vol[0];
}

bool EndsWithSeparatorAndName(std::string_view text, std::string_view name) {
  if (text.size() <= name.size() || !core::EndsWithIgnoreCase(text, name)) {
    return false;
  }
  const char separator = text[text.size() - name.size() - 1U];
  return separator == '/' || separator == '\\';
}

} // namespace

bool VerifyRelativeSourcePath(std::string_view source_vol, std::string& source_path,
                              std::string& capture_subdirectory) {
  if (!core::StartsWithIgnoreCase(TrimLeading(capture_subdirectory, "\\/"), "..") ||
      !IsShareVolume(source_vol)) {
    return false;
  }

  const std::vector<std::string> source_path_parts =
      core::SplitPathSegments(core::TrimChars(source_path, "\\/."));

  if (source_path_parts.size() <= 1U) {
    const std::string capture_sub_work = TrimLeading(capture_subdirectory, "\\/.");
    const std::vector<std::string> work_parts = core::SplitPathSegments(capture_sub_work);
    source_path = work_parts.empty() ? std::string() : work_parts.front();
    capture_subdirectory = TrimLeading(capture_sub_work.substr(source_path.size()), "\\/");
    return true;
  }

  std::vector<std::string> source_parts = source_path_parts;
  std::string first_capture_sub;
  for (const std::string& part : core::SplitPathSegments(capture_subdirectory)) {
    if (part == ".." && !source_parts.empty()) {
      source_parts.pop_back();
      continue;
    }
    first_capture_sub = part;
    break;
  }

  if (source_parts.empty()) {
    source_path = first_capture_sub;
    const std::string trimmed = TrimLeading(capture_subdirectory, "\\/.");
    capture_subdirectory =
        TrimLeading(trimmed.substr(std::min(source_path.size(), trimmed.size())), "\\/");
  } else {
    source_path = JoinSegments(source_parts);
    capture_subdirectory = TrimLeading(capture_subdirectory, "\\/.");
  }
  return true;
}

std::string ReportDirectoryStats(const fs::path& directory) {
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return "Error: directory not found, " + directory.string();
  }

  std::size_t file_count = 0;
  double total_kb = 0.0;
  std::uintmax_t largest_bytes = 0;
  std::string largest_name;
  for (const fs::path& file : core::FindEntries(directory, "*", core::EntryKind::kFile)) {
    const std::uintmax_t size = fs::file_size(file, ec);
    if (ec) {
      return "Error: " + ec.message();
    }
    ++file_count;
    total_kb += static_cast<double>(size) / 1024.0;
    if (size > largest_bytes) {
      largest_bytes = size;
      largest_name = file.filename().string();
    }
  }

  std::ostringstream out;
  out << file_count << " files, " << std::fixed << std::setprecision(1) << total_kb
      << " KB total, largest file is " << largest_name;
  return out.str();
}

bool SourceLocator::ResolveSourceDirectory(const CaptureRequest& request,
                                           std::string& capture_subdirectory,
                                           fs::path& source_dir,
                                           outcome::CaptureOutcome& failure) {
  std::string source_path = request.source_path;
  capture_subdirectory = request.capture_subdirectory;

  const std::string old_paths = "'" + request.source_vol + "' '" + source_path + "' '" +
                                capture_subdirectory + "'";
  if (VerifyRelativeSourcePath(request.source_vol, source_path, capture_subdirectory)) {
    logger_.Info("Updating Share Path, Old: " + old_paths);
    logger_.Info("Updating Share Path, New: '" + request.source_vol + "' '" + source_path +
                 "' '" + capture_subdirectory + "'");
  }

  const std::string source_dir_raw = core::CombineRawPath(request.source_vol, source_path);
  std::string error;
  if (!CheckPathChars(source_dir_raw, "Source directory path", error)) {
    logger_.Error(error);
    failure = outcome::CaptureOutcome::Failed(error);
    return false;
  }
  source_dir = core::AppendRelative(core::ToLocalPath(request.source_vol, unc_mount_root_),
                                    source_path);

  if (!request.uses_share_connection()) {
    logger_.Debug("Bionet connection not required for " + request.source_vol);
    return true;
  }

  logger_.Debug("Bionet connection required for " + request.source_vol);
  share::ShareConnectResult connected = connection_.Connect(source_dir_raw);
  if (!connected.connected()) {
    failure = connected.error.value_or(outcome::CaptureOutcome::Failed(""));
    if (failure.closeout == outcome::Closeout::kSuccess) {
      failure.closeout = outcome::Closeout::kFailed;
    }
    if (failure.message.empty()) {
      failure.message = "Error connecting to Bionet share";
    }
    return false;
  }
  return true;
}

fs::path SourceLocator::ApplyCaptureSubdirectory(const fs::path& source_dir,
                                                 std::string_view capture_subdirectory,
                                                 std::string_view source_folder_or_dataset) const {
  const bool is_name = core::EqualsIgnoreCase(capture_subdirectory, source_folder_or_dataset);
  if (!is_name && !EndsWithSeparatorAndName(capture_subdirectory, source_folder_or_dataset)) {
    return core::AppendRelative(source_dir, capture_subdirectory);
  }

  // A subdirectory naming the dataset is almost always an operator error.
  const fs::path candidate = core::AppendRelative(source_dir, capture_subdirectory);
  std::error_code ec;
  if (!fs::is_directory(candidate, ec)) {
    logger_.Warn("Dataset Capture_Subdirectory ends with the dataset name. Gracefully ignoring "
                 "because this appears to be a data entry error; directory not found: " +
                 candidate.string());
    return source_dir;
  }

  if (is_name) {
    logger_.Warn("Dataset Capture_Subdirectory is the dataset name; leaving the capture path as " +
                 source_dir.string() + " so that the entire dataset directory will be copied");
    return source_dir;
  }

  const fs::path trimmed = candidate.parent_path();
  logger_.Info("Appending captureSubdirectory to sourceDirectoryPath, but removing "
               "SourceFolderName, giving: " +
               trimmed.string() + " (removed " + std::string(source_folder_or_dataset) + ")");
  return trimmed;
}

bool SourceLocator::Locate(const CaptureRequest& request, SourceLocation& location,
                           outcome::CaptureOutcome& failure) {
  location = SourceLocation{};

  std::string capture_subdirectory;
  if (!ResolveSourceDirectory(request, capture_subdirectory, location.source_dir, failure)) {
    return false;
  }

  std::string error;
  if (!request.source_folder_name.empty() &&
      !CheckFileNameChars(request.source_folder_name, "Job param Source_Folder_Name", error)) {
    logger_.Error(error);
    failure = outcome::CaptureOutcome::Failed(error);
    return false;
  }

  const std::string& source_folder_or_dataset =
      request.source_folder_name.empty() ? request.dataset_name : request.source_folder_name;

  if (!capture_subdirectory.empty()) {
    location.source_dir =
        ApplyCaptureSubdirectory(location.source_dir, capture_subdirectory, source_folder_or_dataset);
    if (!CheckPathChars(location.source_dir.string(),
                        "Source directory path with captureSubdirectory optionally added", error)) {
      logger_.Error(error);
      failure = outcome::CaptureOutcome::Failed(error);
      return false;
    }
  }

  const ShapeResolver resolver(logger_);
  location.descriptor =
      resolver.Resolve(location.source_dir, source_folder_or_dataset, request.instrument_class);

  if (location.descriptor.dataset_name != request.dataset_name) {
    logger_.Warn("DatasetName in the dataset descriptor is " + location.descriptor.dataset_name +
                 "; changing to " + request.dataset_name);
    location.descriptor.dataset_name = request.dataset_name;
  }

  if (location.descriptor.shape == RawDatasetShape::kNone) {
    std::string message = request.uses_share_connection() ? "Dataset data file not found on Bionet at "
                                                           : "Dataset data file not found at ";
    message += location.source_dir.string();

    std::string directory_stats;
    if (request.source_folder_name.empty()) {
      directory_stats = ReportDirectoryStats(location.source_dir);
      message += "; empty SourceFolderName";
    } else {
      directory_stats = ReportDirectoryStats(location.source_dir / request.source_folder_name);
      message += "; SourceFolderName: " + request.source_folder_name;
    }

    logger_.Error(message + " (" + request.dataset_name + ", job " + request.job + "); " +
                  directory_stats);
    failure = outcome::CaptureOutcome::Failed(message);
    return false;
  }

  if (!ValidateWithInstrumentClass(location.source_dir, request.instrument_class,
                                   location.descriptor, logger_, error)) {
    if (error.empty()) {
      error = "Dataset type (" + std::string(ToString(location.descriptor.shape)) +
              ") is not valid for the instrument class (" + request.instrument_class_name + ")";
    }
    logger_.Error(error);
    failure = outcome::CaptureOutcome::Failed(error);
    return false;
  }
  return true;
}

} // namespace dscapture::capture
