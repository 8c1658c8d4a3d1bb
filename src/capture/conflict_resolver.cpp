#include "capture/conflict_resolver.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

bool IsSkippedWhenSuperseding(const std::string& file_name) {
  return core::WildcardMatch("LCMethod*.xml", file_name) ||
         core::WildcardMatch("*.#FilePart*#", file_name);
}

fs::path SupersededPath(const fs::path& item) {
  return item.parent_path() / (std::string(kSupersededPrefix) + item.filename().string());
}

} // namespace

FolderExistsAction ParseFolderExistsAction(std::string_view raw) {
  const std::string normalized = core::ToLowerAscii(core::TrimAscii(raw));
  if (normalized == "overwrite_single_item") {
    return FolderExistsAction::kOverwriteSingleItem;
  }
  if (normalized == "delete") {
    return FolderExistsAction::kDelete;
  }
  if (normalized == "rename") {
    return FolderExistsAction::kRename;
  }
  if (normalized == "fail") {
    return FolderExistsAction::kFail;
  }
  return FolderExistsAction::kInvalid;
}

bool TakeCensus(const fs::path& dir, DirectoryCensus& census, std::string& error) {
  census = DirectoryCensus{};
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    error = "Error checking for empty dataset directory: " + ec.message();
    return false;
  }

  for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) {
      error = "Error checking for empty dataset directory: " + ec.message();
      return false;
    }
    std::error_code type_ec;
    if (it->is_directory(type_ec)) {
      if (core::EqualsIgnoreCase(it->path().extension().string(), ".d")) {
        ++census.instrument_folder_count;
      } else {
        ++census.other_folder_count;
      }
    } else {
      ++census.file_count;
    }
  }
  if (ec) {
    error = "Error checking for empty dataset directory: " + ec.message();
    return false;
  }
  return true;
}

bool IsSmallEnoughToResume(const DirectoryCensus& census, const ResumeThresholds& thresholds) {
  const bool explicit_thresholds =
      thresholds.max_files > 0 ||
      thresholds.max_instrument_folders + thresholds.max_other_folders > 0;

  if (explicit_thresholds) {
    return census.file_count <= static_cast<std::size_t>(thresholds.max_files) &&
           census.instrument_folder_count <=
               static_cast<std::size_t>(thresholds.max_instrument_folders) &&
           census.other_folder_count <= static_cast<std::size_t>(thresholds.max_other_folders);
  }

  // A retried capture typically left one or two files, or one folder.
  return (census.folder_count() == 0U && census.file_count <= 2U) ||
         (census.file_count == 0U && census.folder_count() <= 1U);
}

ConflictResolution ConflictResolver::Resolve(const fs::path& dest_dir,
                                             const bool copy_is_resumable,
                                             const ResumeThresholds& thresholds) const {
  ConflictResolution resolution;

  std::error_code ec;
  if (!fs::exists(dest_dir, ec)) {
    resolution.proceed = true;
    return resolution;
  }

  DirectoryCensus census;
  std::string error;
  if (!TakeCensus(dest_dir, census, error)) {
    resolution.message = "Error checking for empty dataset directory";
    logger_.Error(resolution.message, {{"path", dest_dir.string()}, {"error", error}});
    return resolution;
  }

  if (census.empty()) {
    resolution.proceed = true;
    return resolution;
  }

  switch (ParseFolderExistsAction(folder_exists_action_)) {
  case FolderExistsAction::kOverwriteSingleItem: {
    if (IsSmallEnoughToResume(census, thresholds)) {
      if (copy_is_resumable) {
        // Leave existing content in place; the copy merges into it.
        resolution.proceed = true;
      } else if (FindSuperseded(dest_dir, resolution.pending_renames, error)) {
        resolution.proceed = true;
      } else {
        resolution.message = error;
      }
      break;
    }

    if (census.folder_count() == 0U && copy_is_resumable) {
      resolution.proceed = true;
      break;
    }

    resolution.message = "Dataset directory already exists and has multiple files or subdirectories";
    logger_.Error(resolution.message, {{"path", dest_dir.string()},
                                       {"files", std::to_string(census.file_count)},
                                       {"folders", std::to_string(census.folder_count())}});
    break;
  }

  case FolderExistsAction::kDelete:
    fs::remove_all(dest_dir, ec);
    if (ec) {
      resolution.message = "Dataset directory already exists and cannot be deleted";
      logger_.Error(resolution.message, {{"path", dest_dir.string()}, {"error", ec.message()}});
      break;
    }
    logger_.Info("Deleted existing dataset directory", {{"path", dest_dir.string()}});
    resolution.proceed = true;
    break;

  case FolderExistsAction::kRename:
    if (RenameDatasetDirectory(dest_dir, error)) {
      resolution.proceed = true;
    } else {
      resolution.message = error;
    }
    break;

  case FolderExistsAction::kFail:
    resolution.message = "Dataset directory already exists";
    logger_.Error(resolution.message, {{"path", dest_dir.string()}});
    break;

  case FolderExistsAction::kInvalid:
    resolution.message =
        "Dataset directory already exists; Invalid action " + folder_exists_action_ + " specified";
    logger_.Error(resolution.message, {{"path", dest_dir.string()}});
    break;
  }

  return resolution;
}

bool ConflictResolver::FindSuperseded(const fs::path& dest_dir,
                                      std::vector<PendingRename>& pending_renames,
                                      std::string& error) const {
  const auto files = core::FindEntries(dest_dir, "*", core::EntryKind::kFile);
  const auto folders = core::FindEntries(dest_dir, "*", core::EntryKind::kDirectory);

  for (const fs::path& file : files) {
    const std::string name = file.filename().string();
    // Already superseded by an earlier attempt.
    if (core::StartsWithIgnoreCase(name, kSupersededPrefix) && files.size() == 1U) {
      continue;
    }
    if (IsSkippedWhenSuperseding(name)) {
      continue;
    }
    pending_renames.push_back({file, SupersededPath(file), false});
  }

  for (const fs::path& folder : folders) {
    if (core::StartsWithIgnoreCase(folder.filename().string(), kSupersededPrefix) &&
        folders.size() == 1U) {
      continue;
    }
    pending_renames.push_back({folder, SupersededPath(folder), true});
  }

  std::error_code ec;
  if (!fs::exists(dest_dir, ec)) {
    error = "Exception finding files/directories to rename with x_";
    logger_.Error(error, {{"path", dest_dir.string()}});
    return false;
  }

  if (pending_renames.size() == 1U) {
    logger_.Info(std::string("Found 1 ") +
                 (pending_renames.front().is_directory ? "directory" : "file") +
                 " to prepend with x_, " + pending_renames.front().from.filename().string());
  } else if (pending_renames.size() > 1U) {
    logger_.Info("Found " + std::to_string(pending_renames.size()) +
                 " files/directories to prepend with x_");
  }
  return true;
}

bool ConflictResolver::MarkSuperseded(const fs::path& dest_dir,
                                      const std::vector<PendingRename>& pending_renames,
                                      std::string& error) const {
  std::size_t files_renamed = 0;
  std::size_t directories_renamed = 0;

  for (const PendingRename& rename : pending_renames) {
    if (rename.to.empty()) {
      logger_.Warn("New name not defined; cannot mark item as superseded",
                   {{"path", rename.from.string()}});
      continue;
    }

    std::error_code ec;
    if (fs::exists(rename.to, ec)) {
      logger_.Info("Addition of x_ to " + rename.from.string() + " will replace an existing " +
                   (rename.is_directory ? "subdirectory" : "file") + "; deleting " +
                   rename.to.filename().string());
      fs::remove_all(rename.to, ec);
    }
    if (!ec) {
      fs::rename(rename.from, rename.to, ec);
    }
    if (ec) {
      error = "Exception renaming files/directories to rename with x_";
      logger_.Error(error, {{"path", rename.from.string()}, {"error", ec.message()}});
      return false;
    }

    if (rename.is_directory) {
      ++directories_renamed;
    } else {
      ++files_renamed;
    }
  }

  if (files_renamed > 0U) {
    logger_.Info("Renamed " + std::to_string(files_renamed) + " superseded file(s) at " +
                 dest_dir.string() + " to start with x_");
  }
  if (directories_renamed > 0U) {
    logger_.Info("Renamed " + std::to_string(directories_renamed) +
                 " superseded subdirectory(s) at " + dest_dir.string() + " to start with x_");
  }
  return true;
}

bool ConflictResolver::RenameDatasetDirectory(const fs::path& dest_dir, std::string& error) const {
  const fs::path target = SupersededPath(dest_dir);

  std::error_code ec;
  if (fs::exists(target, ec)) {
    error = "Cannot add x_ to directory; the target already exists: " + target.string();
    logger_.Error(error);
    return false;
  }

  fs::rename(dest_dir, target, ec);
  if (ec) {
    error = "Error adding x_ to directory " + dest_dir.string();
    logger_.Error(error, {{"error", ec.message()}});
    return false;
  }

  logger_.Info("Added x_ to directory " + dest_dir.string());
  return true;
}

} // namespace dscapture::capture
