#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

// Prefix applied to content set aside during conflict resolution.
inline constexpr std::string_view kSupersededPrefix = "x_";

// Manager parameter DSFolderExistsAction.
enum class FolderExistsAction {
  kOverwriteSingleItem = 0,
  kDelete,
  kRename,
  kFail,
  kInvalid,
};

FolderExistsAction ParseFolderExistsAction(std::string_view raw);

// Counts allowed in an existing dataset directory before a resumed copy is
// refused. All zero selects the built-in heuristic.
struct ResumeThresholds {
  int max_files = 0;
  int max_instrument_folders = 0;
  int max_other_folders = 0;
};

struct DirectoryCensus {
  std::size_t file_count = 0;
  // Subdirectories named *.d
  std::size_t instrument_folder_count = 0;
  std::size_t other_folder_count = 0;

  std::size_t folder_count() const {
    return instrument_folder_count + other_folder_count;
  }
  bool empty() const {
    return file_count == 0U && folder_count() == 0U;
  }
};

struct PendingRename {
  std::filesystem::path from;
  std::filesystem::path to;
  bool is_directory = false;
};

struct ConflictResolution {
  bool proceed = false;
  // Closeout message when proceed is false.
  std::string message;
  // Applied by MarkSuperseded once the source has been verified.
  std::vector<PendingRename> pending_renames;
};

bool TakeCensus(const std::filesystem::path& dir, DirectoryCensus& census, std::string& error);

bool IsSmallEnoughToResume(const DirectoryCensus& census, const ResumeThresholds& thresholds);

// Decides what to do with a dataset directory that already exists in storage.
class ConflictResolver {
public:
  ConflictResolver(core::logging::Logger& logger, std::string folder_exists_action)
      : logger_(logger), folder_exists_action_(std::move(folder_exists_action)) {}

  ConflictResolution Resolve(const std::filesystem::path& dest_dir, bool copy_is_resumable,
                             const ResumeThresholds& thresholds) const;

  // Renames planned items to x_<name>, replacing any existing x_ target.
  bool MarkSuperseded(const std::filesystem::path& dest_dir,
                      const std::vector<PendingRename>& pending_renames, std::string& error) const;

private:
  bool FindSuperseded(const std::filesystem::path& dest_dir,
                      std::vector<PendingRename>& pending_renames, std::string& error) const;
  bool RenameDatasetDirectory(const std::filesystem::path& dest_dir, std::string& error) const;

  core::logging::Logger& logger_;
  std::string folder_exists_action_;
};

} // namespace dscapture::capture
