#pragma once

#include "capture/capture_request.hpp"
#include "capture/dataset_descriptor.hpp"
#include "outcome/capture_outcome.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::share {
class ShareConnection;
}

namespace dscapture::capture {

// Rewrites Source_Path / Capture_Subdirectory when the subdirectory climbs
// out of the source share with "..", e.g.
//   \\lumos01.bionet\  ProteomicsData\  ..\ProteomicsData2
// becomes
//   \\lumos01.bionet\  ProteomicsData2  (empty subdirectory)
// Only applies to share volumes. Returns true when anything changed.
bool VerifyRelativeSourcePath(std::string_view source_vol, std::string& source_path,
                              std::string& capture_subdirectory);

// "N files, X.X KB total, largest file is Y" for the top level of
// `directory`, or "Error: directory not found, <path>".
std::string ReportDirectoryStats(const std::filesystem::path& directory);

struct SourceLocation {
  std::filesystem::path source_dir;
  DatasetDescriptor descriptor;
};

// Finds the dataset at the source: builds the source directory, opens the
// share session when the request needs one, applies the capture
// subdirectory, resolves the dataset shape and validates it against the
// instrument class.
class SourceLocator {
public:
  SourceLocator(core::logging::Logger& logger, share::ShareConnection& connection,
                std::filesystem::path unc_mount_root)
      : logger_(logger), connection_(connection), unc_mount_root_(std::move(unc_mount_root)) {}

  bool Locate(const CaptureRequest& request, SourceLocation& location,
              outcome::CaptureOutcome& failure);

private:
  bool ResolveSourceDirectory(const CaptureRequest& request, std::string& capture_subdirectory,
                              std::filesystem::path& source_dir,
                              outcome::CaptureOutcome& failure);
  std::filesystem::path ApplyCaptureSubdirectory(const std::filesystem::path& source_dir,
                                                 std::string_view capture_subdirectory,
                                                 std::string_view source_folder_or_dataset) const;

  core::logging::Logger& logger_;
  share::ShareConnection& connection_;
  std::filesystem::path unc_mount_root_;
};

} // namespace dscapture::capture
