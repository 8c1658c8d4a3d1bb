#pragma once

#include "capture/capture_request.hpp"
#include "capture/conflict_resolver.hpp"
#include "outcome/capture_outcome.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

struct TargetDirectory {
  // <storage vol>/<Storage_Path>, e.g. /mnt/proto-9/VOrbiETD02/2011_2
  std::filesystem::path storage_dir;
  // storage_dir/<Storage_Folder_Name or Directory>
  std::filesystem::path dataset_dir;
  // Superseded renames to apply once the source has been verified.
  std::vector<PendingRename> pending_renames;
};

// "Directory" must be the dataset name or a path whose first segment is
// the dataset name.
bool DirectoryParamMatchesDataset(std::string_view dataset_name, std::string_view directory);

// Storage roots may not be empty, "\" or "/".
bool ValidateStorageRoot(std::string_view root, std::string_view description,
                         std::string_view example, std::string& error);

// Server perspective only works on the storage server itself; elsewhere the
// external (client) path has to be used.
Perspective ResolvePerspective(Perspective configured, std::string_view storage_vol_external,
                               std::string_view host_name, core::logging::Logger& logger);

// Resume thresholds for an existing dataset directory, by instrument class.
ResumeThresholds ResumeThresholdsFor(InstrumentClass instrument_class);

// Works out the storage and dataset directories, creates a missing storage
// directory and applies the DSFolderExistsAction policy to an existing
// dataset directory. On failure `failure` holds the closeout.
bool PrepareTargetDirectory(const CaptureRequest& request, const CaptureSettings& settings,
                            bool copy_with_resume, core::logging::Logger& logger,
                            TargetDirectory& target, outcome::CaptureOutcome& failure);

} // namespace dscapture::capture
