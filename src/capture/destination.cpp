#include "capture/destination.hpp"

#include "capture/filename_fixer.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/path_utils.hpp"
#include "core/string_utils.hpp"

#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

bool Fail(core::logging::Logger& logger, outcome::CaptureOutcome& failure, std::string message) {
  logger.Error(message);
  failure = outcome::CaptureOutcome::Failed(std::move(message));
  return false;
}

} // namespace

bool DirectoryParamMatchesDataset(std::string_view dataset_name, std::string_view directory) {
  if (directory == dataset_name) {
    return true;
  }
  const std::vector<std::string> segments = core::SplitPathSegments(directory);
  return !segments.empty() && segments.front() == dataset_name;
}

bool ValidateStorageRoot(std::string_view root, std::string_view description,
                         std::string_view example, std::string& error) {
  const std::string trimmed = core::TrimAscii(root);
  if (!trimmed.empty() && trimmed != "\\" && trimmed != "/") {
    return true;
  }
  error = std::string(description) + " is invalid (" + std::string(root) + "); it should be " +
          std::string(example) + " or similar";
  return false;
}

Perspective ResolvePerspective(const Perspective configured,
                               std::string_view storage_vol_external,
                               std::string_view host_name, core::logging::Logger& logger) {
  if (configured == Perspective::kClient) {
    return configured;
  }
  if (core::ContainsIgnoreCase(storage_vol_external, host_name)) {
    return configured;
  }
  logger.Info("Auto-changing perspective to client because " +
              core::ToLowerAscii(std::string(storage_vol_external)) + " does not contain " +
              core::ToLowerAscii(std::string(host_name)));
  return Perspective::kClient;
}

ResumeThresholds ResumeThresholdsFor(const InstrumentClass instrument_class) {
  if (instrument_class == InstrumentClass::kBrukerMaldiImaging ||
      instrument_class == InstrumentClass::kBrukerMaldiImagingV2) {
    return ResumeThresholds{20, 20, 1};
  }
  return ResumeThresholds{};
}

bool PrepareTargetDirectory(const CaptureRequest& request, const CaptureSettings& settings,
                            const bool copy_with_resume, core::logging::Logger& logger,
                            TargetDirectory& target, outcome::CaptureOutcome& failure) {
  target = TargetDirectory{};

  if (!DirectoryParamMatchesDataset(request.dataset_name, request.directory)) {
    return Fail(logger, failure,
                "The Directory task parameter is invalid since it does not start with the "
                "dataset name; expecting \"" +
                    request.dataset_name + "\" but actually \"" + request.directory + "\"");
  }

  std::string error;
  const Perspective perspective = ResolvePerspective(
      settings.perspective, request.storage_vol_external, settings.share.host_name, logger);

  std::string storage_vol;
  if (perspective == Perspective::kClient) {
    if (!ValidateStorageRoot(request.storage_vol_external, "Parameter Storage_Vol_External",
                             "\\\\proto-5", error)) {
      return Fail(logger, failure, error);
    }
    storage_vol = request.storage_vol_external;
  } else {
    if (!ValidateStorageRoot(request.storage_vol, "Parameter Storage_Vol", "E:\\", error)) {
      return Fail(logger, failure, error);
    }
    storage_vol = request.storage_vol;
  }

  if (!ValidateStorageRoot(request.storage_path, "Parameter Storage_Path", "Lumos01\\2020_3",
                           error)) {
    return Fail(logger, failure, error);
  }

  // Storage_Path has to name the instrument and a subdirectory, e.g. Lumos01/2020_3.
  const std::vector<std::string> storage_path_parts = core::SplitPathSegments(request.storage_path);
  if (storage_path_parts.size() < 2U || storage_path_parts.front() != request.instrument_name) {
    return Fail(logger, failure,
                "Parameter Storage_Path is invalid (" + request.storage_path +
                    "); it must start with the instrument name and should thus be " +
                    request.instrument_name + "/2020_3 or similar");
  }

  const std::string storage_dir_raw = core::CombineRawPath(storage_vol, request.storage_path);
  if (!CheckPathChars(storage_dir_raw, "Storage share path", error)) {
    return Fail(logger, failure, error);
  }
  if (!ValidateStorageRoot(storage_dir_raw, "Storage directory path",
                           "\\\\proto-8\\Eclipse01\\2020_3\\", error)) {
    return Fail(logger, failure, error);
  }

  const fs::path unc_mount_root = settings.share.unc_mount_root;
  target.storage_dir = core::AppendRelative(core::ToLocalPath(storage_vol, unc_mount_root),
                                            request.storage_path);

  const std::string& dataset_dir_name =
      request.storage_folder_name.empty() ? request.directory : request.storage_folder_name;
  target.dataset_dir = core::AppendRelative(target.storage_dir, dataset_dir_name);

  if (!CheckPathChars(target.dataset_dir.string(), "Dataset directory path", error)) {
    return Fail(logger, failure, error);
  }

  std::error_code ec;
  if (!fs::is_directory(target.storage_dir, ec)) {
    logger.Info("Storage directory '" + target.storage_dir.string() +
                "' does not exist; will auto-create");
    if (!core::MakeDirectoryIfMissing(target.storage_dir, error)) {
      logger.Error("Error creating missing storage directory: " + target.storage_dir.string(),
                   {{"error", error}});
      failure = outcome::CaptureOutcome::Failed("Error creating missing storage directory");
      return false;
    }
    logger.Debug("Successfully created " + target.storage_dir.string());
  }

  if (!fs::is_directory(target.dataset_dir, ec)) {
    return true;
  }

  const ConflictResolver resolver(logger, settings.folder_exists_action);
  ConflictResolution resolution =
      resolver.Resolve(target.dataset_dir, copy_with_resume, ResumeThresholdsFor(request.instrument_class));
  if (!resolution.proceed) {
    failure = outcome::CaptureOutcome::Failed(
        resolution.message.empty() ? "PerformDSExistsActions returned false" : resolution.message);
    return false;
  }

  target.pending_renames = std::move(resolution.pending_renames);
  return true;
}

} // namespace dscapture::capture
