#include "capture/capture_request.hpp"

#include "capture/filename_fixer.hpp"
#include "capture/readiness.hpp"
#include "core/host_info.hpp"
#include "core/path_utils.hpp"
#include "core/string_utils.hpp"
#include "params/password.hpp"

namespace dscapture::capture {

namespace {

std::string TrimmedParam(const params::ParamSet& params, std::string_view key) {
  return core::TrimAscii(params.GetString(key));
}

} // namespace

std::string_view ToString(const Perspective perspective) {
  switch (perspective) {
  case Perspective::kClient:
    return "client";
  case Perspective::kServer:
    return "server";
  }
  return "server";
}

bool CaptureRequest::uses_share_connection() const {
  return core::EqualsIgnoreCase(core::TrimAscii(capture_method), "secfso");
}

bool BuildCaptureRequest(const params::CaptureParams& params, CaptureRequest& request,
                         CaptureSettings& settings, std::string& error) {
  const params::ParamSet& task = params.task;
  const params::ParamSet& manager = params.manager;

  request = CaptureRequest{};
  request.dataset_name = TrimmedParam(task, "Dataset");
  if (request.dataset_name.empty()) {
    error = "task parameter Dataset is missing or empty";
    return false;
  }

  request.job = TrimmedParam(task, "Job");
  request.source_vol = TrimmedParam(task, "Source_Vol");
  request.source_path = TrimmedParam(task, "Source_Path");

  const std::string legacy_subfolder = TrimmedParam(task, "Capture_Subfolder");
  request.capture_subdirectory =
      core::TrimAscii(task.GetString("Capture_Subdirectory", legacy_subfolder));
  if (request.capture_subdirectory.empty()) {
    request.capture_subdirectory = legacy_subfolder;
  }

  request.source_folder_name = TrimmedParam(task, "Source_Folder_Name");
  request.storage_vol = TrimmedParam(task, "Storage_Vol");
  request.storage_vol_external = TrimmedParam(task, "Storage_Vol_External");
  request.storage_path = TrimmedParam(task, "Storage_Path");
  request.storage_folder_name = TrimmedParam(task, "Storage_Folder_Name");
  request.directory = TrimmedParam(task, "Directory");
  if (request.directory.empty()) {
    request.directory = request.dataset_name;
  }

  request.instrument_class_name = TrimmedParam(task, "Instrument_Class");
  // Unknown classes are legal; they accept any dataset shape.
  (void)ParseInstrumentClass(request.instrument_class_name, request.instrument_class);
  request.instrument_name = TrimmedParam(task, "Instrument_Name");
  request.capture_method = TrimmedParam(task, "Method");
  request.allow_incomplete_dataset = task.GetBool("AllowIncompleteDataset", false);

  settings = CaptureSettings{};
  settings.perspective = core::EqualsIgnoreCase(TrimmedParam(manager, "perspective"), "client")
                             ? Perspective::kClient
                             : Perspective::kServer;
  settings.sleep_interval_seconds =
      manager.GetInt("sleepinterval", kDefaultSleepIntervalSeconds);
  settings.folder_exists_action = TrimmedParam(manager, "DSFolderExistsAction");

  const std::string host_name = core::LocalHostName();
  settings.share.connector_type = TrimmedParam(manager, "ShareConnectorType");
  settings.share.user = TrimmedParam(manager, "BionetUser");
  settings.share.password = params::DecodePassword(manager.GetString("BionetPwd"));
  settings.share.host_name = host_name;
  settings.share.local_user = core::LocalUserName();
  settings.share.unc_mount_root =
      manager.GetString("UncMountRoot", core::kDefaultUncMountRoot);

  settings.companion.method_files_dir =
      manager.GetString("LCMethodFilesDir", kDefaultMethodFilesDir);
  settings.companion.host_name = host_name;
  settings.companion.cleanup_host_prefix = TrimmedParam(manager, "LCMethodCleanupHostPrefix");
  return true;
}

bool ValidateDatasetName(std::string_view dataset_name, std::string& error) {
  if (dataset_name.find(' ') != std::string_view::npos) {
    error = "Dataset name contains a space";
    return false;
  }
  return CheckFileNameChars(dataset_name, "Dataset name", error);
}

} // namespace dscapture::capture
