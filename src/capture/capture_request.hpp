#pragma once

#include "capture/companion_capture.hpp"
#include "capture/instrument_class.hpp"
#include "params/params_loader.hpp"
#include "share/share_connection.hpp"

#include <string>
#include <string_view>

namespace dscapture::capture {

// Path style used for the storage side of a capture.
//   kClient: \\proto-5\Exact04\2012_1 (Storage_Vol_External)
//   kServer: E:\Exact04\2012_1        (Storage_Vol)
enum class Perspective {
  kClient,
  kServer,
};

std::string_view ToString(Perspective perspective);

// Task parameters for one capture, read once and never modified.
struct CaptureRequest {
  std::string dataset_name;
  std::string job;

  std::string source_vol;
  std::string source_path;
  // Capture_Subdirectory, falling back to the legacy Capture_Subfolder.
  std::string capture_subdirectory;
  // Overrides the dataset name when matching the source entry.
  std::string source_folder_name;

  std::string storage_vol;
  std::string storage_vol_external;
  std::string storage_path;
  // Overrides `directory` as the dataset directory name.
  std::string storage_folder_name;
  std::string directory;

  std::string instrument_class_name;
  InstrumentClass instrument_class = InstrumentClass::kUnknown;
  std::string instrument_name;

  // "secfso" sources sit on the isolated instrument network and need a
  // credentialed share session.
  std::string capture_method;
  bool allow_incomplete_dataset = false;

  bool uses_share_connection() const;
};

// Worker-wide settings derived from the manager parameters.
struct CaptureSettings {
  Perspective perspective = Perspective::kServer;
  int sleep_interval_seconds = 30;
  std::string folder_exists_action;
  share::ShareConnectionSettings share;
  CompanionCaptureSettings companion;
};

// Builds the request and settings from the two parameter sets.
//
// Fails only when the parameters cannot describe a capture at all (no
// dataset name); path problems are reported by the capture itself with the
// job-record wording.
bool BuildCaptureRequest(const params::CaptureParams& params, CaptureRequest& request,
                         CaptureSettings& settings, std::string& error);

// "Dataset name contains a space" plus the file-name character check.
bool ValidateDatasetName(std::string_view dataset_name, std::string& error);

} // namespace dscapture::capture
