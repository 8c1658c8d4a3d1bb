#pragma once

#include "capture/capture_request.hpp"
#include "capture/dataset_descriptor.hpp"
#include "capture/readiness.hpp"
#include "copy/resumable_copy.hpp"
#include "outcome/capture_outcome.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

// Everything a strategy needs besides the resolved source and target.
struct CaptureContext {
  core::logging::Logger& logger;
  const ReadinessDetector& readiness;
  const CaptureRequest& request;
  // Appended to copy log lines; empty when no share session is open.
  std::string connection_description;
  bool copy_with_resume = false;
  copy::CopyRetryPolicy retry_policy;
  // Test hook forwarded to every copy.
  copy::FaultInjector fault_injector;
};

// Shared contract for the per-shape capture procedures.
//
// A strategy owns the readiness wait, the shape-specific content checks and
// the copy for one RawDatasetShape. It never throws; failures come back as a
// non-success outcome.
class ICaptureStrategy {
public:
  virtual ~ICaptureStrategy() = default;

  // `source_dir` is the directory holding the dataset entry; `dataset_dir`
  // is the final dataset directory on storage.
  virtual outcome::CaptureOutcome Capture(const CaptureContext& context,
                                          const DatasetDescriptor& descriptor,
                                          const std::filesystem::path& source_dir,
                                          const std::filesystem::path& dataset_dir) = 0;
};

// Waits one sleep interval on `dir` and returns NotReady (or a classified
// fault) when its size moved. Returns Success when stable.
outcome::CaptureOutcome WaitForStableDirectory(const CaptureContext& context,
                                               const std::filesystem::path& dir);

// Refuses a UIMF acquisition that is still being written: any
// *.uimf-journal file or a zero-byte *.uimf file. Returns true (and sets
// `failure`) when one is present.
bool HasIncompleteUimf(const CaptureContext& context, const std::filesystem::path& dir,
                       outcome::CaptureOutcome& failure);

// Copies a directory tree, through the bounded-retry resumable path when the
// context asks for it, otherwise with a plain overwriting copy.
outcome::CaptureOutcome CopyDirectory(const CaptureContext& context,
                                      const std::filesystem::path& source_dir,
                                      const std::filesystem::path& target_dir, bool recurse,
                                      const std::vector<std::string>& skip_list);

// Appends the names of files under `dir` matching `pattern` to `skip_list`
// and logs them, e.g. "Skipping 4 mcf files: (a_1.mcf through a_4.mcf)".
void FindFilesToSkip(const CaptureContext& context, const std::filesystem::path& dir,
                     std::string_view pattern, std::string_view description, bool recursive,
                     std::vector<std::string>& skip_list);

} // namespace dscapture::capture
