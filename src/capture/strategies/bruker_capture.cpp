#include "capture/strategies/bruker_capture.hpp"

#include "capture/filename_fixer.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "outcome/outcome_classifier.hpp"

#include <regex>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace dscapture::capture {

bool IsMaldiSpotDirectoryName(std::string_view name) {
  static const std::regex spot_pattern(std::string(kMaldiSpotDirectoryPattern),
                                       std::regex::ECMAScript | std::regex::icase);
  return std::regex_match(std::string(name), spot_pattern);
}

outcome::CaptureOutcome BrukerImagingCapture::Capture(const CaptureContext& context,
                                                      const DatasetDescriptor& descriptor,
                                                      const fs::path& source_dir,
                                                      const fs::path& dataset_dir) {
  const fs::path source_folder = source_dir / descriptor.entry_name;

  // The instrument software zips each acquisition region; unzipped folders
  // are not captured.
  if (core::FindEntries(source_folder, "*.zip", core::EntryKind::kFile).empty()) {
    const std::string message = "No zip files found in dataset directory";
    context.logger.Error(message + " at " + source_folder.string());
    return outcome::CaptureOutcome::Failed(message);
  }

  outcome::CaptureOutcome ready = WaitForStableDirectory(context, source_folder);
  if (!ready.succeeded()) {
    return ready;
  }

  std::string error;
  if (!core::MakeDirectoryIfMissing(dataset_dir, error)) {
    const std::string message = "Exception creating dataset directory";
    context.logger.Error(message + " at " + dataset_dir.string(), {{"error", error}});
    return outcome::Classify(outcome::CaptureFault{error, message});
  }

  const std::string failure_message = "Exception copying files from dataset directory";
  if (context.copy_with_resume) {
    outcome::CaptureOutcome copied = CopyDirectory(context, source_folder, dataset_dir, false, {});
    if (!copied.succeeded()) {
      context.logger.Error(failure_message + " " + source_folder.string() +
                           context.connection_description);
      return copied;
    }
  } else {
    copy::CopyOptions options;
    options.fault_injector = context.fault_injector;
    for (const fs::path& file : core::FindEntries(source_folder, "*", core::EntryKind::kFile)) {
      const copy::FileCopyResult result =
          copy::CopyFile(file, dataset_dir / file.filename(), true, options);
      if (!result.ok()) {
        context.logger.Error(failure_message + " " + source_folder.string() +
                                 context.connection_description,
                             {{"file", file.string()}, {"error", result.error}});
        return outcome::Classify(outcome::CaptureFault{result.error, failure_message});
      }
    }
  }

  context.logger.Info("Copied files in directory " + source_folder.string() + " to " +
                      dataset_dir.string() + context.connection_description);
  AutoFixFilesWithInvalidChars(context.request.dataset_name, dataset_dir, context.logger);
  return outcome::CaptureOutcome::Success();
}

outcome::CaptureOutcome BrukerSpotCapture::Capture(const CaptureContext& context,
                                                   const DatasetDescriptor& descriptor,
                                                   const fs::path& source_dir,
                                                   const fs::path& dataset_dir) {
  const fs::path source_folder = source_dir / descriptor.entry_name;

  if (!core::FindEntries(source_folder, "*.zip", core::EntryKind::kFile).empty()) {
    const std::string message = "Zip files found in dataset directory";
    context.logger.Error(message + " " + source_folder.string());
    return outcome::CaptureOutcome::Failed(message);
  }

  const std::vector<fs::path> data_dirs =
      core::FindEntries(source_folder, "*", core::EntryKind::kDirectory);
  if (data_dirs.empty()) {
    const std::string message = "No subdirectories were found in the dataset directory";
    context.logger.Error(message + " " + source_folder.string());
    return outcome::CaptureOutcome::Failed(message);
  }

  if (data_dirs.size() > 1U) {
    for (const fs::path& dir : data_dirs) {
      const std::string name = dir.filename().string();
      context.logger.Debug("Test directory " + name + " against RegEx " +
                           std::string(kMaldiSpotDirectoryPattern));
      if (!IsMaldiSpotDirectoryName(name)) {
        const std::string message =
            "Dataset directory contains multiple subdirectories, but directory " + name +
            " does not match the expected pattern";
        context.logger.Error(message + " (" + std::string(kMaldiSpotDirectoryPattern) + "); see " +
                             source_folder.string());
        return outcome::CaptureOutcome::Failed(message);
      }
    }
  }

  outcome::CaptureOutcome ready = WaitForStableDirectory(context, source_folder);
  if (!ready.succeeded()) {
    return ready;
  }

  CaptureContext plain_copy = context;
  plain_copy.copy_with_resume = false;
  outcome::CaptureOutcome copied = CopyDirectory(plain_copy, source_folder, dataset_dir, true, {});
  if (!copied.succeeded()) {
    context.logger.Error("Exception copying dataset directory " + source_folder.string() +
                         context.connection_description);
    return copied;
  }

  context.logger.Info("Copied directory " + source_folder.string() + " to " + dataset_dir.string() +
                      context.connection_description);
  return outcome::CaptureOutcome::Success();
}

} // namespace dscapture::capture
