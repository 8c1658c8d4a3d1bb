#include "capture/strategies/file_capture.hpp"

#include "capture/filename_fixer.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"
#include "outcome/outcome_classifier.hpp"

#include <future>
#include <optional>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

std::vector<std::string> FilesToCapture(const DatasetDescriptor& descriptor) {
  std::vector<std::string> names = descriptor.files;
  if (names.empty() && !descriptor.entry_name.empty()) {
    names.push_back(descriptor.entry_name);
  }
  if (descriptor.shape == RawDatasetShape::kSingleFile) {
    names.insert(names.end(), descriptor.related_files.begin(), descriptor.related_files.end());
  }
  return names;
}

} // namespace

outcome::CaptureOutcome FileCapture::Capture(const CaptureContext& context,
                                             const DatasetDescriptor& descriptor,
                                             const fs::path& source_dir,
                                             const fs::path& dataset_dir) {
  const std::vector<std::string> file_names = FilesToCapture(descriptor);
  const std::string& dataset_name = context.request.dataset_name;

  std::vector<std::future<ReadinessCheck>> checks;
  checks.reserve(file_names.size());
  for (const std::string& file_name : file_names) {
    const fs::path source_file = source_dir / file_name;
    checks.push_back(std::async(std::launch::async, [&context, source_file]() {
      return context.readiness.CheckFile(source_file,
                                         context.readiness.SleepIntervalForFile(source_file));
    }));
  }

  std::vector<std::string> not_ready_messages;
  std::optional<outcome::CaptureFault> readiness_fault;
  for (auto& pending : checks) {
    const ReadinessCheck check = pending.get();
    if (check.stable) {
      continue;
    }
    if (check.fault && !readiness_fault) {
      readiness_fault = check.fault;
    }
    if (!check.message.empty()) {
      not_ready_messages.push_back(check.message);
    }
  }

  if (readiness_fault || !not_ready_messages.empty()) {
    context.logger.Warn("Dataset '" + dataset_name +
                        "' not ready; source file's size changed (or authentication error)");
    if (readiness_fault) {
      // A file that vanishes or is locked mid-window is retried later; only
      // a dead share session or rejected credentials escalate.
      if (outcome::ClassifyFaultText(readiness_fault->detail) != outcome::FaultClass::kOther) {
        return outcome::Classify(*readiness_fault);
      }
      return outcome::CaptureOutcome::NotReady(readiness_fault->closeout_message);
    }
    context.logger.Info(not_ready_messages.front());
    return outcome::CaptureOutcome::NotReady(not_ready_messages.front());
  }

  std::string error;
  if (!core::MakeDirectoryIfMissing(dataset_dir, error)) {
    const std::string message = "Exception creating dataset directory";
    context.logger.Error(message + " at " + dataset_dir.string(), {{"error", error}});
    return outcome::Classify(outcome::CaptureFault{error, message});
  }

  const std::string& connection = context.connection_description;
  for (const std::string& file_name : file_names) {
    const fs::path source_file = source_dir / file_name;
    const std::string target_name = AutoFixFilename(dataset_name, file_name);
    const fs::path target_file = dataset_dir / target_name;
    if (!core::EqualsIgnoreCase(file_name, target_name)) {
      context.logger.Info("Renaming '" + file_name + "' to '" + target_name + "' to remove spaces");
    }

    std::error_code ec;
    if (!fs::is_regular_file(source_file, ec)) {
      const std::string message = "source file not found at " + source_file.string();
      context.logger.Error("  " + message + connection);
      return outcome::CaptureOutcome::Failed(message);
    }

    const std::uintmax_t size = fs::file_size(source_file, ec);
    copy::CopyOptions options;
    options.fault_injector = context.fault_injector;

    copy::FileCopyResult result;
    if (context.copy_with_resume || (!ec && size > kCopyWithResumeThresholdBytes)) {
      options.resume = true;
      options.overwrite = copy::OverwriteMode::kAlways;
      result = copy::CopyFileWithResume(source_file, target_file, options);
    } else {
      result = copy::CopyFile(source_file, target_file, true, options);
    }

    if (!result.ok()) {
      const std::string message =
          "file copy failed for " + source_file.string() + " to " + target_file.string();
      context.logger.Error("  " + message + connection, {{"error", result.error}});
      return outcome::Classify(outcome::CaptureFault{result.error, message});
    }
    context.logger.Info("  copied file " + source_file.string() + " to " + target_file.string() +
                        connection);
  }

  return outcome::CaptureOutcome::Success();
}

} // namespace dscapture::capture
