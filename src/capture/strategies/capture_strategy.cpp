#include "capture/strategies/capture_strategy.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "outcome/outcome_classifier.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace dscapture::capture {

outcome::CaptureOutcome WaitForStableDirectory(const CaptureContext& context, const fs::path& dir) {
  const ReadinessCheck check =
      context.readiness.CheckDirectory(dir, context.readiness.SleepIntervalForDirectory(dir));
  if (check.stable) {
    return outcome::CaptureOutcome::Success();
  }

  context.logger.Warn("Dataset '" + context.request.dataset_name + "' not ready");
  if (check.fault) {
    return outcome::Classify(*check.fault);
  }
  return outcome::CaptureOutcome::NotReady(check.message.empty() ? "directory size changed"
                                                                  : check.message);
}

bool HasIncompleteUimf(const CaptureContext& context, const fs::path& dir,
                       outcome::CaptureOutcome& failure) {
  const std::vector<fs::path> journals = core::FindEntries(dir, "*.uimf-journal", core::EntryKind::kFile);
  if (!journals.empty()) {
    const std::string message =
        "Source directory has SQLite journal files, indicating data acquisition is in progress";
    context.logger.Error(message + " at " + dir.string());
    failure = outcome::CaptureOutcome::Failed(message);
    return true;
  }

  for (const fs::path& uimf : core::FindEntries(dir, "*.uimf", core::EntryKind::kFile)) {
    std::error_code ec;
    const auto size = fs::file_size(uimf, ec);
    if (!ec && size == 0U) {
      const std::string message = "Source directory has a zero-byte UIMF file";
      context.logger.Error(message + " at " + uimf.string());
      failure = outcome::CaptureOutcome::Failed(message);
      return true;
    }
  }
  return false;
}

outcome::CaptureOutcome CopyDirectory(const CaptureContext& context, const fs::path& source_dir,
                                      const fs::path& target_dir, const bool recurse,
                                      const std::vector<std::string>& skip_list) {
  copy::CopyOptions options;
  options.recurse = recurse;
  options.skip_list = skip_list;
  options.fault_injector = context.fault_injector;

  if (context.copy_with_resume) {
    options.resume = true;
    options.overwrite = copy::OverwriteMode::kIfDateOrLengthDiffer;
    const copy::TreeCopyRetryResult result =
        copy::CopyTreeWithRetry(source_dir, target_dir, options, context.retry_policy,
                                context.connection_description, context.logger);
    if (result.last.success) {
      return outcome::CaptureOutcome::Success();
    }
    return outcome::Classify(outcome::CaptureFault{result.detail, result.message});
  }

  options.resume = false;
  options.overwrite = copy::OverwriteMode::kAlways;
  const copy::TreeCopyResult result = copy::CopyTree(source_dir, target_dir, options);
  if (result.success) {
    return outcome::CaptureOutcome::Success();
  }

  const std::string message = copy::FormatCopyFaultMessage(result);
  context.logger.Error(message + context.connection_description,
                       {{"fault", copy::ToStableCode(result.fault)}});
  return outcome::Classify(outcome::CaptureFault{result.error, message});
}

void FindFilesToSkip(const CaptureContext& context, const fs::path& dir, std::string_view pattern,
                     std::string_view description, const bool recursive,
                     std::vector<std::string>& skip_list) {
  const std::vector<fs::path> matches =
      core::FindEntries(dir, pattern, core::EntryKind::kFile, recursive);
  if (matches.empty()) {
    return;
  }

  for (const fs::path& match : matches) {
    skip_list.push_back(match.filename().string());
  }

  if (matches.size() == 1U) {
    context.logger.Info("Skipping " + std::string(description) + ": " +
                        matches.front().filename().string());
    return;
  }
  context.logger.Info("Skipping " + std::to_string(matches.size()) + " " +
                      std::string(description) + "s: (" + matches.front().filename().string() +
                      " through " + matches.back().filename().string() + ")");
}

} // namespace dscapture::capture
