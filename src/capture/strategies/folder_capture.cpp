#include "capture/strategies/folder_capture.hpp"

#include "capture/filename_fixer.hpp"
#include "capture/name_similarity.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"
#include "outcome/outcome_classifier.hpp"

#include <array>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

struct SkipSpec {
  std::string_view pattern;
  std::string_view description;
};

constexpr std::array<SkipSpec, 11> k12TeslaSkipSpecs{{
    {"*_1.mcf", "mcf file"},
    {"*_2.mcf", "mcf file"},
    {"*_3.mcf", "mcf file"},
    {"*_4.mcf", "mcf file"},
    {"*_1.mcf_idx", "mcf_idx file"},
    {"*_2.mcf_idx", "mcf_idx file"},
    {"*_3.mcf_idx", "mcf_idx file"},
    {"*_4.mcf_idx", "mcf_idx file"},
    {"LockInfo", "lock file"},
    {"SyncHelper", "sync helper"},
    {"ProjectCreationHelper", "project creation helper"},
}};

constexpr std::array<std::string_view, 3> kZeroByteBrukerFiles{
    "ProjectCreationHelper", "SyncHelper", "lock.file"};

outcome::CaptureOutcome FailWith(const CaptureContext& context, const std::string& message,
                                 const fs::path& where) {
  context.logger.Error(message + " " + where.string());
  return outcome::CaptureOutcome::Failed(message);
}

// Agilent ion trap folders must hold a non-empty DATA.MS. Returns true and
// sets `failure` when the capture has to stop.
bool IsIncompleteAgilentIonTrap(const CaptureContext& context, const fs::path& folder,
                                outcome::CaptureOutcome& failure) {
  const std::vector<fs::path> data_ms = core::FindEntries(folder, "DATA.MS", core::EntryKind::kFile);

  std::string problem;
  if (data_ms.empty()) {
    problem = "DATA.MS file not found; incomplete dataset";
  } else {
    std::error_code ec;
    const auto size = fs::file_size(data_ms.front(), ec);
    if (ec) {
      failure = outcome::Classify(
          outcome::CaptureFault{ec.message(), "Exception checking for a DATA.MS file"});
      context.logger.Error("Exception checking for a DATA.MS file at " + folder.string(),
                           {{"error", ec.message()}});
      return true;
    }
    if (size == 0U) {
      problem = "Source directory has a zero-byte DATA.MS file";
    }
  }

  if (problem.empty()) {
    return false;
  }
  if (context.request.allow_incomplete_dataset) {
    context.logger.Warn(problem + " at " + folder.string());
    return false;
  }

  context.logger.Error(problem + " at " + folder.string());
  failure = outcome::CaptureOutcome::Failed(
      problem + "; to ignore this error, use Call cap.add_update_task_parameter (" +
      context.request.job + ", 'JobParameters', 'AllowIncompleteDataset', 'true');");
  return true;
}

std::string FormatScore(const double score) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << score;
  return out.str();
}

bool HasFileNamed(const fs::path& dir, std::string_view name) {
  return core::FindEntries(dir, name, core::EntryKind::kFile).size() == 1U;
}

} // namespace

bool IsDefaultFragmentationProfile(const fs::path& file) {
  std::ifstream input(file);
  if (!input) {
    return false;
  }

  static const std::regex zero_line("^[0, ]+$");
  std::size_t data_lines = 0;
  bool all_zeros = false;
  std::string line;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (core::TrimAscii(line).empty()) {
      continue;
    }
    ++data_lines;
    all_zeros = std::regex_match(line, zero_line);
  }
  return data_lines == 1U && all_zeros;
}

std::size_t DeleteZeroByteBrukerFiles(const fs::path& dataset_dir, core::logging::Logger& logger) {
  std::error_code ec;
  if (!fs::is_directory(dataset_dir, ec)) {
    return 0;
  }

  std::size_t deleted = 0;
  std::string deleted_names;
  for (const fs::path& candidate : core::FindEntries(dataset_dir, "*", core::EntryKind::kFile, true)) {
    const std::string name = candidate.filename().string();
    bool listed = false;
    for (const std::string_view target : kZeroByteBrukerFiles) {
      listed = listed || name == target;
    }
    if (!listed || fs::file_size(candidate, ec) != 0U || ec) {
      continue;
    }
    if (!fs::remove(candidate, ec) || ec) {
      logger.Error("Error in DeleteZeroByteBrukerFiles", {{"path", candidate.string()},
                                                         {"error", ec.message()}});
      continue;
    }
    ++deleted;
    deleted_names += deleted_names.empty() ? name : ", " + name;
  }

  if (deleted > 0U) {
    logger.Warn("Deleted " + std::to_string(deleted) +
                " zero byte files in the dataset directory: " + deleted_names);
  }
  return deleted;
}

outcome::CaptureOutcome FolderWithExtensionCapture::Capture(const CaptureContext& context,
                                                            const DatasetDescriptor& descriptor,
                                                            const fs::path& source_dir,
                                                            const fs::path& dataset_dir) {
  const fs::path source_folder = source_dir / descriptor.entry_name;
  const fs::path target_folder = dataset_dir / descriptor.entry_name;

  outcome::CaptureOutcome failure;
  if (HasIncompleteUimf(context, source_folder, failure)) {
    return failure;
  }
  if (context.request.instrument_class == InstrumentClass::kAgilentIonTrap &&
      IsIncompleteAgilentIonTrap(context, source_folder, failure)) {
    return failure;
  }

  std::vector<std::string> skip_list;
  const bool bruker_dot_d = core::EndsWithIgnoreCase(descriptor.entry_name, ".d");
  if (bruker_dot_d) {
    // Journal files are always locked by the acquisition software.
    FindFilesToSkip(context, source_folder, "*.mcf_idx-journal", "journal file", true, skip_list);
    if (core::EqualsIgnoreCase(context.request.instrument_name, "12T_FTICR_B")) {
      for (const SkipSpec& spec : k12TeslaSkipSpecs) {
        FindFilesToSkip(context, source_folder, spec.pattern, spec.description, true, skip_list);
      }
    }
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

  // Some instruments nest a same-extension folder inside the dataset folder,
  // e.g. Dataset2_20Aug18.d/Dataset2_20Aug18.d.
  fs::path copy_from = source_folder;
  std::string extra_directory;
  const std::string extension = fs::path(descriptor.entry_name).extension().string();
  const std::vector<fs::path> nested =
      extension.empty() ? std::vector<fs::path>{}
                        : core::FindEntries(source_folder, "*" + extension,
                                            core::EntryKind::kDirectory);
  if (nested.size() > 1U) {
    context.logger.Warn("Source directory has multiple subdirectories with extension " + extension +
                        "; see " + source_folder.string());
  } else if (nested.size() == 1U) {
    copy_from = nested.front();
    const std::string nested_name = copy_from.filename().string();
    const double score = CompareNames(descriptor.entry_name, nested_name);
    if (score >= kNestedFolderSimilarityThreshold) {
      context.logger.Debug("Copying files from " + copy_from.string() +
                           " instead of the parent directory; name similarity score: " +
                           FormatScore(score));
    } else {
      context.logger.Warn("Copying files from " + copy_from.string() +
                          " instead of the parent directory; name similarity score: " +
                          FormatScore(score) + ". Will create an empty directory named " +
                          nested_name +
                          " on the storage server since the similarity score is less than " +
                          FormatScore(kNestedFolderSimilarityThreshold));
      extra_directory = nested_name;
    }
  }

  outcome::CaptureOutcome copied = CopyDirectory(context, copy_from, target_folder, true, skip_list);
  if (!copied.succeeded()) {
    context.logger.Error("Copy exception for dataset " + context.request.dataset_name +
                         context.connection_description);
    return copied;
  }

  context.logger.Info("Copied directory " + copy_from.string() + " to " + target_folder.string() +
                      context.connection_description);
  AutoFixFilesWithInvalidChars(context.request.dataset_name, target_folder, context.logger);

  if (!extra_directory.empty() && !core::MakeDirectoryIfMissing(target_folder / extra_directory, error)) {
    context.logger.Warn("Unable to create directory " + (target_folder / extra_directory).string(),
                        {{"error", error}});
  }

  if (bruker_dot_d) {
    DeleteZeroByteBrukerFiles(target_folder, context.logger);
  }
  return outcome::CaptureOutcome::Success();
}

outcome::CaptureOutcome FolderNoExtensionCapture::Capture(const CaptureContext& context,
                                                          const DatasetDescriptor& descriptor,
                                                          const fs::path& source_dir,
                                                          const fs::path& dataset_dir) {
  const fs::path source_folder = source_dir / descriptor.entry_name;
  const InstrumentClass instrument_class = context.request.instrument_class;

  outcome::CaptureOutcome failure;
  if (HasIncompleteUimf(context, source_folder, failure)) {
    return failure;
  }

  const std::vector<fs::path> dot_d = core::FindEntries(source_folder, "*.d", core::EntryKind::kDirectory);
  if (dot_d.size() > 1U) {
    bool allowed = false;
    if (dot_d.size() == 2U) {
      // 15T imaging runs pair a ser folder with an analysis.baf folder.
      int ser_count = 0;
      int baf_count = 0;
      for (const fs::path& folder : dot_d) {
        ser_count += HasFileNamed(folder, "ser") ? 1 : 0;
        baf_count += HasFileNamed(folder, "analysis.baf") ? 1 : 0;
      }
      allowed = ser_count == 1 && baf_count == 1;
    }
    if (instrument_class == InstrumentClass::kBrukerMaldiImagingV2 ||
        instrument_class == InstrumentClass::kTimsTofMaldiImaging) {
      allowed = true;
    }
    if (!allowed) {
      return FailWith(context, "Multiple .d subdirectories found in dataset directory", source_folder);
    }
  }

  if (!core::FindEntries(source_folder, "*.imf", core::EntryKind::kFile).empty()) {
    return FailWith(context,
                    "Dataset directory contains a series of .IMF files -- upload a .UIMF file instead",
                    source_folder);
  }

  std::vector<std::string> skip_list;
  if (instrument_class == InstrumentClass::kImsAgilentTofUimf) {
    const fs::path profile = source_folder / "Fragmentation_Profile.txt";
    std::error_code ec;
    if (fs::is_regular_file(profile, ec) && IsDefaultFragmentationProfile(profile)) {
      context.logger.Info("Skipping capture of default fragmentation profile file, " +
                          profile.string());
      skip_list.push_back(profile.filename().string());
    }
  }

  if (instrument_class == InstrumentClass::kFtBoosterData) {
    FindFilesToSkip(context, source_folder, "*.raw", "Thermo .raw file", true, skip_list);
    FindFilesToSkip(context, source_folder, "chunk*.bin", "chunk .bin file", true, skip_list);
  }

  if (instrument_class == InstrumentClass::kSciexQTrap) {
    if (core::FindEntries(source_folder, "*", core::EntryKind::kDirectory).size() > 2U) {
      return FailWith(context, "Dataset directory has more than 2 subdirectories", source_folder);
    }
    if (core::FindEntries(source_folder, "*.wiff*", core::EntryKind::kFile).empty()) {
      return FailWith(context, "Dataset directory does not contain any .wiff files", source_folder);
    }
  }

  outcome::CaptureOutcome ready = WaitForStableDirectory(context, source_folder);
  if (!ready.succeeded()) {
    return ready;
  }

  outcome::CaptureOutcome copied = CopyDirectory(context, source_folder, dataset_dir, true, skip_list);
  if (!copied.succeeded()) {
    context.logger.Error("Exception copying dataset directory " + source_folder.string() +
                         context.connection_description);
    return copied;
  }

  context.logger.Info("Copied directory " + source_folder.string() + " to " + dataset_dir.string() +
                      context.connection_description);
  AutoFixFilesWithInvalidChars(context.request.dataset_name, dataset_dir, context.logger);
  return outcome::CaptureOutcome::Success();
}

} // namespace dscapture::capture
