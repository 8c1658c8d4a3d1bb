#include "capture/shape_resolver.hpp"

#include "capture/filename_fixer.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

std::string JoinFirstNames(const std::vector<std::string>& names, std::size_t limit) {
  std::string joined;
  for (std::size_t i = 0; i < names.size() && i < limit; ++i) {
    if (i > 0U) {
      joined += ", ";
    }
    joined += names[i];
  }
  return joined;
}

} // namespace

DatasetDescriptor ShapeResolver::Resolve(const fs::path& source_dir, std::string_view entry_name,
                                         const InstrumentClass instrument_class) const {
  DatasetDescriptor descriptor;
  descriptor.dataset_name = std::string(entry_name);

  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    logger_.Error("Source directory not found", {{"path", source_dir.string()}});
    return descriptor;
  }

  bool look_for_files = !PrefersFolderMatch(instrument_class);
  bool matched_folder = false;
  bool matched = false;

  for (int pass = 1; pass <= 4 && !matched; ++pass) {
    if (pass == 3) {
      look_for_files = !look_for_files;
    }
    const bool replace_invalid_chars = pass % 2 == 0;

    if (look_for_files) {
      matched = MatchFiles(source_dir, entry_name, replace_invalid_chars, pass, descriptor);
    } else {
      matched = MatchFolder(source_dir, entry_name, replace_invalid_chars, descriptor);
      matched_folder = matched;
    }
  }

  if (!matched) {
    descriptor.shape = RawDatasetShape::kNone;
    return descriptor;
  }

  // Bruker MALDI folders get their own capture strategies.
  if (matched_folder) {
    if (instrument_class == InstrumentClass::kBrukerMaldiImaging) {
      descriptor.shape = RawDatasetShape::kBrukerImagingFolder;
    } else if (instrument_class == InstrumentClass::kBrukerMaldiSpot) {
      descriptor.shape = RawDatasetShape::kBrukerSpotFolder;
    }
  }

  return descriptor;
}

bool ShapeResolver::MatchFiles(const fs::path& source_dir, std::string_view entry_name,
                               const bool replace_invalid_chars, const int pass,
                               DatasetDescriptor& descriptor) const {
  std::vector<std::string> found;
  for (const fs::path& candidate : core::FindEntries(source_dir, "*", core::EntryKind::kFile)) {
    const std::string name = candidate.filename().string();
    if (replace_invalid_chars) {
      if (core::EqualsIgnoreCase(ReplaceInvalidChars(candidate.stem().string()), entry_name)) {
        found.push_back(name);
      }
      continue;
    }
    if (core::EqualsIgnoreCase(name, entry_name) ||
        core::WildcardMatch(std::string(entry_name) + ".*", name)) {
      found.push_back(name);
    }
  }

  if (found.empty()) {
    return false;
  }

  descriptor.files = found;
  if (found.size() == 1U) {
    descriptor.entry_name = found.front();
    descriptor.shape = RawDatasetShape::kSingleFile;

    const std::string base_name = fs::path(descriptor.entry_name).stem().string();
    for (const std::string_view suffix : {"_*_realtimesearch.tsv", "_*_realtimelibsearch.tsv"}) {
      for (const fs::path& related :
           core::FindEntries(source_dir, base_name + std::string(suffix), core::EntryKind::kFile)) {
        descriptor.related_files.push_back(related.filename().string());
      }
    }
    if (!descriptor.related_files.empty()) {
      logger_.Info("Dataset has realtime search files",
                   {{"path", source_dir.string()},
                    {"files", JoinFirstNames(descriptor.related_files, 5)}});
    }
    return true;
  }

  descriptor.entry_name = descriptor.dataset_name;
  descriptor.shape = RawDatasetShape::kMultiFileGroup;
  logger_.Warn("Dataset name matched multiple files",
               {{"pass", std::to_string(pass)},
                {"path", source_dir.string()},
                {"files", JoinFirstNames(found, 5)}});
  return true;
}

bool ShapeResolver::MatchFolder(const fs::path& source_dir, std::string_view entry_name,
                                const bool replace_invalid_chars,
                                DatasetDescriptor& descriptor) const {
  for (const fs::path& candidate :
       core::FindEntries(source_dir, "*", core::EntryKind::kDirectory)) {
    const std::string name = candidate.filename().string();
    std::string name_to_check = candidate.stem().string();
    if (replace_invalid_chars) {
      name_to_check = ReplaceInvalidChars(name_to_check);
    }
    if (!core::EqualsIgnoreCase(name_to_check, entry_name)) {
      continue;
    }

    descriptor.entry_name = name;
    descriptor.shape = candidate.extension().empty() ? RawDatasetShape::kFolderNoExtension
                                                     : RawDatasetShape::kFolderWithExtension;
    logger_.Debug("Dataset matched directory",
                  {{"directory", name}, {"shape", ToString(descriptor.shape)}});
    return true;
  }
  return false;
}

} // namespace dscapture::capture
