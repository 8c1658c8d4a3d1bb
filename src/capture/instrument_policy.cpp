#include "capture/instrument_policy.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"

#include <vector>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

bool IsThermoClass(const InstrumentClass instrument_class) {
  switch (instrument_class) {
  case InstrumentClass::kFinniganIonTrap:
  case InstrumentClass::kGcQExactive:
  case InstrumentClass::kLtqFt:
  case InstrumentClass::kThermoExactive:
  case InstrumentClass::kTripleQuad:
  case InstrumentClass::kShimadzuGc:
  case InstrumentClass::kThermoSiiLc:
    return true;
  default:
    return false;
  }
}

bool RequiresDotDFolder(const InstrumentClass instrument_class) {
  switch (instrument_class) {
  case InstrumentClass::kBrukerAmazonIonTrap:
  case InstrumentClass::kBrukerFtBaf:
  case InstrumentClass::kBrukerTofBaf:
  case InstrumentClass::kBrukerTofTdf:
  case InstrumentClass::kAgilentIonTrap:
  case InstrumentClass::kAgilentTofV2:
  case InstrumentClass::kPrepHplc:
    return true;
  default:
    return false;
  }
}

// BrukerMALDI_Imaging and BrukerMALDI_Spot folders are refined by the shape
// resolver; the refined shapes still are folders named after the dataset.
bool IsDatasetNamedFolder(const RawDatasetShape shape) {
  return shape == RawDatasetShape::kFolderNoExtension ||
         shape == RawDatasetShape::kBrukerImagingFolder ||
         shape == RawDatasetShape::kBrukerSpotFolder;
}

std::string JoinNames(const std::vector<fs::path>& paths, std::size_t limit) {
  std::string joined;
  for (std::size_t i = 0; i < paths.size() && i < limit; ++i) {
    if (i > 0U) {
      joined += ", ";
    }
    joined += paths[i].filename().string();
  }
  return joined;
}

std::string ValidateThermo(const fs::path& source_dir, const std::string& entity,
                           DatasetDescriptor& descriptor, core::logging::Logger& logger) {
  if (descriptor.shape == RawDatasetShape::kSingleFile) {
    return {};
  }

  if (descriptor.shape == RawDatasetShape::kFolderNoExtension) {
    const fs::path folder = source_dir / descriptor.entry_name;
    const auto raw_files = core::FindEntries(folder, "*.raw", core::EntryKind::kFile);
    if (raw_files.size() == 1U) {
      return {};
    }
    if (raw_files.size() > 1U) {
      logger.Warn("Multiple .raw files found in directory",
                  {{"path", folder.string()}, {"files", JoinNames(raw_files, 5)}});
      return "Dataset name matched " + entity +
             " with multiple .raw files; there must be only one .raw file";
    }
    return "Dataset name matched " + entity + " but it does not have a .raw file";
  }

  if (descriptor.shape == RawDatasetShape::kMultiFileGroup) {
    const auto group = core::FindEntries(source_dir, descriptor.entry_name + ".*",
                                         core::EntryKind::kFile);
    if (group.size() == 2U) {
      bool raw_found = false;
      bool tsv_found = false;
      bool sld_found = false;
      for (const fs::path& file : group) {
        const std::string extension = file.extension().string();
        raw_found = raw_found || core::EqualsIgnoreCase(extension, ".raw");
        tsv_found = tsv_found || core::EqualsIgnoreCase(extension, ".tsv");
        sld_found = sld_found || core::EqualsIgnoreCase(extension, ".sld");
      }

      if (raw_found && tsv_found) {
        logger.Info("Capturing a .raw file with a corresponding .tsv file");
        return {};
      }

      if (raw_found && sld_found) {
        logger.Info("Ignoring sequence file " + descriptor.entry_name + ".sld");
        descriptor.shape = RawDatasetShape::kSingleFile;
        descriptor.entry_name = descriptor.dataset_name + ".raw";
        descriptor.files.assign(1, descriptor.entry_name);
        return {};
      }
    }

    logger.Warn("Dataset name matched multiple files in directory",
                {{"path", source_dir.string()}, {"files", JoinNames(group, 5)}});
  }

  return "Dataset name matched " + entity + "; must be a .raw file";
}

std::string ValidateIms(const fs::path& source_dir, const std::string& entity,
                        const DatasetDescriptor& descriptor, core::logging::Logger& logger) {
  if (descriptor.shape == RawDatasetShape::kSingleFile) {
    return {};
  }

  if (descriptor.shape == RawDatasetShape::kFolderWithExtension &&
      core::EndsWithIgnoreCase(descriptor.entry_name, ".d")) {
    return {};
  }

  if (descriptor.shape == RawDatasetShape::kFolderNoExtension) {
    const fs::path folder = source_dir / descriptor.entry_name;
    const auto uimf_files = core::FindEntries(folder, "*.uimf", core::EntryKind::kFile);
    if (uimf_files.size() == 1U) {
      return {};
    }
    if (uimf_files.size() > 1U) {
      logger.Warn("Multiple .uimf files found in directory",
                  {{"path", folder.string()}, {"files", JoinNames(uimf_files, 5)}});
      return "Dataset name matched " + entity +
             " with multiple .uimf files; there must be only one .uimf file";
    }
    logger.Warn("Directory does not have any .uimf files", {{"path", folder.string()}});
    return "Dataset name matched " + entity + " but it does not have a .uimf file";
  }

  return "Dataset name matched " + entity +
         "; must be a .uimf file, .d directory, or directory with a single .uimf file";
}

} // namespace

bool ValidateWithInstrumentClass(const fs::path& source_dir, const InstrumentClass instrument_class,
                                 DatasetDescriptor& descriptor, core::logging::Logger& logger,
                                 std::string& error) {
  error.clear();
  const std::string entity(DescribeEntity(descriptor.shape));

  if (IsThermoClass(instrument_class)) {
    error = ValidateThermo(source_dir, entity, descriptor, logger);
  } else if (instrument_class == InstrumentClass::kBrukerMaldiImagingV2) {
    if (descriptor.shape != RawDatasetShape::kFolderNoExtension) {
      error = "Dataset name matched " + entity +
              "; must be a directory with the dataset name, and inside the directory is a .D "
              "directory (and typically some jpg files)";
    }
  } else if (RequiresDotDFolder(instrument_class)) {
    if (descriptor.shape != RawDatasetShape::kFolderWithExtension) {
      error = "Dataset name matched " + entity + "; must be a .d directory";
    }
  } else if (instrument_class == InstrumentClass::kBrukerMaldiImaging ||
             instrument_class == InstrumentClass::kBrukerMaldiSpot ||
             instrument_class == InstrumentClass::kFtBoosterData) {
    if (!IsDatasetNamedFolder(descriptor.shape)) {
      error = "Dataset name matched " + entity + "; must be a directory with the dataset name";
    }
  } else if (instrument_class == InstrumentClass::kSciexTripleTof) {
    if (descriptor.shape != RawDatasetShape::kSingleFile) {
      error = "Dataset name matched " + entity + "; must be a file";
    }
  } else if (instrument_class == InstrumentClass::kImsAgilentTofUimf ||
             instrument_class == InstrumentClass::kImsAgilentTofDotD) {
    error = ValidateIms(source_dir, entity, descriptor, logger);
  }

  if (error.empty()) {
    return true;
  }

  logger.Error(error);
  return false;
}

} // namespace dscapture::capture
