#pragma once

#include "capture/strategies/capture_strategy.hpp"

#include <filesystem>

namespace dscapture::capture {

// Folder whose name carries an extension (Agilent/Bruker .d, .raw folders).
// The folder itself is recreated under the dataset directory.
class FolderWithExtensionCapture final : public ICaptureStrategy {
public:
  outcome::CaptureOutcome Capture(const CaptureContext& context,
                                  const DatasetDescriptor& descriptor,
                                  const std::filesystem::path& source_dir,
                                  const std::filesystem::path& dataset_dir) override;
};

// Plain folder; its contents become the dataset directory.
class FolderNoExtensionCapture final : public ICaptureStrategy {
public:
  outcome::CaptureOutcome Capture(const CaptureContext& context,
                                  const DatasetDescriptor& descriptor,
                                  const std::filesystem::path& source_dir,
                                  const std::filesystem::path& dataset_dir) override;
};

// True when Fragmentation_Profile.txt holds exactly one non-blank line and
// that line is only zeros, commas and spaces.
bool IsDefaultFragmentationProfile(const std::filesystem::path& file);

// Removes zero-byte ProjectCreationHelper, SyncHelper and lock.file entries
// anywhere under `dataset_dir`. Returns the number deleted.
std::size_t DeleteZeroByteBrukerFiles(const std::filesystem::path& dataset_dir,
                                      core::logging::Logger& logger);

} // namespace dscapture::capture
