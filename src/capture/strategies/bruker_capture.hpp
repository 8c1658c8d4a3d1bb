#pragma once

#include "capture/strategies/capture_strategy.hpp"

#include <string_view>

namespace dscapture::capture {

// MALDI spot subdirectory names such as 0_D4 or 0_E10.
inline constexpr std::string_view kMaldiSpotDirectoryPattern = R"(^\d_[A-Z]\d+$)";

bool IsMaldiSpotDirectoryName(std::string_view name);

// Bruker MALDI imaging folder: only the zipped top-level files are captured.
class BrukerImagingCapture final : public ICaptureStrategy {
public:
  outcome::CaptureOutcome Capture(const CaptureContext& context,
                                  const DatasetDescriptor& descriptor,
                                  const std::filesystem::path& source_dir,
                                  const std::filesystem::path& dataset_dir) override;
};

// Bruker MALDI spot folder: one data subdirectory, or several spot-named ones.
class BrukerSpotCapture final : public ICaptureStrategy {
public:
  outcome::CaptureOutcome Capture(const CaptureContext& context,
                                  const DatasetDescriptor& descriptor,
                                  const std::filesystem::path& source_dir,
                                  const std::filesystem::path& dataset_dir) override;
};

} // namespace dscapture::capture
