#pragma once

#include "capture/strategies/capture_strategy.hpp"

#include <cstdint>

namespace dscapture::capture {

// Files above this size always take the resumable path.
constexpr std::uint64_t kCopyWithResumeThresholdBytes = 500ULL * 1024ULL * 1024ULL;

// Single file or a group of files sharing the dataset base name. Every file
// gets its own readiness wait, run concurrently; all must be stable before
// anything is copied.
class FileCapture final : public ICaptureStrategy {
public:
  outcome::CaptureOutcome Capture(const CaptureContext& context,
                                  const DatasetDescriptor& descriptor,
                                  const std::filesystem::path& source_dir,
                                  const std::filesystem::path& dataset_dir) override;
};

} // namespace dscapture::capture
