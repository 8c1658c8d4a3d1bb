#include "capture/strategies/strategy_factory.hpp"

#include "capture/strategies/bruker_capture.hpp"
#include "capture/strategies/file_capture.hpp"
#include "capture/strategies/folder_capture.hpp"

namespace dscapture::capture {

std::unique_ptr<ICaptureStrategy> CreateCaptureStrategy(const RawDatasetShape shape) {
  switch (shape) {
  case RawDatasetShape::kSingleFile:
  case RawDatasetShape::kMultiFileGroup:
    return std::make_unique<FileCapture>();
  case RawDatasetShape::kFolderWithExtension:
    return std::make_unique<FolderWithExtensionCapture>();
  case RawDatasetShape::kFolderNoExtension:
    return std::make_unique<FolderNoExtensionCapture>();
  case RawDatasetShape::kBrukerImagingFolder:
    return std::make_unique<BrukerImagingCapture>();
  case RawDatasetShape::kBrukerSpotFolder:
    return std::make_unique<BrukerSpotCapture>();
  case RawDatasetShape::kNone:
    break;
  }
  return nullptr;
}

} // namespace dscapture::capture
