#include "capture/dataset_descriptor.hpp"

namespace dscapture::capture {

std::string_view ToString(const RawDatasetShape shape) {
  switch (shape) {
  case RawDatasetShape::kNone:
    return "None";
  case RawDatasetShape::kSingleFile:
    return "File";
  case RawDatasetShape::kMultiFileGroup:
    return "MultiFile";
  case RawDatasetShape::kFolderWithExtension:
    return "DirectoryExt";
  case RawDatasetShape::kFolderNoExtension:
    return "DirectoryNoExt";
  case RawDatasetShape::kBrukerImagingFolder:
    return "BrukerImaging";
  case RawDatasetShape::kBrukerSpotFolder:
    return "BrukerSpot";
  }
  return "None";
}

std::string_view DescribeEntity(const RawDatasetShape shape) {
  switch (shape) {
  case RawDatasetShape::kSingleFile:
    return "a file";
  case RawDatasetShape::kFolderWithExtension:
  case RawDatasetShape::kFolderNoExtension:
  case RawDatasetShape::kBrukerImagingFolder:
  case RawDatasetShape::kBrukerSpotFolder:
    return "a directory";
  case RawDatasetShape::kMultiFileGroup:
    return "multiple files";
  case RawDatasetShape::kNone:
    break;
  }
  return "an unknown entity";
}

} // namespace dscapture::capture
