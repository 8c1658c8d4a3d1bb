#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dscapture::capture {

// Layout of the raw data found at the source for one dataset.
enum class RawDatasetShape {
  kNone,
  kSingleFile,
  kMultiFileGroup,
  kFolderWithExtension,
  kFolderNoExtension,
  kBrukerImagingFolder,
  kBrukerSpotFolder,
};

std::string_view ToString(RawDatasetShape shape);

// Human phrase used in validation messages: "a file", "a directory", ...
std::string_view DescribeEntity(RawDatasetShape shape);

inline bool IsFolderShape(const RawDatasetShape shape) {
  return shape == RawDatasetShape::kFolderWithExtension ||
         shape == RawDatasetShape::kFolderNoExtension ||
         shape == RawDatasetShape::kBrukerImagingFolder ||
         shape == RawDatasetShape::kBrukerSpotFolder;
}

struct DatasetDescriptor {
  std::string dataset_name;
  // Matched file or folder name under the source directory. For a
  // multi-file group this is the dataset name.
  std::string entry_name;
  RawDatasetShape shape = RawDatasetShape::kNone;
  // Multi-file group members (file names, sorted). For a single file,
  // the one matched name.
  std::vector<std::string> files;
  // Realtime search results written beside a single file:
  //   <base>_*_realtimesearch.tsv, <base>_*_realtimelibsearch.tsv
  std::vector<std::string> related_files;
};

} // namespace dscapture::capture
