#ifndef DSCAPTURE_CORE_PATH_UTILS_HPP_
#define DSCAPTURE_CORE_PATH_UTILS_HPP_

#include "core/string_utils.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace dscapture::core {

// Default mount root under which `\\server\share` UNC paths are reachable.
constexpr std::string_view kDefaultUncMountRoot = "/mnt";

// Maps a job-record path onto the local filesystem.
//
//   \\proto-5\share\dir  -> <unc_mount_root>/proto-5/share/dir
//   E:\instrument\data   -> E:/instrument/data (kept relative to the drive label)
//   /data/x              -> /data/x
//
// Backslashes always become '/'.
inline std::filesystem::path ToLocalPath(std::string_view raw,
                                         const std::filesystem::path& unc_mount_root) {
  if (raw.size() >= 2U && (raw[0] == '\\' || raw[0] == '/') && raw[1] == raw[0]) {
    std::filesystem::path mapped = unc_mount_root;
    for (const std::string& segment : SplitPathSegments(raw)) {
      mapped /= segment;
    }
    return mapped;
  }

  std::string converted(raw);
  for (char& c : converted) {
    if (c == '\\') {
      c = '/';
    }
  }
  return std::filesystem::path(converted);
}

// Appends a relative job-record path (either separator) to `base`.
inline std::filesystem::path AppendRelative(std::filesystem::path base, std::string_view relative) {
  for (const std::string& segment : SplitPathSegments(relative)) {
    base /= segment;
  }
  return base;
}

// Job-record form of <vol><relative>, inserting '/' when `vol` has no
// trailing separator. Used for messages and character checks.
inline std::string CombineRawPath(std::string_view vol, std::string_view relative) {
  std::string combined(vol);
  if (!combined.empty() && combined.back() != '\\' && combined.back() != '/') {
    combined.push_back('/');
  }
  combined += relative;
  return combined;
}

} // namespace dscapture::core

#endif // DSCAPTURE_CORE_PATH_UTILS_HPP_
