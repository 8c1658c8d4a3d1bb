#ifndef DSCAPTURE_CORE_FS_UTILS_HPP_
#define DSCAPTURE_CORE_FS_UTILS_HPP_

#include "core/string_utils.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace dscapture::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

inline bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  const std::filesystem::path parent_dir = output_path.parent_path();
  if (parent_dir.empty()) {
    return true;
  }

  std::error_code ec;
  std::filesystem::create_directories(parent_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + parent_dir.string() + "': " + ec.message();
    return false;
  }

  return true;
}

// Creates `dir` (and parents) when absent. An existing non-directory at the
// path is an error.
inline bool MakeDirectoryIfMissing(const std::filesystem::path& dir, std::string& error) {
  std::error_code ec;
  if (std::filesystem::is_directory(dir, ec)) {
    return true;
  }
  if (std::filesystem::exists(dir, ec)) {
    error = "path exists but is not a directory: " + dir.string();
    return false;
  }

  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Writes the full text to a temporary sibling, then renames it over the
// destination so readers never observe a partial file. Falls back to
// remove+rename where rename-over-existing is refused.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  const std::filesystem::path temp_path = detail::BuildAtomicTempPath(output_path);
  {
    std::ofstream out_file(temp_path, std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp_path.string() + "'";
      return false;
    }

    out_file << text;
    if (!out_file) {
      error = "failed while writing temp output file '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp_path, output_path, rename_ec);
  if (!rename_ec) {
    return true;
  }

  std::error_code cleanup_ec;
  (void)std::filesystem::remove(temp_path, cleanup_ec);
  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

inline bool ReadTextFile(const std::filesystem::path& path, std::string& text, std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to open file: " + path.string();
    return false;
  }
  text.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file: " + path.string();
    return false;
  }
  return true;
}

// Recursive size summary of a directory tree.
struct DirectoryStats {
  std::uint64_t file_count = 0;
  std::uint64_t directory_count = 0;
  std::uint64_t total_bytes = 0;
  std::uint64_t largest_file_bytes = 0;
  std::filesystem::path largest_file;
  std::optional<std::filesystem::file_time_type> newest_write_time;
};

inline bool MeasureDirectory(const std::filesystem::path& root, DirectoryStats& stats,
                             std::string& error) {
  stats = DirectoryStats{};
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(root, ec);
  if (ec) {
    error = "unable to enumerate '" + root.string() + "': " + ec.message();
    return false;
  }

  const std::filesystem::recursive_directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      error = "unable to enumerate '" + root.string() + "': " + ec.message();
      return false;
    }

    const auto& entry = *it;
    std::error_code entry_ec;
    const auto write_time = entry.last_write_time(entry_ec);
    if (!entry_ec && (!stats.newest_write_time || write_time > *stats.newest_write_time)) {
      stats.newest_write_time = write_time;
    }

    if (entry.is_directory(entry_ec)) {
      ++stats.directory_count;
      continue;
    }
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }

    const std::uint64_t size = entry.file_size(entry_ec);
    if (entry_ec) {
      error = "unable to read size of '" + entry.path().string() + "': " + entry_ec.message();
      return false;
    }
    ++stats.file_count;
    stats.total_bytes += size;
    if (stats.largest_file.empty() || size > stats.largest_file_bytes) {
      stats.largest_file_bytes = size;
      stats.largest_file = entry.path();
    }
  }

  if (ec) {
    error = "unable to enumerate '" + root.string() + "': " + ec.message();
    return false;
  }
  return true;
}

enum class EntryKind {
  kFile,
  kDirectory,
  kAny,
};

// Entries under `dir` whose file name matches the wildcard `pattern`
// (case-insensitive, '*' and '?'), sorted by path. Unreadable directories
// yield no entries.
inline std::vector<std::filesystem::path> FindEntries(const std::filesystem::path& dir,
                                                      std::string_view pattern, EntryKind kind,
                                                      bool recursive = false) {
  std::vector<std::filesystem::path> found;
  const auto accept = [&](const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    const bool is_dir = entry.is_directory(ec);
    if (kind == EntryKind::kFile && (is_dir || !entry.is_regular_file(ec))) {
      return;
    }
    if (kind == EntryKind::kDirectory && !is_dir) {
      return;
    }
    if (WildcardMatch(pattern, entry.path().filename().string())) {
      found.push_back(entry.path());
    }
  };

  std::error_code ec;
  if (recursive) {
    std::filesystem::recursive_directory_iterator it(dir, ec);
    for (const std::filesystem::recursive_directory_iterator end{}; !ec && it != end;
         it.increment(ec)) {
      accept(*it);
    }
  } else {
    std::filesystem::directory_iterator it(dir, ec);
    for (const std::filesystem::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
      accept(*it);
    }
  }

  std::sort(found.begin(), found.end());
  return found;
}

} // namespace dscapture::core

#endif // DSCAPTURE_CORE_FS_UTILS_HPP_
