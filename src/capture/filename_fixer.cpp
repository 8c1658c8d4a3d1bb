#include "capture/filename_fixer.hpp"

#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

struct AutoFix {
  char find;
  std::string_view replacement;
};

constexpr std::array<AutoFix, 3> kAutoFixes{{
    {' ', "_"},
    {'%', "pct"},
    {'.', "pt"},
}};

constexpr std::string_view kInvalidFileNameChars("\0/\\:*?\"<>|", 10);
constexpr std::string_view kInvalidPathChars("\0\"<>|", 5);

std::string ReplaceAll(std::string text, char find, std::string_view replacement) {
  std::string result;
  result.reserve(text.size());
  for (const char c : text) {
    if (c == find) {
      result.append(replacement);
    } else {
      result.push_back(c);
    }
  }
  return result;
}

std::string StemOf(std::string_view name) {
  return fs::path(std::string(name)).stem().string();
}

std::string ExtensionOf(std::string_view name) {
  return fs::path(std::string(name)).extension().string();
}

bool CheckChars(std::string_view text, std::string_view invalid, std::string_view description,
                std::string& error) {
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (invalid.find(text[i]) != std::string_view::npos) {
      error = std::string(description) + " contains an invalid character at index " +
              std::to_string(i) + ": " + std::string(1, text[i]);
      return false;
    }
  }
  return true;
}

bool NeedsFixCheck(const fs::path& path) {
  const std::string name = path.filename().string();
  if (name.find(' ') != std::string::npos || name.find('%') != std::string::npos) {
    return true;
  }
  return path.stem().string().find('.') != std::string::npos;
}

} // namespace

std::string ReplaceInvalidChars(std::string_view text) {
  std::string updated(text);
  for (const AutoFix& fix : kAutoFixes) {
    updated = ReplaceAll(std::move(updated), fix.find, fix.replacement);
  }
  return updated;
}

std::string AutoFixFilename(std::string_view dataset_name, std::string_view file_name) {
  const bool has_fixable = std::any_of(kAutoFixes.begin(), kAutoFixes.end(), [&](const AutoFix& fix) {
    return file_name.find(fix.find) != std::string_view::npos;
  });
  if (!has_fixable) {
    return std::string(file_name);
  }

  const std::string extension = ExtensionOf(file_name);
  std::string updated(file_name);

  for (const AutoFix& fix : kAutoFixes) {
    const std::string base_name = StemOf(updated);
    if (base_name.find(fix.find) == std::string::npos) {
      continue;
    }
    updated = ReplaceAll(base_name, fix.find, fix.replacement) + extension;
  }

  if (core::EqualsIgnoreCase(StemOf(updated), dataset_name)) {
    return updated;
  }
  return std::string(file_name);
}

std::size_t AutoFixFilesWithInvalidChars(std::string_view dataset_name, const fs::path& dataset_dir,
                                         core::logging::Logger& logger) {
  std::vector<fs::path> candidates;
  std::error_code ec;
  fs::recursive_directory_iterator it(dataset_dir, ec);
  if (ec) {
    logger.Warn("Unable to scan directory for invalid characters",
                {{"path", dataset_dir.string()}, {"error", ec.message()}});
    return 0;
  }
  for (const fs::recursive_directory_iterator end{}; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (NeedsFixCheck(it->path())) {
      candidates.push_back(it->path());
    }
  }

  // Deepest paths first so renaming a folder never invalidates a pending child.
  std::sort(candidates.begin(), candidates.end(), [](const fs::path& a, const fs::path& b) {
    const auto depth_a = std::distance(a.begin(), a.end());
    const auto depth_b = std::distance(b.begin(), b.end());
    if (depth_a != depth_b) {
      return depth_a > depth_b;
    }
    return a < b;
  });

  std::size_t renamed = 0;
  for (const fs::path& source : candidates) {
    const std::string current_name = source.filename().string();
    const std::string updated_name = AutoFixFilename(dataset_name, current_name);
    if (core::EqualsIgnoreCase(current_name, updated_name)) {
      continue;
    }

    logger.Info("Renaming '" + current_name + "' to '" + updated_name +
                "' to remove invalid characters");

    const fs::path target = source.parent_path() / updated_name;
    std::error_code rename_ec;
    fs::rename(source, target, rename_ec);
    if (rename_ec) {
      logger.Error("Error renaming file", {{"source", source.string()},
                                           {"target", target.string()},
                                           {"error", rename_ec.message()}});
      continue;
    }
    ++renamed;
  }
  return renamed;
}

bool CheckFileNameChars(std::string_view name, std::string_view description, std::string& error) {
  return CheckChars(name, kInvalidFileNameChars, description, error);
}

bool CheckPathChars(std::string_view path, std::string_view description, std::string& error) {
  return CheckChars(path, kInvalidPathChars, description, error);
}

} // namespace dscapture::capture
