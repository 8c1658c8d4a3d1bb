#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

// Applies the auto-fix substitutions to `text`:
//   ' ' -> "_", '%' -> "pct", '.' -> "pt"
std::string ReplaceInvalidChars(std::string_view text);

// Returns a corrected name for `file_name` when fixing its base name makes it
// equal to `dataset_name` (case-insensitive). The extension is preserved.
// Returns `file_name` unchanged otherwise.
std::string AutoFixFilename(std::string_view dataset_name, std::string_view file_name);

// Renames files and folders under `dataset_dir` (recursively) whose names
// auto-fix to the dataset name. Rename failures are logged and skipped.
// Returns the number of items renamed.
std::size_t AutoFixFilesWithInvalidChars(std::string_view dataset_name,
                                         const std::filesystem::path& dataset_dir,
                                         core::logging::Logger& logger);

// Character checks for names coming from job parameters. On failure `error`
// reads "<description> contains an invalid character at index N: c".
bool CheckFileNameChars(std::string_view name, std::string_view description, std::string& error);
bool CheckPathChars(std::string_view path, std::string_view description, std::string& error);

} // namespace dscapture::capture
