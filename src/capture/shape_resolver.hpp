#pragma once

#include "capture/dataset_descriptor.hpp"
#include "capture/instrument_class.hpp"

#include <filesystem>
#include <string_view>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

// Discovers how a dataset's raw data is laid out under `source_dir`.
//
// Four passes, stopping at the first hit:
//   1) primary kind, exact name
//   2) primary kind, candidate names with invalid characters replaced
//   3) other kind, exact name
//   4) other kind, invalid characters replaced
// The primary kind is folders for folder-first instrument classes and files
// otherwise. Name comparisons are case-insensitive. A missing source
// directory resolves to kNone without scanning.
class ShapeResolver {
public:
  explicit ShapeResolver(core::logging::Logger& logger) : logger_(logger) {}

  DatasetDescriptor Resolve(const std::filesystem::path& source_dir, std::string_view entry_name,
                            InstrumentClass instrument_class) const;

private:
  bool MatchFiles(const std::filesystem::path& source_dir, std::string_view entry_name,
                  bool replace_invalid_chars, int pass, DatasetDescriptor& descriptor) const;
  bool MatchFolder(const std::filesystem::path& source_dir, std::string_view entry_name,
                   bool replace_invalid_chars, DatasetDescriptor& descriptor) const;

  core::logging::Logger& logger_;
};

} // namespace dscapture::capture
