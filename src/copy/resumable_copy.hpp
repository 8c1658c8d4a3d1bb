#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::copy {

// Suffix of the in-progress file a resumable copy streams into.
inline constexpr std::string_view kFilePartSuffix = ".#FilePart#";
// Sidecar recording the source length and modification time a part file was
// started from.
inline constexpr std::string_view kFilePartInfoSuffix = ".#FilePartInfo#";
constexpr std::size_t kResumeChunkBytes = 1024U * 1024U;

enum class CopyFault {
  kNone = 0,
  kTransient,
  kAccessDenied,
  kNotFound,
};

const char* ToStableCode(CopyFault fault);

// Where a copy was when it stopped. Only faults raised while streaming chunks
// are candidates for an automatic resume.
enum class CopyPhase {
  kIdle = 0,
  kPlainCopy,
  kBufferedCopy,
  kBufferedCopyResume,
};

enum class OverwriteMode {
  kAlways = 0,
  kIfDateOrLengthDiffer,
  kNever,
};

// Consulted before each chunk of a buffered copy and before each plain copy.
// Returning anything other than kNone aborts the file with `detail`.
using FaultInjector =
    std::function<CopyFault(const std::filesystem::path& source, std::uint64_t offset, std::string& detail)>;

struct CopyOptions {
  bool recurse = true;
  bool resume = false;
  OverwriteMode overwrite = OverwriteMode::kIfDateOrLengthDiffer;
  // File names (wildcards allowed) that are never copied.
  std::vector<std::string> skip_list;
  std::size_t chunk_bytes = kResumeChunkBytes;
  FaultInjector fault_injector;
};

struct FileCopyResult {
  bool copied = false;
  bool resumed = false;
  CopyFault fault = CopyFault::kNone;
  CopyPhase phase = CopyPhase::kIdle;
  std::string error;

  bool ok() const {
    return fault == CopyFault::kNone;
  }
};

struct TreeCopyStats {
  std::uint64_t skipped = 0;
  std::uint64_t resumed = 0;
  std::uint64_t newly_copied = 0;
};

struct TreeCopyResult {
  bool success = false;
  TreeCopyStats stats;
  CopyFault fault = CopyFault::kNone;
  CopyPhase phase = CopyPhase::kIdle;
  // File being copied when the fault happened; empty for directory-level faults.
  std::filesystem::path current_file;
  std::string error;
};

// True when both files exist with equal length and modification time.
bool SameLengthAndDate(const std::filesystem::path& source, const std::filesystem::path& target);

// Plain copy; the target receives the source modification time.
FileCopyResult CopyFile(const std::filesystem::path& source, const std::filesystem::path& target,
                        bool overwrite, const CopyOptions& options = {});

// Streams into <target>.#FilePart# in chunks, appending only the missing tail
// when a part file is already present, then renames it into place. A part
// file whose .#FilePartInfo# sidecar is missing or names a different source
// length or modification time is discarded and the copy restarts at 0.
FileCopyResult CopyFileWithResume(const std::filesystem::path& source,
                                  const std::filesystem::path& target,
                                  const CopyOptions& options = {});

TreeCopyResult CopyTree(const std::filesystem::path& source_dir,
                        const std::filesystem::path& target_dir, const CopyOptions& options);

struct CopyRetryPolicy {
  // A mid-stream fault only earns a retry once the attempt has run this long.
  std::chrono::seconds retry_threshold{10};
  std::uint32_t max_attempts = 2;
  std::chrono::hours max_window{6};
};

struct TreeCopyRetryResult {
  TreeCopyResult last;
  std::uint32_t attempts = 0;
  // Short closeout message; empty on success.
  std::string message;
  // Underlying fault text for classification.
  std::string detail;
};

// Bounded retry around CopyTree. `connection_description` is appended to the
// copy log lines, e.g. " as user host\\svc using legacy share connector".
TreeCopyRetryResult CopyTreeWithRetry(const std::filesystem::path& source_dir,
                                      const std::filesystem::path& target_dir,
                                      const CopyOptions& options, const CopyRetryPolicy& policy,
                                      std::string_view connection_description,
                                      core::logging::Logger& logger);

// "Error while copying <file>: <detail>" with the detail cut to 350 characters.
std::string FormatCopyFaultMessage(const TreeCopyResult& result);

} // namespace dscapture::copy
