#include "copy/resumable_copy.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/string_utils.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace dscapture::copy {

namespace {

constexpr std::size_t kMaxFaultDetailChars = 350U;

CopyFault FaultFromErrorCode(const std::error_code& ec) {
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return CopyFault::kAccessDenied;
  }
  if (ec == std::errc::no_such_file_or_directory) {
    return CopyFault::kNotFound;
  }
  return CopyFault::kTransient;
}

CopyFault FaultFromErrno(const int error_number) {
  return FaultFromErrorCode(std::error_code(error_number, std::generic_category()));
}

FileCopyResult Fail(FileCopyResult result, const CopyFault fault, std::string error) {
  result.fault = fault;
  result.error = std::move(error);
  return result;
}

bool IsSkipped(const std::vector<std::string>& skip_list, const std::string& file_name) {
  for (const std::string& pattern : skip_list) {
    if (core::WildcardMatch(pattern, file_name)) {
      return true;
    }
  }
  return false;
}

bool StampWriteTime(const fs::path& source, const fs::path& target, std::error_code& ec) {
  const auto write_time = fs::last_write_time(source, ec);
  if (ec) {
    return false;
  }
  fs::last_write_time(target, write_time, ec);
  return !ec;
}

std::string DescribeSourceVersion(const std::uint64_t size, const fs::file_time_type write_time) {
  std::ostringstream out;
  out << "length=" << size << " mtime=" << write_time.time_since_epoch().count() << '\n';
  return out.str();
}

// True when the sidecar exists and records exactly `expected`.
bool PartInfoMatches(const fs::path& info_path, const std::string& expected) {
  std::error_code ec;
  if (!fs::is_regular_file(info_path, ec)) {
    return false;
  }
  std::string recorded;
  std::string error;
  if (!core::ReadTextFile(info_path, recorded, error)) {
    return false;
  }
  return recorded == expected;
}

CopyFault Inject(const CopyOptions& options, const fs::path& source, const std::uint64_t offset,
                 std::string& detail) {
  if (!options.fault_injector) {
    return CopyFault::kNone;
  }
  return options.fault_injector(source, offset, detail);
}

} // namespace

const char* ToStableCode(const CopyFault fault) {
  switch (fault) {
  case CopyFault::kNone:
    return "COPY_OK";
  case CopyFault::kTransient:
    return "COPY_FAULT_TRANSIENT";
  case CopyFault::kAccessDenied:
    return "COPY_FAULT_ACCESS_DENIED";
  case CopyFault::kNotFound:
    return "COPY_FAULT_NOT_FOUND";
  }
  return "COPY_FAULT_TRANSIENT";
}

bool SameLengthAndDate(const fs::path& source, const fs::path& target) {
  std::error_code ec;
  if (!fs::is_regular_file(target, ec)) {
    return false;
  }
  const auto source_size = fs::file_size(source, ec);
  if (ec) {
    return false;
  }
  const auto target_size = fs::file_size(target, ec);
  if (ec || source_size != target_size) {
    return false;
  }
  const auto source_time = fs::last_write_time(source, ec);
  if (ec) {
    return false;
  }
  const auto target_time = fs::last_write_time(target, ec);
  return !ec && source_time == target_time;
}

FileCopyResult CopyFile(const fs::path& source, const fs::path& target, const bool overwrite,
                        const CopyOptions& options) {
  FileCopyResult result;
  result.phase = CopyPhase::kPlainCopy;

  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    return Fail(result, CopyFault::kNotFound, "source file not found at " + source.string());
  }

  std::string detail;
  const CopyFault injected = Inject(options, source, 0U, detail);
  if (injected != CopyFault::kNone) {
    return Fail(result, injected, detail);
  }

  const auto copy_options =
      overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
  fs::copy_file(source, target, copy_options, ec);
  if (ec) {
    return Fail(result, FaultFromErrorCode(ec), ec.message());
  }
  if (!StampWriteTime(source, target, ec)) {
    return Fail(result, FaultFromErrorCode(ec), "unable to set modification time: " + ec.message());
  }

  result.copied = true;
  result.phase = CopyPhase::kIdle;
  return result;
}

FileCopyResult CopyFileWithResume(const fs::path& source, const fs::path& target,
                                  const CopyOptions& options) {
  FileCopyResult result;

  std::error_code ec;
  if (!fs::is_regular_file(source, ec)) {
    return Fail(result, CopyFault::kNotFound, "source file not found at " + source.string());
  }
  if (SameLengthAndDate(source, target)) {
    return result;
  }

  const std::uint64_t source_size = fs::file_size(source, ec);
  if (ec) {
    return Fail(result, FaultFromErrorCode(ec), ec.message());
  }

  const auto source_time = fs::last_write_time(source, ec);
  if (ec) {
    return Fail(result, FaultFromErrorCode(ec), ec.message());
  }
  const std::string source_version = DescribeSourceVersion(source_size, source_time);

  const fs::path part_path = fs::path(target.string() + std::string(kFilePartSuffix));
  const fs::path info_path = fs::path(target.string() + std::string(kFilePartInfoSuffix));
  std::uint64_t offset = 0;
  if (fs::is_regular_file(part_path, ec)) {
    offset = fs::file_size(part_path, ec);
    if (ec || offset > source_size || !PartInfoMatches(info_path, source_version)) {
      // Left by an attempt against a different version of the source.
      offset = 0;
      fs::remove(part_path, ec);
    }
  }
  if (offset == 0U) {
    std::string error;
    if (!core::WriteTextFileAtomic(info_path, source_version, error)) {
      return Fail(result, CopyFault::kTransient,
                  "unable to write " + info_path.filename().string() + ": " + error);
    }
  }
  result.resumed = offset > 0U;
  result.phase = result.resumed ? CopyPhase::kBufferedCopyResume : CopyPhase::kBufferedCopy;

  std::ifstream input(source, std::ios::binary);
  if (!input) {
    const int error_number = errno;
    return Fail(result, FaultFromErrno(error_number),
                "unable to open source file: " + std::string(std::strerror(error_number)));
  }
  input.seekg(static_cast<std::streamoff>(offset));

  const auto mode = result.resumed ? (std::ios::binary | std::ios::app)
                                   : (std::ios::binary | std::ios::trunc);
  std::ofstream output(part_path, mode);
  if (!output) {
    const int error_number = errno;
    return Fail(result, FaultFromErrno(error_number),
                "unable to open " + part_path.filename().string() + ": " +
                    std::strerror(error_number));
  }

  std::vector<char> buffer(options.chunk_bytes == 0U ? kResumeChunkBytes : options.chunk_bytes);
  while (offset < source_size) {
    std::string detail;
    const CopyFault injected = Inject(options, source, offset, detail);
    if (injected != CopyFault::kNone) {
      output.flush();
      return Fail(result, injected, detail);
    }

    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const std::streamsize got = input.gcount();
    if (got <= 0) {
      return Fail(result, CopyFault::kTransient,
                  "unexpected end of file at byte " + std::to_string(offset));
    }
    output.write(buffer.data(), got);
    if (!output) {
      return Fail(result, CopyFault::kTransient,
                  "write failed at byte " + std::to_string(offset));
    }
    offset += static_cast<std::uint64_t>(got);
  }

  output.close();
  if (!output) {
    return Fail(result, CopyFault::kTransient, "unable to close " + part_path.filename().string());
  }
  input.close();

  fs::remove(target, ec);
  ec.clear();
  fs::rename(part_path, target, ec);
  if (ec) {
    return Fail(result, FaultFromErrorCode(ec),
                "unable to rename " + part_path.filename().string() + ": " + ec.message());
  }
  if (!StampWriteTime(source, target, ec)) {
    return Fail(result, FaultFromErrorCode(ec), "unable to set modification time: " + ec.message());
  }
  // A leftover sidecar never matches a later part file on its own.
  fs::remove(info_path, ec);

  result.copied = true;
  result.phase = CopyPhase::kIdle;
  return result;
}

TreeCopyResult CopyTree(const fs::path& source_dir, const fs::path& target_dir,
                        const CopyOptions& options) {
  TreeCopyResult result;

  std::error_code ec;
  if (!fs::is_directory(source_dir, ec)) {
    result.fault = CopyFault::kNotFound;
    result.error = "source directory not found: " + source_dir.string();
    return result;
  }

  fs::create_directories(target_dir, ec);
  if (ec) {
    result.fault = FaultFromErrorCode(ec);
    result.error = "unable to create " + target_dir.string() + ": " + ec.message();
    return result;
  }

  std::vector<fs::directory_entry> entries;
  if (options.recurse) {
    fs::recursive_directory_iterator it(source_dir, ec);
    for (const fs::recursive_directory_iterator end{}; !ec && it != end; it.increment(ec)) {
      entries.push_back(*it);
    }
  } else {
    fs::directory_iterator it(source_dir, ec);
    for (const fs::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
      entries.push_back(*it);
    }
  }
  if (ec) {
    result.fault = FaultFromErrorCode(ec);
    result.error = "unable to enumerate " + source_dir.string() + ": " + ec.message();
    return result;
  }

  for (const fs::directory_entry& entry : entries) {
    const fs::path relative = entry.path().lexically_relative(source_dir);
    const fs::path target = target_dir / relative;

    std::error_code type_ec;
    if (entry.is_directory(type_ec)) {
      if (options.recurse) {
        fs::create_directories(target, ec);
        if (ec) {
          result.fault = FaultFromErrorCode(ec);
          result.current_file = entry.path();
          result.error = ec.message();
          return result;
        }
      }
      continue;
    }
    if (!entry.is_regular_file(type_ec)) {
      continue;
    }
    if (IsSkipped(options.skip_list, entry.path().filename().string())) {
      continue;
    }

    fs::create_directories(target.parent_path(), ec);

    const bool target_exists = fs::exists(target, type_ec);
    if (target_exists && options.overwrite == OverwriteMode::kNever) {
      ++result.stats.skipped;
      continue;
    }
    if (target_exists && options.overwrite == OverwriteMode::kIfDateOrLengthDiffer &&
        SameLengthAndDate(entry.path(), target)) {
      ++result.stats.skipped;
      continue;
    }

    const FileCopyResult file_result = options.resume
                                           ? CopyFileWithResume(entry.path(), target, options)
                                           : CopyFile(entry.path(), target, true, options);
    if (!file_result.ok()) {
      result.fault = file_result.fault;
      result.phase = file_result.phase;
      result.current_file = entry.path();
      result.error = file_result.error;
      return result;
    }

    if (file_result.resumed) {
      ++result.stats.resumed;
    } else if (file_result.copied) {
      ++result.stats.newly_copied;
    } else {
      ++result.stats.skipped;
    }
  }

  result.success = true;
  return result;
}

std::string FormatCopyFaultMessage(const TreeCopyResult& result) {
  const std::string what = result.current_file.empty() ? "directory"
                                                       : result.current_file.string();
  std::string message = result.fault == CopyFault::kAccessDenied
                            ? "Access denied while copying " + what + ": "
                            : "Error while copying " + what + ": ";
  message += result.error.substr(0, kMaxFaultDetailChars);
  return message;
}

TreeCopyRetryResult CopyTreeWithRetry(const fs::path& source_dir, const fs::path& target_dir,
                                      const CopyOptions& options, const CopyRetryPolicy& policy,
                                      const std::string_view connection_description,
                                      core::logging::Logger& logger) {
  TreeCopyRetryResult outcome;
  const auto window_start = std::chrono::steady_clock::now();

  while (true) {
    if (std::chrono::steady_clock::now() - window_start > policy.max_window) {
      outcome.message = "Aborting tree copy since over " +
                        std::to_string(policy.max_window.count()) + " hours has elapsed";
      outcome.detail = outcome.message;
      logger.Error(outcome.message);
      return outcome;
    }

    ++outcome.attempts;
    const auto attempt_start = std::chrono::steady_clock::now();
    outcome.last = CopyTree(source_dir, target_dir, options);

    if (outcome.last.success) {
      logger.Debug("directory copy complete",
                   {{"count_copied", std::to_string(outcome.last.stats.newly_copied)},
                    {"count_skipped", std::to_string(outcome.last.stats.skipped)},
                    {"count_resumed", std::to_string(outcome.last.stats.resumed)},
                    {"attempts", std::to_string(outcome.attempts)}});
      outcome.message.clear();
      outcome.detail.clear();
      return outcome;
    }

    outcome.message = FormatCopyFaultMessage(outcome.last);
    outcome.detail = outcome.last.error;
    logger.Error(outcome.message + std::string(connection_description),
                 {{"fault", ToStableCode(outcome.last.fault)},
                  {"attempt", std::to_string(outcome.attempts)}});

    const bool mid_stream = outcome.last.phase == CopyPhase::kBufferedCopy ||
                            outcome.last.phase == CopyPhase::kBufferedCopyResume;
    if (outcome.last.fault != CopyFault::kTransient || !mid_stream ||
        outcome.attempts >= policy.max_attempts) {
      return outcome;
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - attempt_start);
    if (elapsed < policy.retry_threshold) {
      return outcome;
    }
    logger.Info(std::to_string(elapsed.count()) +
                " seconds have elapsed; will attempt to resume copy");
  }
}

} // namespace dscapture::copy
