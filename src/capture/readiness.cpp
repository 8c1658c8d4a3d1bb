#include "capture/readiness.hpp"

#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace dscapture::capture {

namespace {

constexpr double kAgedItemDaysMinimum = 10.0;
constexpr double kAgedItemDaysMaximum = 30.0;
constexpr auto kStatusMessageInterval = std::chrono::seconds(5);

} // namespace

int ClampSleepSeconds(const int sleep_seconds) {
  return std::clamp(sleep_seconds, kMinReadinessSleepSeconds, kMaxReadinessSleepSeconds);
}

int ComputeAgedSleepInterval(const double age_days, const int base_interval_seconds,
                             const int minimum_seconds) {
  if (age_days < kAgedItemDaysMinimum) {
    return base_interval_seconds;
  }
  if (age_days > kAgedItemDaysMaximum) {
    return minimum_seconds;
  }

  const double scaling = (kAgedItemDaysMaximum - age_days) /
                         (kAgedItemDaysMaximum - kAgedItemDaysMinimum);
  const int maximum_seconds = std::max(base_interval_seconds, minimum_seconds);
  const double sleep_seconds = scaling * (maximum_seconds - minimum_seconds) + minimum_seconds;
  return static_cast<int>(std::lround(sleep_seconds));
}

int ReadinessDetector::SleepIntervalForFile(const fs::path& file) const {
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return kMinAgedSleepSeconds;
  }
  const auto write_time = fs::last_write_time(file, ec);
  if (ec) {
    logger_.Error("Error in SleepIntervalForFile", {{"path", file.string()}, {"error", ec.message()}});
    return base_interval_seconds_;
  }
  return ComputeAgedSleepInterval(core::AgeInDays(write_time), base_interval_seconds_);
}

int ReadinessDetector::SleepIntervalForDirectory(const fs::path& dir) const {
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    return kMinAgedSleepSeconds;
  }

  core::DirectoryStats stats;
  std::string error;
  if (!core::MeasureDirectory(dir, stats, error)) {
    logger_.Error("Error in SleepIntervalForDirectory", {{"path", dir.string()}, {"error", error}});
    return base_interval_seconds_;
  }
  if (!stats.newest_write_time) {
    return kMinAgedSleepSeconds;
  }
  return ComputeAgedSleepInterval(core::AgeInDays(*stats.newest_write_time), base_interval_seconds_);
}

void ReadinessDetector::SleepWithStatus(const int sleep_seconds,
                                        const std::string& item_description) const {
  logger_.Debug("Monitoring " + item_description + " for " + std::to_string(sleep_seconds) +
                " seconds");

  const auto start = std::chrono::steady_clock::now();
  const auto end_time = start + std::chrono::seconds(sleep_seconds);
  auto next_status = start + kStatusMessageInterval;

  while (std::chrono::steady_clock::now() < end_time) {
    std::this_thread::sleep_for(poll_interval_);

    const auto now = std::chrono::steady_clock::now();
    if (now <= next_status) {
      continue;
    }
    next_status += kStatusMessageInterval;
    const auto remaining = std::chrono::duration_cast<std::chrono::seconds>(end_time - now);
    logger_.Debug(std::to_string(std::max<long long>(0, remaining.count())) + " seconds remaining");
  }
}

ReadinessCheck ReadinessDetector::CheckFile(const fs::path& file, int sleep_seconds) const {
  sleep_seconds = ClampSleepSeconds(sleep_seconds);

  ReadinessCheck check;
  std::error_code ec;
  if (!fs::exists(file, ec)) {
    check.stable = true;
    return check;
  }

  const std::uintmax_t initial_size = fs::file_size(file, ec);
  if (ec) {
    logger_.Error("Exception validating constant file size",
                  {{"path", file.string()}, {"error", ec.message()}});
    check.fault = outcome::CaptureFault{ec.message(), "Exception validating constant file size"};
    return check;
  }

  SleepWithStatus(sleep_seconds, "file " + file.filename().string());

  const std::uintmax_t final_size = fs::file_size(file, ec);
  if (ec) {
    logger_.Error("Exception validating constant file size",
                  {{"path", file.string()}, {"error", ec.message()}});
    check.fault = outcome::CaptureFault{ec.message(), "Exception validating constant file size"};
    return check;
  }

  if (initial_size == final_size) {
    check.stable = true;
    return check;
  }

  check.message = "File size changed from " + std::to_string(initial_size) + " bytes to " +
                  std::to_string(final_size) + " bytes: " + file.string();
  logger_.Warn(check.message);
  return check;
}

ReadinessCheck ReadinessDetector::CheckDirectory(const fs::path& dir, int sleep_seconds) const {
  sleep_seconds = ClampSleepSeconds(sleep_seconds);

  ReadinessCheck check;
  core::DirectoryStats initial;
  std::string error;
  if (!core::MeasureDirectory(dir, initial, error)) {
    logger_.Error("Exception validating constant directory size",
                  {{"path", dir.string()}, {"error", error}});
    check.fault = outcome::CaptureFault{error, "Exception validating constant directory size"};
    return check;
  }

  SleepWithStatus(sleep_seconds, "directory " + dir.filename().string());

  core::DirectoryStats final_stats;
  if (!core::MeasureDirectory(dir, final_stats, error)) {
    logger_.Error("Exception validating constant directory size",
                  {{"path", dir.string()}, {"error", error}});
    check.fault = outcome::CaptureFault{error, "Exception validating constant directory size"};
    return check;
  }

  if (initial.total_bytes == final_stats.total_bytes) {
    check.stable = true;
    return check;
  }

  check.message = "Directory size changed from " + std::to_string(initial.total_bytes) +
                  " bytes to " + std::to_string(final_stats.total_bytes) + " bytes: " +
                  dir.string();
  logger_.Warn(check.message);
  return check;
}

} // namespace dscapture::capture
