#ifndef DSCAPTURE_CORE_TIME_UTILS_HPP_
#define DSCAPTURE_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>

namespace dscapture::core {

// UTC timestamp used by log lines and outcome records. Millisecond precision.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Local calendar breakdown of a wall-clock instant. Returns false when the
// platform conversion fails.
inline bool ToLocalTime(std::chrono::system_clock::time_point timestamp, std::tm& local_time) {
  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  return localtime_r(&epoch_seconds, &local_time) != nullptr;
}

// Filesystem clocks are not guaranteed to share an epoch with system_clock, so
// ages are measured against file_time_type::clock::now().
inline double AgeInDays(std::filesystem::file_time_type write_time) {
  const auto age = std::filesystem::file_time_type::clock::now() - write_time;
  return std::chrono::duration<double, std::ratio<86400>>(age).count();
}

} // namespace dscapture::core

#endif // DSCAPTURE_CORE_TIME_UTILS_HPP_
