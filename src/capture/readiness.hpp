#pragma once

#include "outcome/outcome_classifier.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

constexpr int kMinReadinessSleepSeconds = 1;
constexpr int kMaxReadinessSleepSeconds = 900;
// Floor used for aged or empty items.
constexpr int kMinAgedSleepSeconds = 3;
constexpr int kDefaultSleepIntervalSeconds = 30;

// Clamps a requested wait to [1, 900] seconds.
int ClampSleepSeconds(int sleep_seconds);

// Scales the configured interval down for items that have not been written
// recently:
//   age < 10 days  -> base
//   age > 30 days  -> minimum
//   otherwise      -> round((30 - age) / 20 * (max(base, minimum) - minimum) + minimum)
int ComputeAgedSleepInterval(double age_days, int base_interval_seconds,
                             int minimum_seconds = kMinAgedSleepSeconds);

struct ReadinessCheck {
  bool stable = false;
  // Set when the size changed: "File size changed from X bytes to Y bytes: <path>".
  std::string message;
  // Set when the size could not be measured.
  std::optional<outcome::CaptureFault> fault;
};

// Decides whether a source item is still being written by comparing its size
// across a full sleep interval. The wait never returns early.
class ReadinessDetector {
public:
  ReadinessDetector(core::logging::Logger& logger, int base_interval_seconds)
      : logger_(logger), base_interval_seconds_(base_interval_seconds) {}

  int SleepIntervalForFile(const std::filesystem::path& file) const;
  int SleepIntervalForDirectory(const std::filesystem::path& dir) const;

  // A missing file is reported stable; the copy step reports it as missing.
  ReadinessCheck CheckFile(const std::filesystem::path& file, int sleep_seconds) const;

  // Compares the recursive byte total of `dir`.
  ReadinessCheck CheckDirectory(const std::filesystem::path& dir, int sleep_seconds) const;

  void set_poll_interval(std::chrono::milliseconds poll) {
    poll_interval_ = poll;
  }

private:
  void SleepWithStatus(int sleep_seconds, const std::string& item_description) const;

  core::logging::Logger& logger_;
  int base_interval_seconds_ = kDefaultSleepIntervalSeconds;
  std::chrono::milliseconds poll_interval_{500};
};

} // namespace dscapture::capture
