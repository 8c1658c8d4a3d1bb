#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace dscapture::outcome {

// Terminal state of one capture invocation as reported to the job scheduler.
enum class Closeout {
  kSuccess,
  kNotReady,
  kFailed,
  // Dead or saturated network session. The worker must stop accepting new
  // jobs until an operator intervenes.
  kAbortAllProcessing,
};

enum class RetryEligibility {
  kSuccess,
  kRetryEligibleNetworkError,
  kNoRetry,
};

std::string_view ToStableCode(Closeout closeout);
std::string_view ToStableCode(RetryEligibility retry);

// Integer values understood by the upstream task broker.
int ToBrokerCode(Closeout closeout);
int ToBrokerCode(RetryEligibility retry);

struct CaptureOutcome {
  Closeout closeout = Closeout::kFailed;
  RetryEligibility retry = RetryEligibility::kNoRetry;
  std::string message;

  bool succeeded() const {
    return closeout == Closeout::kSuccess;
  }

  bool must_stop_accepting_work() const {
    return closeout == Closeout::kAbortAllProcessing;
  }

  static CaptureOutcome Success() {
    return CaptureOutcome{Closeout::kSuccess, RetryEligibility::kSuccess, ""};
  }

  static CaptureOutcome NotReady(std::string message) {
    return CaptureOutcome{Closeout::kNotReady, RetryEligibility::kNoRetry, std::move(message)};
  }

  static CaptureOutcome Failed(std::string message) {
    return CaptureOutcome{Closeout::kFailed, RetryEligibility::kNoRetry, std::move(message)};
  }
};

// Downgrades a successful outcome after a mandatory post-copy step failed.
// Never upgrades a non-success outcome.
void DowngradeToFailed(CaptureOutcome& outcome, std::string message);

// One-line rendering used by the CLI and log records:
//   closeout=CLOSEOUT_FAILED retry=RETRY_NONE message="..."
std::string FormatOutcomeLine(const CaptureOutcome& outcome);

// JSON document written by `dscapture capture --result`.
std::string ToJson(const CaptureOutcome& outcome);

} // namespace dscapture::outcome
