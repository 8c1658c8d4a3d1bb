#include "outcome/capture_outcome.hpp"

#include "core/json_utils.hpp"

#include <string>

namespace dscapture::outcome {

std::string_view ToStableCode(const Closeout closeout) {
  switch (closeout) {
  case Closeout::kSuccess:
    return "CLOSEOUT_SUCCESS";
  case Closeout::kNotReady:
    return "CLOSEOUT_NOT_READY";
  case Closeout::kFailed:
    return "CLOSEOUT_FAILED";
  case Closeout::kAbortAllProcessing:
    return "CLOSEOUT_NEED_TO_ABORT_PROCESSING";
  }
  return "CLOSEOUT_FAILED";
}

std::string_view ToStableCode(const RetryEligibility retry) {
  switch (retry) {
  case RetryEligibility::kSuccess:
    return "RETRY_NOT_NEEDED";
  case RetryEligibility::kRetryEligibleNetworkError:
    return "RETRY_NETWORK_ERROR";
  case RetryEligibility::kNoRetry:
    return "RETRY_NONE";
  }
  return "RETRY_NONE";
}

int ToBrokerCode(const Closeout closeout) {
  switch (closeout) {
  case Closeout::kSuccess:
    return 0;
  case Closeout::kFailed:
    return 1;
  case Closeout::kNotReady:
    return 2;
  case Closeout::kAbortAllProcessing:
    return 3;
  }
  return 1;
}

int ToBrokerCode(const RetryEligibility retry) {
  switch (retry) {
  case RetryEligibility::kSuccess:
  case RetryEligibility::kNoRetry:
    return 0;
  case RetryEligibility::kRetryEligibleNetworkError:
    return 3;
  }
  return 0;
}

void DowngradeToFailed(CaptureOutcome& outcome, std::string message) {
  if (outcome.closeout != Closeout::kSuccess) {
    return;
  }
  outcome.closeout = Closeout::kFailed;
  outcome.retry = RetryEligibility::kNoRetry;
  outcome.message = std::move(message);
}

std::string FormatOutcomeLine(const CaptureOutcome& outcome) {
  std::string line = "closeout=" + std::string(ToStableCode(outcome.closeout)) +
                     " retry=" + std::string(ToStableCode(outcome.retry));
  line += " message=" + core::QuoteJson(outcome.message);
  return line;
}

std::string ToJson(const CaptureOutcome& outcome) {
  std::string json = "{";
  json += "\"closeout\":" + core::QuoteJson(ToStableCode(outcome.closeout));
  json += ",\"closeout_code\":" + std::to_string(ToBrokerCode(outcome.closeout));
  json += ",\"retry\":" + core::QuoteJson(ToStableCode(outcome.retry));
  json += ",\"eval_code\":" + std::to_string(ToBrokerCode(outcome.retry));
  json += ",\"must_stop_accepting_work\":";
  json += outcome.must_stop_accepting_work() ? "true" : "false";
  json += ",\"message\":" + core::QuoteJson(outcome.message);
  json += "}\n";
  return json;
}

} // namespace dscapture::outcome
