#include "outcome/outcome_classifier.hpp"

#include "core/string_utils.hpp"

#include <initializer_list>
#include <string>

namespace dscapture::outcome {

namespace {

bool ContainsAny(std::string_view haystack, std::initializer_list<std::string_view> needles) {
  for (const std::string_view needle : needles) {
    if (needle.empty()) {
      continue;
    }
    if (haystack.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

FaultClass ClassifyFromNormalizedDetail(const std::string& normalized_detail) {
  if (normalized_detail.empty()) {
    return FaultClass::kOther;
  }

  if (ContainsAny(normalized_detail, {"an unexpected network error occurred",
                                      "multiple connections",
                                      "specified network name is no longer available"})) {
    return FaultClass::kNetworkSession;
  }

  if (ContainsAny(normalized_detail,
                  {"unknown user name or bad password", "user name or password"})) {
    return FaultClass::kAuthentication;
  }

  return FaultClass::kOther;
}

} // namespace

std::string_view ToStableCode(const FaultClass fault_class) {
  switch (fault_class) {
  case FaultClass::kNetworkSession:
    return "FAULT_NETWORK_SESSION";
  case FaultClass::kAuthentication:
    return "FAULT_AUTHENTICATION";
  case FaultClass::kOther:
  default:
    return "FAULT_OTHER";
  }
}

FaultClass ClassifyFaultText(std::string_view detail) {
  return ClassifyFromNormalizedDetail(core::ToLowerAscii(std::string(detail)));
}

CaptureOutcome Classify(const CaptureFault& fault) {
  CaptureOutcome outcome;
  outcome.message = fault.closeout_message.empty() ? fault.detail : fault.closeout_message;

  switch (ClassifyFaultText(fault.detail)) {
  case FaultClass::kNetworkSession:
    outcome.closeout = Closeout::kAbortAllProcessing;
    outcome.retry = RetryEligibility::kRetryEligibleNetworkError;
    break;
  case FaultClass::kAuthentication:
    outcome.closeout = Closeout::kFailed;
    outcome.retry = RetryEligibility::kRetryEligibleNetworkError;
    outcome.message = "Authentication failure: " + core::TrimChars(fault.detail, "\r\n");
    break;
  case FaultClass::kOther:
    outcome.closeout = Closeout::kFailed;
    outcome.retry = RetryEligibility::kNoRetry;
    break;
  }
  return outcome;
}

} // namespace dscapture::outcome
