#pragma once

#include "outcome/capture_outcome.hpp"

#include <string>
#include <string_view>

namespace dscapture::outcome {

// Coarse class of a copy/connection fault, derived from its message text.
//
// Share and filesystem layers only surface free-form text for these
// conditions, so the mapping is substring based. All matching lives here.
enum class FaultClass {
  kNetworkSession,
  kAuthentication,
  kOther,
};

std::string_view ToStableCode(FaultClass fault_class);

FaultClass ClassifyFaultText(std::string_view detail);

// A fault caught at a strategy boundary.
// `detail` is the raw underlying error text; `closeout_message` is the short
// job-record message the caller has already chosen for this failure point.
struct CaptureFault {
  std::string detail;
  std::string closeout_message;
};

// Priority order:
//   1) network session lost/saturated -> kAbortAllProcessing, retry eligible
//   2) credential rejection -> kFailed, retry eligible,
//      message "Authentication failure: <detail>"
//   3) anything else -> kFailed, no retry
// An empty closeout message falls back to the fault detail.
CaptureOutcome Classify(const CaptureFault& fault);

} // namespace dscapture::outcome
