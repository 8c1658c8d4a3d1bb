#pragma once

namespace dscapture::core::errors {

// Process-exit contract for the job runner that invokes `dscapture`.
//
// 0/1/2 keep their conventional meanings. The remaining values mirror the
// capture closeout so wrappers can decide retry vs. escalation without parsing
// stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kParamsInvalid = 10,
  kNotReady = 20,
  kAbortProcessing = 30,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace dscapture::core::errors
