#pragma once

#include "capture/capture_request.hpp"
#include "capture/companion_capture.hpp"
#include "copy/resumable_copy.hpp"
#include "outcome/capture_outcome.hpp"
#include "params/params_loader.hpp"
#include "share/share_connection.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

// Knobs that are not job parameters. Defaults are the production values.
struct CaptureEngineOptions {
  copy::CopyRetryPolicy retry_policy;
  std::chrono::milliseconds readiness_poll{500};
  // Empty selects the real connectors.
  share::ConnectorFactory connector_factory;
  copy::FaultInjector fault_injector;
  // Fixes "now" for companion capture cleanup decisions.
  std::optional<std::chrono::system_clock::time_point> companion_clock;
};

// Runs one dataset capture end to end:
//   validate name -> prepare destination -> open share session -> locate
//   source -> mark superseded content -> shape strategy -> companion files
// The share session is released on every exit path and no exception leaves
// Run(). An engine may be reused for consecutive captures; stale method
// directory cleanup then happens at most once.
class CaptureEngine {
public:
  explicit CaptureEngine(core::logging::Logger& logger, CaptureEngineOptions options = {});
  ~CaptureEngine();

  CaptureEngine(const CaptureEngine&) = delete;
  CaptureEngine& operator=(const CaptureEngine&) = delete;

  outcome::CaptureOutcome Run(const params::CaptureParams& params);
  outcome::CaptureOutcome Run(const CaptureRequest& request, const CaptureSettings& settings);

  // Latched once any capture ends in kAbortAllProcessing.
  bool must_stop_accepting_work() const {
    return stop_accepting_work_;
  }

private:
  outcome::CaptureOutcome RunCapture(const CaptureRequest& request, const CaptureSettings& settings);
  CompanionCapture& Companion(const CompanionCaptureSettings& settings);

  core::logging::Logger& logger_;
  CaptureEngineOptions options_;
  std::unique_ptr<CompanionCapture> companion_;
  bool stop_accepting_work_ = false;
};

} // namespace dscapture::capture
