#include "capture/capture_engine.hpp"

#include "capture/conflict_resolver.hpp"
#include "capture/destination.hpp"
#include "capture/readiness.hpp"
#include "capture/source_locator.hpp"
#include "capture/strategies/strategy_factory.hpp"
#include "core/logging/logger.hpp"
#include "outcome/outcome_classifier.hpp"

#include <exception>
#include <utility>

namespace dscapture::capture {

CaptureEngine::CaptureEngine(core::logging::Logger& logger, CaptureEngineOptions options)
    : logger_(logger), options_(std::move(options)) {}

CaptureEngine::~CaptureEngine() = default;

CompanionCapture& CaptureEngine::Companion(const CompanionCaptureSettings& settings) {
  if (!companion_) {
    companion_ = std::make_unique<CompanionCapture>(logger_, settings);
    if (options_.companion_clock) {
      companion_->set_clock(*options_.companion_clock);
    }
  }
  return *companion_;
}

outcome::CaptureOutcome CaptureEngine::Run(const params::CaptureParams& params) {
  CaptureRequest request;
  CaptureSettings settings;
  std::string error;
  if (!BuildCaptureRequest(params, request, settings, error)) {
    logger_.Error("invalid capture parameters", {{"error", error}});
    return outcome::CaptureOutcome::Failed(error);
  }
  return Run(request, settings);
}

outcome::CaptureOutcome CaptureEngine::Run(const CaptureRequest& request,
                                           const CaptureSettings& settings) {
  logger_.SetJobId(request.job);
  logger_.SetDataset(request.dataset_name);

  outcome::CaptureOutcome result;
  try {
    result = RunCapture(request, settings);
  } catch (const std::exception& ex) {
    const std::string message = "Exception capturing dataset " + request.dataset_name;
    logger_.Error(message, {{"error", ex.what()}});
    result = outcome::Classify(outcome::CaptureFault{ex.what(), message});
  }

  if (!result.succeeded() && result.message.empty()) {
    result.message = "Unknown error performing capture";
  }
  if (result.must_stop_accepting_work()) {
    stop_accepting_work_ = true;
  }

  logger_.Info("capture finished", {{"closeout", outcome::ToStableCode(result.closeout)},
                                    {"retry", outcome::ToStableCode(result.retry)}});
  return result;
}

outcome::CaptureOutcome CaptureEngine::RunCapture(const CaptureRequest& request,
                                                  const CaptureSettings& settings) {
  std::string error;
  if (!ValidateDatasetName(request.dataset_name, error)) {
    logger_.Error(error);
    return outcome::CaptureOutcome::Failed(error);
  }

  const bool copy_with_resume = RequiresResumableCopy(request.instrument_class);
  logger_.Debug("starting capture", {{"instrument_class", request.instrument_class_name},
                                     {"copy_with_resume", copy_with_resume ? "true" : "false"}});

  TargetDirectory target;
  outcome::CaptureOutcome failure;
  if (!PrepareTargetDirectory(request, settings, copy_with_resume, logger_, target, failure)) {
    return failure;
  }

  std::unique_ptr<share::ShareConnection> connection =
      options_.connector_factory
          ? std::make_unique<share::ShareConnection>(settings.share, logger_,
                                                     options_.connector_factory)
          : std::make_unique<share::ShareConnection>(settings.share, logger_);
  share::ScopedShareDisconnect disconnect_guard(connection.get());

  SourceLocator locator(logger_, *connection, settings.share.unc_mount_root);
  SourceLocation source;
  if (!locator.Locate(request, source, failure)) {
    return failure;
  }

  // Existing content is only set aside once the source is known to exist.
  if (!target.pending_renames.empty()) {
    const ConflictResolver resolver(logger_, settings.folder_exists_action);
    if (!resolver.MarkSuperseded(target.dataset_dir, target.pending_renames, error)) {
      logger_.Error("unable to mark superseded content", {{"error", error}});
      return outcome::CaptureOutcome::Failed(error.empty() ? "MarkSupersededFiles returned false"
                                                           : error);
    }
  }

  std::unique_ptr<ICaptureStrategy> strategy = CreateCaptureStrategy(source.descriptor.shape);
  if (!strategy) {
    const std::string message = "Unsupported dataset type: " +
                                std::string(ToString(source.descriptor.shape));
    logger_.Error(message);
    return outcome::CaptureOutcome::Failed(message);
  }

  ReadinessDetector readiness(logger_, settings.sleep_interval_seconds);
  readiness.set_poll_interval(options_.readiness_poll);

  const CaptureContext context{logger_,
                               readiness,
                               request,
                               connection->ConnectionDescription(),
                               copy_with_resume,
                               options_.retry_policy,
                               options_.fault_injector};

  outcome::CaptureOutcome result =
      strategy->Capture(context, source.descriptor, source.source_dir, target.dataset_dir);
  disconnect_guard.Release();

  const RawDatasetShape shape = source.descriptor.shape;
  if (result.succeeded() && shape != RawDatasetShape::kBrukerImagingFolder &&
      shape != RawDatasetShape::kBrukerSpotFolder) {
    const CompanionCaptureResult companion =
        Companion(settings.companion).Capture(request.dataset_name, target.dataset_dir);
    if (!companion.success) {
      outcome::DowngradeToFailed(result, "Error capturing LC method files");
    }
  }
  return result;
}

} // namespace dscapture::capture
