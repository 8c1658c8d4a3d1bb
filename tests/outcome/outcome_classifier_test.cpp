#include "outcome/capture_outcome.hpp"
#include "outcome/outcome_classifier.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using dscapture::outcome::CaptureFault;
using dscapture::outcome::CaptureOutcome;
using dscapture::outcome::Closeout;
using dscapture::outcome::RetryEligibility;

TEST_CASE("lost network session aborts all processing", "[outcome][classifier]") {
  const CaptureOutcome outcome = dscapture::outcome::Classify(
      CaptureFault{"The specified network name is no longer available.", "Copy exception"});
  REQUIRE(outcome.closeout == Closeout::kAbortAllProcessing);
  REQUIRE(outcome.retry == RetryEligibility::kRetryEligibleNetworkError);
  REQUIRE(outcome.message == "Copy exception");
  REQUIRE(outcome.must_stop_accepting_work());
}

TEST_CASE("saturated sessions are matched case-insensitively", "[outcome][classifier]") {
  const CaptureOutcome unexpected = dscapture::outcome::Classify(
      CaptureFault{"AN UNEXPECTED NETWORK ERROR OCCURRED", ""});
  REQUIRE(unexpected.closeout == Closeout::kAbortAllProcessing);
  REQUIRE(unexpected.message == "AN UNEXPECTED NETWORK ERROR OCCURRED");

  const CaptureOutcome multiple = dscapture::outcome::Classify(
      CaptureFault{"Multiple connections to a server by the same user are not allowed", "x"});
  REQUIRE(multiple.closeout == Closeout::kAbortAllProcessing);
}

TEST_CASE("credential rejection fails with a retry hint", "[outcome][classifier]") {
  const CaptureOutcome outcome = dscapture::outcome::Classify(
      CaptureFault{"Logon failure: unknown user name or bad password.\r\n", "Error connecting"});
  REQUIRE(outcome.closeout == Closeout::kFailed);
  REQUIRE(outcome.retry == RetryEligibility::kRetryEligibleNetworkError);
  REQUIRE(outcome.message ==
          "Authentication failure: Logon failure: unknown user name or bad password.");
  REQUIRE_FALSE(outcome.must_stop_accepting_work());
}

TEST_CASE("other faults fail without retry", "[outcome][classifier]") {
  const CaptureOutcome outcome =
      dscapture::outcome::Classify(CaptureFault{"disk full", "file copy failed"});
  REQUIRE(outcome.closeout == Closeout::kFailed);
  REQUIRE(outcome.retry == RetryEligibility::kNoRetry);
  REQUIRE(outcome.message == "file copy failed");
}

TEST_CASE("network session wins over authentication text", "[outcome][classifier]") {
  const CaptureOutcome outcome = dscapture::outcome::Classify(CaptureFault{
      "unknown user name or bad password; an unexpected network error occurred", "x"});
  REQUIRE(outcome.closeout == Closeout::kAbortAllProcessing);
}

TEST_CASE("downgrade only touches successful outcomes", "[outcome]") {
  CaptureOutcome success = CaptureOutcome::Success();
  dscapture::outcome::DowngradeToFailed(success, "LC method capture failed");
  REQUIRE(success.closeout == Closeout::kFailed);
  REQUIRE(success.message == "LC method capture failed");

  CaptureOutcome not_ready = CaptureOutcome::NotReady("File size changed");
  dscapture::outcome::DowngradeToFailed(not_ready, "ignored");
  REQUIRE(not_ready.closeout == Closeout::kNotReady);
  REQUIRE(not_ready.message == "File size changed");
}

TEST_CASE("outcome line and JSON carry the stable codes", "[outcome][json]") {
  const CaptureOutcome outcome = CaptureOutcome::Failed("Dataset directory already exists");
  REQUIRE(dscapture::outcome::FormatOutcomeLine(outcome) ==
          "closeout=CLOSEOUT_FAILED retry=RETRY_NONE message=\"Dataset directory already exists\"");

  const std::string json = dscapture::outcome::ToJson(outcome);
  REQUIRE(json.find("\"closeout\":\"CLOSEOUT_FAILED\"") != std::string::npos);
  REQUIRE(json.find("\"closeout_code\":1") != std::string::npos);
  REQUIRE(json.find("\"must_stop_accepting_work\":false") != std::string::npos);
  REQUIRE(json.find("\"message\":\"Dataset directory already exists\"") != std::string::npos);
}
