#pragma once

#include "core/logging/logger.hpp"
#include "outcome/capture_outcome.hpp"

#include <filesystem>
#include <string>

namespace dscapture::cli {

struct CaptureCommandOptions {
  std::string params_path;
  // Empty means no result document.
  std::filesystem::path result_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Closeout -> process exit code:
//   success 0, failed 1, not ready 20, abort all processing 30
int ExitCodeFor(const outcome::CaptureOutcome& result);

// Routes `dscapture` subcommands and returns the process exit code:
//   0  => success
//   1  => capture failed
//   2  => usage error (unknown command / invalid args)
//   10 => parameter file missing or invalid
//   20 => dataset not ready, try again later
//   30 => network session lost; stop taking jobs
int Dispatch(int argc, char** argv);

} // namespace dscapture::cli
