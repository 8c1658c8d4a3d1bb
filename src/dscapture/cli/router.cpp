#include "dscapture/cli/router.hpp"

#include "capture/capture_engine.hpp"
#include "capture/capture_request.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "params/params_loader.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace dscapture::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitParamsInvalid = core::errors::ToInt(core::errors::ExitCode::kParamsInvalid);
constexpr int kExitNotReady = core::errors::ToInt(core::errors::ExitCode::kNotReady);
constexpr int kExitAbortProcessing = core::errors::ToInt(core::errors::ExitCode::kAbortProcessing);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  dscapture capture <params.json> [--log-level <debug|info|warn|error>] "
         "[--result <out.json>]\n"
      << "  dscapture check-params <params.json>\n"
      << "  dscapture version\n";
}

bool ValidateParamsPath(const std::string& params_path, std::string& error) {
  if (params_path.empty()) {
    error = "params path cannot be empty";
    return false;
  }

  const fs::path path(params_path);
  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    error = "params file not found: " + params_path;
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    error = "params path must point to a regular file: " + params_path;
    return false;
  }
  return true;
}

// Loads and validates the parameter file. Returns the exit code to use on
// failure, or kExitSuccess.
int LoadRequest(const std::string& params_path, params::CaptureParams& params,
                capture::CaptureRequest& request, capture::CaptureSettings& settings) {
  std::string error;
  if (!ValidateParamsPath(params_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitParamsInvalid;
  }
  if (!params::LoadParamsFile(params_path, params, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitParamsInvalid;
  }
  if (!capture::BuildCaptureRequest(params, request, settings, error)) {
    std::cerr << "invalid params: " << params_path << '\n' << "  - " << error << '\n';
    return kExitParamsInvalid;
  }
  return kExitSuccess;
}

bool ParseCaptureOptions(const std::vector<std::string_view>& args, CaptureCommandOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }
    if (token == "--result") {
      if (i + 1 >= args.size()) {
        error = "missing value for --result";
        return false;
      }
      options.result_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    if (!options.params_path.empty()) {
      error = "capture accepts exactly 1 params path";
      return false;
    }
    options.params_path = std::string(token);
  }

  if (options.params_path.empty()) {
    error = "capture requires exactly 1 argument: <params.json>";
    return false;
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "dscapture 0.1.0\n";
  return kExitSuccess;
}

int CommandCheckParams(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: check-params requires exactly 1 argument: <params.json>\n";
    return kExitUsage;
  }

  const std::string params_path(args.front());
  params::CaptureParams params;
  capture::CaptureRequest request;
  capture::CaptureSettings settings;
  const int load_code = LoadRequest(params_path, params, request, settings);
  if (load_code != kExitSuccess) {
    return load_code;
  }

  std::string error;
  if (!capture::ValidateDatasetName(request.dataset_name, error)) {
    std::cerr << "invalid params: " << params_path << '\n' << "  - " << error << '\n';
    return kExitParamsInvalid;
  }

  std::cout << "valid: " << params_path << " (dataset " << request.dataset_name << ", "
            << (request.instrument_class_name.empty() ? std::string("no instrument class")
                                                      : request.instrument_class_name)
            << ")\n";
  return kExitSuccess;
}

int CommandCapture(const std::vector<std::string_view>& args) {
  CaptureCommandOptions options;
  std::string error;
  if (!ParseCaptureOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  params::CaptureParams params;
  capture::CaptureRequest request;
  capture::CaptureSettings settings;
  const int load_code = LoadRequest(options.params_path, params, request, settings);
  if (load_code != kExitSuccess) {
    return load_code;
  }

  core::logging::Logger logger(options.log_level);
  capture::CaptureEngine engine(logger);
  const outcome::CaptureOutcome result = engine.Run(request, settings);

  std::cout << outcome::FormatOutcomeLine(result) << '\n';

  if (!options.result_path.empty() &&
      !core::WriteTextFileAtomic(options.result_path, outcome::ToJson(result), error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (engine.must_stop_accepting_work()) {
    logger.Error("network session lost; this worker must stop accepting capture jobs");
  }
  return ExitCodeFor(result);
}

} // namespace

int ExitCodeFor(const outcome::CaptureOutcome& result) {
  switch (result.closeout) {
  case outcome::Closeout::kSuccess:
    return kExitSuccess;
  case outcome::Closeout::kNotReady:
    return kExitNotReady;
  case outcome::Closeout::kAbortAllProcessing:
    return kExitAbortProcessing;
  case outcome::Closeout::kFailed:
    return kExitFailure;
  }
  return kExitFailure;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "capture") {
    return CommandCapture(args);
  }

  if (command == "check-params") {
    return CommandCheckParams(args);
  }

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace dscapture::cli
