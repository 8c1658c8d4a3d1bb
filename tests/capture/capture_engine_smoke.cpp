#include "../common/assertions.hpp"
#include "../common/capture_fixtures.hpp"
#include "../common/temp_dir.hpp"
#include "capture/capture_engine.hpp"
#include "core/logging/logger.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace {

using dscapture::outcome::CaptureOutcome;
using dscapture::outcome::Closeout;
using dscapture::tests::common::AssertContains;
using dscapture::tests::common::AssertEqual;
using dscapture::tests::common::AssertExists;
using dscapture::tests::common::AssertMissing;
using dscapture::tests::common::AssertTrue;
using dscapture::tests::common::CaptureTree;
using dscapture::tests::common::MakeCaptureParams;
using dscapture::tests::common::ReadFileToString;
using dscapture::tests::common::WriteFile;

dscapture::capture::CaptureEngineOptions FastOptions() {
  dscapture::capture::CaptureEngineOptions options;
  options.readiness_poll = std::chrono::milliseconds(50);
  return options;
}

CaptureOutcome RunCapture(const CaptureTree& tree, std::string_view dataset,
                          std::string_view instrument_class,
                          std::string_view folder_exists_action = "overwrite_single_item") {
  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kDebug, log);
  dscapture::capture::CaptureEngine engine(logger, FastOptions());
  return engine.Run(MakeCaptureParams(tree, dataset, instrument_class, folder_exists_action));
}

std::string MakePayload(std::size_t size) {
  std::string payload;
  payload.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    payload.push_back(static_cast<char>('A' + (i * 7U) % 26U));
  }
  return payload;
}

void AssertSingleFileCapture(const CaptureTree& tree) {
  const std::string payload = MakePayload(10000);
  WriteFile(tree.source_dir() / "QC_Shew_01.raw", payload);
  const CaptureOutcome outcome = RunCapture(tree, "QC_Shew_01", "LTQ_FT");
  AssertTrue(outcome.succeeded(), "single file capture failed: " + outcome.message);
  const std::string captured =
      ReadFileToString(tree.dataset_dir("QC_Shew_01") / "QC_Shew_01.raw");
  AssertEqual(std::to_string(captured.size()), "10000", "captured size");
  AssertTrue(captured == payload, "captured bytes differ from source");
}

void AssertExistingSingleFileIsSuperseded(const CaptureTree& tree) {
  WriteFile(tree.source_dir() / "QC_Shew_02.raw", "new acquisition");
  WriteFile(tree.dataset_dir("QC_Shew_02") / "QC_Shew_02.raw", "old");
  const CaptureOutcome outcome = RunCapture(tree, "QC_Shew_02", "LTQ_FT");
  AssertTrue(outcome.succeeded(), "recapture failed: " + outcome.message);
  AssertEqual(ReadFileToString(tree.dataset_dir("QC_Shew_02") / "x_QC_Shew_02.raw"), "old",
              "superseded copy");
  AssertEqual(ReadFileToString(tree.dataset_dir("QC_Shew_02") / "QC_Shew_02.raw"),
              "new acquisition", "recaptured content");
}

void AssertGrowingFileIsNotReady(const CaptureTree& tree) {
  const fs::path source = tree.source_dir() / "QC_Shew_03.raw";
  WriteFile(source, "partial");
  std::thread writer([source]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::ofstream output(source, std::ios::binary | std::ios::app);
    output << " still acquiring";
  });
  const CaptureOutcome outcome = RunCapture(tree, "QC_Shew_03", "LTQ_FT");
  writer.join();

  AssertTrue(outcome.closeout == Closeout::kNotReady, "growing file must be not ready");
  AssertContains(outcome.message, "File size changed from 7 bytes");
  AssertMissing(tree.dataset_dir("QC_Shew_03"));
}

void AssertVanishedFileIsNotReady(const CaptureTree& tree) {
  const fs::path source = tree.source_dir() / "QC_Vanish.raw";
  WriteFile(source, "acquiring");
  std::thread remover([source]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    std::error_code ec;
    fs::remove(source, ec);
  });
  const CaptureOutcome outcome = RunCapture(tree, "QC_Vanish", "LTQ_FT");
  remover.join();

  AssertTrue(outcome.closeout == Closeout::kNotReady,
             "file removed during the readiness window must be not ready");
  AssertEqual(outcome.message, "Exception validating constant file size", "vanished file message");
  AssertMissing(tree.dataset_dir("QC_Vanish"));
}

void AssertFailPolicyLeavesDestinationAlone(const CaptureTree& tree) {
  WriteFile(tree.source_dir() / "QC_Shew_04.raw", "new");
  WriteFile(tree.dataset_dir("QC_Shew_04") / "QC_Shew_04.raw", "old");
  const CaptureOutcome outcome = RunCapture(tree, "QC_Shew_04", "LTQ_FT", "fail");

  AssertTrue(outcome.closeout == Closeout::kFailed, "fail policy must fail");
  AssertEqual(outcome.message, "Dataset directory already exists", "fail policy message");
  AssertEqual(ReadFileToString(tree.dataset_dir("QC_Shew_04") / "QC_Shew_04.raw"), "old",
              "existing content untouched");
  AssertMissing(tree.dataset_dir("QC_Shew_04") / "x_QC_Shew_04.raw");
}

void AssertBrukerSpotFolders(const CaptureTree& tree) {
  WriteFile(tree.source_dir() / "Spot_05" / "0_D4" / "fid", "d4");
  WriteFile(tree.source_dir() / "Spot_05" / "0_E10" / "fid", "e10");
  const CaptureOutcome accepted = RunCapture(tree, "Spot_05", "BrukerMALDI_Spot");
  AssertTrue(accepted.succeeded(), "spot capture failed: " + accepted.message);
  AssertExists(tree.dataset_dir("Spot_05") / "0_D4" / "fid");
  AssertExists(tree.dataset_dir("Spot_05") / "0_E10" / "fid");

  WriteFile(tree.source_dir() / "Spot_06" / "0_D4" / "fid", "d4");
  WriteFile(tree.source_dir() / "Spot_06" / "spotA" / "fid", "a");
  const CaptureOutcome rejected = RunCapture(tree, "Spot_06", "BrukerMALDI_Spot");
  AssertTrue(rejected.closeout == Closeout::kFailed, "unexpected spot directory must fail");
  AssertContains(rejected.message, "directory spotA does not match the expected pattern");
  AssertMissing(tree.dataset_dir("Spot_06"));
}

void AssertDotDFolderCapture(const CaptureTree& tree) {
  const fs::path folder = tree.source_dir() / "Bruker_07.d";
  WriteFile(folder / "analysis.baf", "baf");
  WriteFile(folder / "ser", "ser");
  WriteFile(folder / "SyncHelper", "");
  const CaptureOutcome outcome = RunCapture(tree, "Bruker_07", "BrukerFT_BAF");
  AssertTrue(outcome.succeeded(), ".d capture failed: " + outcome.message);

  const fs::path target = tree.dataset_dir("Bruker_07") / "Bruker_07.d";
  AssertEqual(ReadFileToString(target / "analysis.baf"), "baf", "baf content");
  AssertExists(target / "ser");
  AssertMissing(target / "SyncHelper");
}

void AssertResumableRecaptureIsIdempotent(const CaptureTree& tree) {
  const fs::path folder = tree.source_dir() / "Bruker_R.d";
  const std::string baf = MakePayload(4096);
  WriteFile(folder / "analysis.baf", baf);
  WriteFile(folder / "ser", "ser");
  WriteFile(folder / "method.m" / "apexAcquisition.method", "<method/>");

  const CaptureOutcome first = RunCapture(tree, "Bruker_R", "BrukerFT_BAF");
  AssertTrue(first.succeeded(), "first capture failed: " + first.message);
  const CaptureOutcome second = RunCapture(tree, "Bruker_R", "BrukerFT_BAF");
  AssertTrue(second.succeeded(), "recapture failed: " + second.message);

  const fs::path dataset_dir = tree.dataset_dir("Bruker_R");
  std::size_t top_level = 0;
  for (const auto& entry : fs::directory_iterator(dataset_dir)) {
    AssertEqual(entry.path().filename().string(), "Bruker_R.d", "top-level entry");
    ++top_level;
  }
  AssertTrue(top_level == 1U, "one dataset folder after recapture");

  std::size_t files = 0;
  for (const auto& entry : fs::recursive_directory_iterator(dataset_dir)) {
    const std::string name = entry.path().filename().string();
    AssertTrue(name.rfind("x_", 0) != 0, "superseded entry left behind: " + name);
    AssertTrue(name.find(".#FilePart") == std::string::npos, "part file left behind: " + name);
    if (entry.is_regular_file()) {
      ++files;
    }
  }
  AssertTrue(files == 3U, "file count after recapture");
  AssertTrue(ReadFileToString(dataset_dir / "Bruker_R.d" / "analysis.baf") == baf,
             "recaptured bytes differ from source");
}

void AssertRejectedRequests(const CaptureTree& tree) {
  const CaptureOutcome missing = RunCapture(tree, "Not_Acquired", "LTQ_FT");
  AssertTrue(missing.closeout == Closeout::kFailed, "missing dataset must fail");
  AssertContains(missing.message, "Dataset data file not found at ");

  const CaptureOutcome spaced = RunCapture(tree, "Bad Name", "LTQ_FT");
  AssertEqual(spaced.message, "Dataset name contains a space", "space in dataset name");

  WriteFile(tree.source_dir() / "Wrong_Shape.raw", "raw");
  const CaptureOutcome wrong_shape = RunCapture(tree, "Wrong_Shape", "BrukerFT_BAF");
  AssertEqual(wrong_shape.message, "Dataset name matched a file; must be a .d directory",
              "class rejects shape");
}

void AssertLostNetworkSessionStopsWorker(const CaptureTree& tree) {
  WriteFile(tree.source_dir() / "QC_Shew_08.raw", "spectra");

  std::ostringstream log;
  dscapture::core::logging::Logger logger(dscapture::core::logging::LogLevel::kDebug, log);
  dscapture::capture::CaptureEngineOptions options = FastOptions();
  options.fault_injector = [](const fs::path&, std::uint64_t, std::string& detail) {
    detail = "An unexpected network error occurred.";
    return dscapture::copy::CopyFault::kTransient;
  };
  dscapture::capture::CaptureEngine engine(logger, options);

  AssertTrue(!engine.must_stop_accepting_work(), "fresh engine accepts work");
  const CaptureOutcome outcome =
      engine.Run(MakeCaptureParams(tree, "QC_Shew_08", "LTQ_FT"));
  AssertTrue(outcome.closeout == Closeout::kAbortAllProcessing, "network loss must abort");
  AssertContains(outcome.message, "file copy failed for ");
  AssertTrue(engine.must_stop_accepting_work(), "engine latches the stop flag");
  AssertContains(log.str(), "capture finished");
  AssertContains(log.str(), "CLOSEOUT_NEED_TO_ABORT_PROCESSING");
}

} // namespace

int main() {
  CaptureTree tree;
  tree.root = dscapture::tests::common::CreateUniqueTempDir("dscapture-engine");
  fs::create_directories(tree.source_dir());

  AssertSingleFileCapture(tree);
  AssertExistingSingleFileIsSuperseded(tree);
  AssertGrowingFileIsNotReady(tree);
  AssertVanishedFileIsNotReady(tree);
  AssertFailPolicyLeavesDestinationAlone(tree);
  AssertBrukerSpotFolders(tree);
  AssertDotDFolderCapture(tree);
  AssertResumableRecaptureIsIdempotent(tree);
  AssertRejectedRequests(tree);
  AssertLostNetworkSessionStopsWorker(tree);

  dscapture::tests::common::RemovePathBestEffort(tree.root);
  return 0;
}
