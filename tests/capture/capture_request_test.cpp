#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "capture/capture_request.hpp"
#include "capture/destination.hpp"
#include "capture/source_locator.hpp"
#include "capture/strategies/bruker_capture.hpp"
#include "params/password.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <string>

using dscapture::capture::CaptureRequest;
using dscapture::capture::CaptureSettings;
using dscapture::params::CaptureParams;

TEST_CASE("capture request reads task and manager parameters", "[capture][request]") {
  CaptureParams params;
  params.task.SetParam("Dataset", " QC_Shew_20_01 ");
  params.task.SetParam("Job", "1001");
  params.task.SetParam("Capture_Subfolder", "legacy");
  params.task.SetParam("Instrument_Class", "ltq_ft");
  params.task.SetParam("Method", "SecFSO");
  params.manager.SetParam("perspective", "Client");
  params.manager.SetParam("sleepinterval", "45");
  params.manager.SetParam("BionetPwd", dscapture::params::EncodePassword("pw!"));

  CaptureRequest request;
  CaptureSettings settings;
  std::string error;
  REQUIRE(dscapture::capture::BuildCaptureRequest(params, request, settings, error));
  REQUIRE(request.dataset_name == "QC_Shew_20_01");
  REQUIRE(request.directory == "QC_Shew_20_01");
  REQUIRE(request.capture_subdirectory == "legacy");
  REQUIRE(request.instrument_class == dscapture::capture::InstrumentClass::kLtqFt);
  REQUIRE(request.uses_share_connection());
  REQUIRE(settings.perspective == dscapture::capture::Perspective::kClient);
  REQUIRE(settings.sleep_interval_seconds == 45);
  REQUIRE(settings.share.password == "pw!");
}

TEST_CASE("capture request needs a dataset name", "[capture][request]") {
  CaptureParams params;
  params.task.SetParam("Job", "1001");
  CaptureRequest request;
  CaptureSettings settings;
  std::string error;
  REQUIRE_FALSE(dscapture::capture::BuildCaptureRequest(params, request, settings, error));
  REQUIRE(error == "task parameter Dataset is missing or empty");
}

TEST_CASE("dataset names may not contain spaces or path characters", "[capture][request]") {
  std::string error;
  REQUIRE(dscapture::capture::ValidateDatasetName("QC_Shew_20_01", error));
  REQUIRE_FALSE(dscapture::capture::ValidateDatasetName("QC Shew", error));
  REQUIRE(error == "Dataset name contains a space");
  REQUIRE_FALSE(dscapture::capture::ValidateDatasetName("QC*Shew", error));
  REQUIRE(error == "Dataset name contains an invalid character at index 2: *");
}

TEST_CASE("capture subdirectory climbing out of the share is folded in", "[capture][request]") {
  std::string source_path = "ProteomicsData\\";
  std::string capture_subdirectory = "..\\ProteomicsData2";
  REQUIRE(dscapture::capture::VerifyRelativeSourcePath("\\\\lumos01.bionet\\", source_path,
                                                       capture_subdirectory));
  REQUIRE(source_path == "ProteomicsData2");
  REQUIRE(capture_subdirectory.empty());

  source_path = "ProteomicsData\\";
  capture_subdirectory = "Run1";
  REQUIRE_FALSE(dscapture::capture::VerifyRelativeSourcePath("\\\\lumos01.bionet\\", source_path,
                                                             capture_subdirectory));
  REQUIRE(source_path == "ProteomicsData\\");
}

TEST_CASE("directory parameter must start with the dataset name", "[capture][destination]") {
  REQUIRE(dscapture::capture::DirectoryParamMatchesDataset("DS01", "DS01"));
  REQUIRE(dscapture::capture::DirectoryParamMatchesDataset("DS01", "DS01\\sub"));
  REQUIRE_FALSE(dscapture::capture::DirectoryParamMatchesDataset("DS01", "Other\\DS01"));
}

TEST_CASE("storage roots may not be blank or a bare separator", "[capture][destination]") {
  std::string error;
  REQUIRE(dscapture::capture::ValidateStorageRoot("E:\\", "Parameter Storage_Vol", "E:\\", error));
  REQUIRE_FALSE(
      dscapture::capture::ValidateStorageRoot("\\", "Parameter Storage_Vol", "E:\\", error));
  REQUIRE(error == "Parameter Storage_Vol is invalid (\\); it should be E:\\ or similar");
  REQUIRE_FALSE(dscapture::capture::ValidateStorageRoot("  ", "Parameter Storage_Path",
                                                        "Lumos01\\2020_3", error));
}

TEST_CASE("MALDI spot subdirectory names", "[capture][bruker]") {
  REQUIRE(dscapture::capture::IsMaldiSpotDirectoryName("0_D4"));
  REQUIRE(dscapture::capture::IsMaldiSpotDirectoryName("0_e10"));
  REQUIRE_FALSE(dscapture::capture::IsMaldiSpotDirectoryName("spotA"));
  REQUIRE_FALSE(dscapture::capture::IsMaldiSpotDirectoryName("10_D4"));
}

TEST_CASE("directory stats summarize the top level of a source folder", "[capture][locator]") {
  const std::filesystem::path dir =
      dscapture::tests::common::CreateUniqueTempDir("dscapture-stats");
  dscapture::tests::common::WriteFile(dir / "QC_Shew_big.raw", std::string(1024, 'r'));
  dscapture::tests::common::WriteFile(dir / "QC_Shew_small.txt", std::string(512, 't'));
  dscapture::tests::common::WriteFile(dir / "nested" / "ignored.bin", std::string(4096, 'n'));

  REQUIRE(dscapture::capture::ReportDirectoryStats(dir) ==
          "2 files, 1.5 KB total, largest file is QC_Shew_big.raw");
  REQUIRE(dscapture::capture::ReportDirectoryStats(dir / "missing").rfind(
              "Error: directory not found, ", 0) == 0U);

  dscapture::tests::common::RemovePathBestEffort(dir);
}
