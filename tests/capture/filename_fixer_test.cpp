#include "capture/filename_fixer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

TEST_CASE("invalid characters are replaced with readable text", "[capture][filename]") {
  REQUIRE(dscapture::capture::ReplaceInvalidChars("a b%.c") == "a_bpctptc");
  REQUIRE(dscapture::capture::ReplaceInvalidChars("clean_name") == "clean_name");
}

TEST_CASE("file names are fixed only when they become the dataset name", "[capture][filename]") {
  REQUIRE(dscapture::capture::AutoFixFilename("QC_Shew_20_01", "QC Shew 20 01.raw") ==
          "QC_Shew_20_01.raw");
  REQUIRE(dscapture::capture::AutoFixFilename("Sample_5pct", "Sample_5%.raw") == "Sample_5pct.raw");
  REQUIRE(dscapture::capture::AutoFixFilename("Sample_1pt5", "Sample_1.5.raw") ==
          "Sample_1pt5.raw");
  REQUIRE(dscapture::capture::AutoFixFilename("qc_shew_20_01", "QC Shew 20 01.raw") ==
          "QC_Shew_20_01.raw");

  REQUIRE(dscapture::capture::AutoFixFilename("Other", "QC Shew 20 01.raw") == "QC Shew 20 01.raw");
  REQUIRE(dscapture::capture::AutoFixFilename("QC_Shew", "QC_Shew.raw") == "QC_Shew.raw");
}

TEST_CASE("name character checks report the offending index", "[capture][filename]") {
  std::string error;
  REQUIRE(dscapture::capture::CheckFileNameChars("QC_Shew_20_01", "Dataset name", error));

  REQUIRE_FALSE(dscapture::capture::CheckFileNameChars("bad:name", "Dataset name", error));
  REQUIRE(error == "Dataset name contains an invalid character at index 3: :");

  REQUIRE(dscapture::capture::CheckPathChars("\\\\proto-5\\share\\dir", "Source path", error));
  REQUIRE_FALSE(dscapture::capture::CheckPathChars("E:\\data|x", "Source path", error));
  REQUIRE(error == "Source path contains an invalid character at index 7: |");
}
