#include "capture/name_similarity.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

TEST_CASE("letter pairs split on symbols", "[capture][similarity]") {
  const std::vector<std::string> pairs = dscapture::capture::LetterPairs("ab-cd e");
  REQUIRE(pairs == std::vector<std::string>{"AB", "CD"});
}

TEST_CASE("name similarity is a Dice coefficient over letter pairs", "[capture][similarity]") {
  using Catch::Approx;
  using dscapture::capture::CompareNames;
  REQUIRE(CompareNames("QC_Shew_20_01", "qc_shew_20_01") == Approx(1.0));
  REQUIRE(CompareNames("FRANCE", "FRENCH") == Approx(0.4));
  REQUIRE(CompareNames("abc", "xyz") == Approx(0.0));
  REQUIRE(CompareNames("", "") == Approx(0.0));
}

TEST_CASE("renamed nested instrument folders stay above the threshold", "[capture][similarity]") {
  const double score =
      dscapture::capture::CompareNames("Sample_Alpha_2020_01", "Sample_Alpha_2020_01b");
  REQUIRE(score >= dscapture::capture::kNestedFolderSimilarityThreshold);
  REQUIRE(dscapture::capture::CompareNames("Sample_Alpha", "Blank_Run") <
          dscapture::capture::kNestedFolderSimilarityThreshold);
}
