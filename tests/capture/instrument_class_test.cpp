#include "capture/instrument_class.hpp"

#include <catch2/catch_test_macros.hpp>

using dscapture::capture::InstrumentClass;

TEST_CASE("instrument class names parse case-insensitively", "[capture][instrument]") {
  InstrumentClass parsed = InstrumentClass::kUnknown;
  REQUIRE(dscapture::capture::ParseInstrumentClass("ltq_ft", parsed));
  REQUIRE(parsed == InstrumentClass::kLtqFt);

  REQUIRE(dscapture::capture::ParseInstrumentClass(" BrukerMALDI_Imaging_V2 ", parsed));
  REQUIRE(parsed == InstrumentClass::kBrukerMaldiImagingV2);
  REQUIRE(dscapture::capture::ToString(parsed) == "BrukerMALDI_Imaging_V2");
}

TEST_CASE("unrecognized instrument classes map to unknown", "[capture][instrument]") {
  InstrumentClass parsed = InstrumentClass::kLtqFt;
  REQUIRE_FALSE(dscapture::capture::ParseInstrumentClass("Orbitrap_9000", parsed));
  REQUIRE(parsed == InstrumentClass::kUnknown);

  parsed = InstrumentClass::kLtqFt;
  REQUIRE_FALSE(dscapture::capture::ParseInstrumentClass("Unknown", parsed));
  REQUIRE(parsed == InstrumentClass::kUnknown);
}

TEST_CASE("copy policy follows the instrument class", "[capture][instrument]") {
  REQUIRE(dscapture::capture::RequiresResumableCopy(InstrumentClass::kBrukerFtBaf));
  REQUIRE(dscapture::capture::RequiresResumableCopy(InstrumentClass::kBrukerMaldiImaging));
  REQUIRE_FALSE(dscapture::capture::RequiresResumableCopy(InstrumentClass::kLtqFt));

  REQUIRE(dscapture::capture::PrefersFolderMatch(InstrumentClass::kWatersTof));
  REQUIRE(dscapture::capture::PrefersFolderMatch(InstrumentClass::kImsAgilentTofUimf));
  REQUIRE_FALSE(dscapture::capture::PrefersFolderMatch(InstrumentClass::kThermoExactive));
  REQUIRE_FALSE(dscapture::capture::PrefersFolderMatch(InstrumentClass::kUnknown));
}
