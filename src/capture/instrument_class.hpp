#pragma once

#include <string>
#include <string_view>

namespace dscapture::capture {

// Instrument classes known to the capture broker. Names round-trip with the
// broker's `Instrument_Class` parameter text.
enum class InstrumentClass {
  kUnknown,
  kFinniganIonTrap,
  kLtqFt,
  kTripleQuad,
  kThermoExactive,
  kAgilentIonTrap,
  kAgilentTof,
  kAgilentTofV2,
  kBrukerAmazonIonTrap,
  kBrukerFtBaf,
  kBrukerFtms,
  kBrukerMaldiImaging,
  kBrukerMaldiSpot,
  kBrukerTofBaf,
  kDataFolders,
  kFinniganFticr,
  kImsAgilentTofUimf,
  kWatersTof,
  kQStarQtof,
  kSciexQTrap,
  kSciexTripleTof,
  kPrepHplc,
  kBrukerMaldiImagingV2,
  kIlluminaSequencer,
  kGcQExactive,
  kWatersIms,
  kShimadzuGc,
  kBrukerTofTdf,
  kFtBoosterData,
  kImsAgilentTofDotD,
  kThermoSiiLc,
  kWatersAcquityLc,
  kLcmsNetLc,
  kTimsTofMaldiImaging,
};

// Broker text for the class, e.g. "BrukerMALDI_Imaging_V2".
std::string_view ToString(InstrumentClass instrument_class);

// Case-insensitive. Unrecognized text maps to kUnknown and returns false.
bool ParseInstrumentClass(std::string_view text, InstrumentClass& instrument_class);

// Classes whose raw output is normally a folder, so the shape resolver tries
// folder matches before file matches.
bool PrefersFolderMatch(InstrumentClass instrument_class);

// Classes whose copies always go through the resumable path.
bool RequiresResumableCopy(InstrumentClass instrument_class);

bool IsBrukerImagingClass(InstrumentClass instrument_class);

} // namespace dscapture::capture
