#include "capture/instrument_class.hpp"

#include "core/string_utils.hpp"

#include <array>
#include <utility>

namespace dscapture::capture {

namespace {

using ClassName = std::pair<InstrumentClass, std::string_view>;

constexpr std::array<ClassName, 34> kClassNames{{
    {InstrumentClass::kUnknown, "Unknown"},
    {InstrumentClass::kFinniganIonTrap, "Finnigan_Ion_Trap"},
    {InstrumentClass::kLtqFt, "LTQ_FT"},
    {InstrumentClass::kTripleQuad, "Triple_Quad"},
    {InstrumentClass::kThermoExactive, "Thermo_Exactive"},
    {InstrumentClass::kAgilentIonTrap, "Agilent_Ion_Trap"},
    {InstrumentClass::kAgilentTof, "Agilent_TOF"},
    {InstrumentClass::kAgilentTofV2, "Agilent_TOF_V2"},
    {InstrumentClass::kBrukerAmazonIonTrap, "Bruker_Amazon_Ion_Trap"},
    {InstrumentClass::kBrukerFtBaf, "BrukerFT_BAF"},
    {InstrumentClass::kBrukerFtms, "BrukerFTMS"},
    {InstrumentClass::kBrukerMaldiImaging, "BrukerMALDI_Imaging"},
    {InstrumentClass::kBrukerMaldiSpot, "BrukerMALDI_Spot"},
    {InstrumentClass::kBrukerTofBaf, "BrukerTOF_BAF"},
    {InstrumentClass::kDataFolders, "Data_Folders"},
    {InstrumentClass::kFinniganFticr, "Finnigan_FTICR"},
    {InstrumentClass::kImsAgilentTofUimf, "IMS_Agilent_TOF_UIMF"},
    {InstrumentClass::kWatersTof, "Waters_TOF"},
    {InstrumentClass::kQStarQtof, "QStar_QTOF"},
    {InstrumentClass::kSciexQTrap, "Sciex_QTrap"},
    {InstrumentClass::kSciexTripleTof, "Sciex_TripleTOF"},
    {InstrumentClass::kPrepHplc, "PrepHPLC"},
    {InstrumentClass::kBrukerMaldiImagingV2, "BrukerMALDI_Imaging_V2"},
    {InstrumentClass::kIlluminaSequencer, "Illumina_Sequencer"},
    {InstrumentClass::kGcQExactive, "GC_QExactive"},
    {InstrumentClass::kWatersIms, "Waters_IMS"},
    {InstrumentClass::kShimadzuGc, "Shimadzu_GC"},
    {InstrumentClass::kBrukerTofTdf, "BrukerTOF_TDF"},
    {InstrumentClass::kFtBoosterData, "FT_Booster_Data"},
    {InstrumentClass::kImsAgilentTofDotD, "IMS_Agilent_TOF_DotD"},
    {InstrumentClass::kThermoSiiLc, "Thermo_SII_LC"},
    {InstrumentClass::kWatersAcquityLc, "Waters_Acquity_LC"},
    {InstrumentClass::kLcmsNetLc, "LCMSNet_LC"},
    {InstrumentClass::kTimsTofMaldiImaging, "TimsTOF_MALDI_Imaging"},
}};

} // namespace

std::string_view ToString(const InstrumentClass instrument_class) {
  for (const auto& [value, name] : kClassNames) {
    if (value == instrument_class) {
      return name;
    }
  }
  return "Unknown";
}

bool ParseInstrumentClass(std::string_view text, InstrumentClass& instrument_class) {
  const std::string trimmed = core::TrimAscii(text);
  for (const auto& [value, name] : kClassNames) {
    if (core::EqualsIgnoreCase(trimmed, name)) {
      instrument_class = value;
      return value != InstrumentClass::kUnknown;
    }
  }
  instrument_class = InstrumentClass::kUnknown;
  return false;
}

bool PrefersFolderMatch(const InstrumentClass instrument_class) {
  switch (instrument_class) {
  case InstrumentClass::kBrukerMaldiImaging:
  case InstrumentClass::kBrukerMaldiImagingV2:
  case InstrumentClass::kImsAgilentTofUimf:
  case InstrumentClass::kImsAgilentTofDotD:
  case InstrumentClass::kWatersTof:
  case InstrumentClass::kWatersIms:
    return true;
  default:
    return false;
  }
}

bool RequiresResumableCopy(const InstrumentClass instrument_class) {
  return instrument_class == InstrumentClass::kBrukerFtBaf ||
         instrument_class == InstrumentClass::kBrukerMaldiImaging ||
         instrument_class == InstrumentClass::kBrukerMaldiImagingV2;
}

bool IsBrukerImagingClass(const InstrumentClass instrument_class) {
  return instrument_class == InstrumentClass::kBrukerMaldiImaging ||
         instrument_class == InstrumentClass::kBrukerMaldiImagingV2;
}

} // namespace dscapture::capture
