#pragma once

#include "capture/dataset_descriptor.hpp"
#include "capture/instrument_class.hpp"

#include <filesystem>
#include <string>

namespace dscapture::core::logging {
class Logger;
}

namespace dscapture::capture {

// Checks that the resolved shape is legal for the instrument class.
//
// May rewrite `descriptor`: a Thermo raw+sequence (.sld) file pair collapses
// into a single-file capture of the .raw. On rejection `error` holds the
// closeout message, e.g. "Dataset name matched a file; must be a .d directory".
bool ValidateWithInstrumentClass(const std::filesystem::path& source_dir,
                                 InstrumentClass instrument_class, DatasetDescriptor& descriptor,
                                 core::logging::Logger& logger, std::string& error);

} // namespace dscapture::capture
