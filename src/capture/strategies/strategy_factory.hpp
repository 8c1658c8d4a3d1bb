#pragma once

#include "capture/dataset_descriptor.hpp"
#include "capture/strategies/capture_strategy.hpp"

#include <memory>

namespace dscapture::capture {

// Returns the capture procedure for a resolved dataset shape, or nullptr for
// kNone.
std::unique_ptr<ICaptureStrategy> CreateCaptureStrategy(RawDatasetShape shape);

} // namespace dscapture::capture
