#pragma once

#include "params/param_set.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace dscapture::params {

// Task and manager parameters for one capture job.
struct CaptureParams {
  ParamSet task;
  ParamSet manager;
};

// Loads a parameter file shaped as:
//   {
//     "task":    { "Dataset": "...", "Source_Vol": "...", ... },
//     "manager": { "sleepinterval": 30, "bionetuser": "...", ... }
//   }
// Scalar values are stored as strings. Nested objects and arrays are
// rejected with the offending key in the error text. "manager" is optional.
bool LoadParamsFromText(std::string_view json_text, CaptureParams& params, std::string& error);

bool LoadParamsFile(const std::filesystem::path& path, CaptureParams& params, std::string& error);

} // namespace dscapture::params
