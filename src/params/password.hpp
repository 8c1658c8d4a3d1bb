#pragma once

#include <string>
#include <string_view>

namespace dscapture::params {

// Reverses the manager-parameter obfuscation applied to share passwords:
// bytes at even offsets were stored one lower, odd offsets one higher.
std::string DecodePassword(std::string_view encoded);

// Inverse of DecodePassword. Used when writing parameter fixtures.
std::string EncodePassword(std::string_view plain);

} // namespace dscapture::params
