#include "params/password.hpp"

namespace dscapture::params {

std::string DecodePassword(std::string_view encoded) {
  std::string decoded(encoded);
  for (std::size_t i = 0; i < decoded.size(); ++i) {
    const int shift = (i % 2U == 0U) ? 1 : -1;
    decoded[i] = static_cast<char>(static_cast<unsigned char>(decoded[i]) + shift);
  }
  return decoded;
}

std::string EncodePassword(std::string_view plain) {
  std::string encoded(plain);
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    const int shift = (i % 2U == 0U) ? -1 : 1;
    encoded[i] = static_cast<char>(static_cast<unsigned char>(encoded[i]) + shift);
  }
  return encoded;
}

} // namespace dscapture::params
