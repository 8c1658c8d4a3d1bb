#include "params/param_set.hpp"

#include "core/string_utils.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace dscapture::params {

std::string ParamSet::NormalizeKey(std::string_view key) {
  return core::ToLowerAscii(core::TrimAscii(key));
}

void ParamSet::SetParam(std::string_view key, std::string value) {
  values_[NormalizeKey(key)] = Entry{std::string(key), std::move(value)};
}

bool ParamSet::HasParam(std::string_view key) const {
  return values_.find(NormalizeKey(key)) != values_.end();
}

std::string ParamSet::GetString(std::string_view key, std::string_view value_if_missing) const {
  const auto it = values_.find(NormalizeKey(key));
  if (it == values_.end()) {
    return std::string(value_if_missing);
  }
  return it->second.value;
}

int ParamSet::GetInt(std::string_view key, const int value_if_missing) const {
  const auto it = values_.find(NormalizeKey(key));
  if (it == values_.end()) {
    return value_if_missing;
  }

  const std::string text = core::TrimAscii(it->second.value);
  int parsed = 0;
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end || text.empty()) {
    return value_if_missing;
  }
  return parsed;
}

bool ParamSet::GetBool(std::string_view key, const bool value_if_missing) const {
  const auto it = values_.find(NormalizeKey(key));
  if (it == values_.end()) {
    return value_if_missing;
  }

  const std::string normalized = core::ToLowerAscii(core::TrimAscii(it->second.value));
  if (normalized == "true" || normalized == "yes" || normalized == "1") {
    return true;
  }
  if (normalized == "false" || normalized == "no" || normalized == "0") {
    return false;
  }
  return value_if_missing;
}

std::vector<std::string> ParamSet::Keys() const {
  std::vector<std::string> keys;
  keys.reserve(values_.size());
  for (const auto& [normalized, entry] : values_) {
    (void)normalized;
    keys.push_back(entry.key);
  }
  return keys;
}

} // namespace dscapture::params
