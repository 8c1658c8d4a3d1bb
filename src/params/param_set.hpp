#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace dscapture::params {

// Key/value parameter store with case-insensitive keys.
//
// Two instances travel with every capture: the per-job task parameters and
// the worker-wide manager parameters. Values are kept as strings, matching
// the broker records they originate from; typed getters parse on read.
class ParamSet {
public:
  ParamSet() = default;

  void SetParam(std::string_view key, std::string value);
  bool HasParam(std::string_view key) const;

  std::string GetString(std::string_view key, std::string_view value_if_missing = "") const;

  // Non-numeric or missing values return `value_if_missing`.
  int GetInt(std::string_view key, int value_if_missing) const;

  // Accepts true/false, yes/no, 1/0 (case-insensitive).
  bool GetBool(std::string_view key, bool value_if_missing) const;

  // Original-case keys in sorted order.
  std::vector<std::string> Keys() const;

  std::size_t size() const {
    return values_.size();
  }

private:
  struct Entry {
    std::string key;
    std::string value;
  };

  static std::string NormalizeKey(std::string_view key);

  std::map<std::string, Entry> values_;
};

} // namespace dscapture::params
