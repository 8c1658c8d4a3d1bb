#ifndef DSCAPTURE_TESTS_COMMON_ASSERTIONS_HPP_
#define DSCAPTURE_TESTS_COMMON_ASSERTIONS_HPP_

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

namespace dscapture::tests::common {

[[noreturn]] inline void Fail(std::string_view message) {
  std::cerr << message << '\n';
  std::abort();
}

inline void AssertTrue(bool condition, std::string_view message) {
  if (!condition) {
    Fail(message);
  }
}

inline void AssertEqual(std::string_view actual, std::string_view expected, std::string_view what) {
  if (actual == expected) {
    return;
  }
  std::cerr << what << ": expected '" << expected << "' but got '" << actual << "'\n";
  std::abort();
}

inline void AssertContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) != std::string_view::npos) {
    return;
  }
  std::cerr << "expected to find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertNotContains(std::string_view text, std::string_view needle) {
  if (text.find(needle) == std::string_view::npos) {
    return;
  }
  std::cerr << "expected to not find: " << needle << '\n';
  std::cerr << "actual text: " << text << '\n';
  std::abort();
}

inline void AssertExists(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Fail("expected path to exist: " + path.string());
  }
}

inline void AssertMissing(const std::filesystem::path& path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    Fail("expected path to be absent: " + path.string());
  }
}

inline std::string ReadFileToString(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    Fail("failed to open file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

// Creates parent directories as needed.
inline void WriteFile(const std::filesystem::path& path, std::string_view content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to create file: " + path.string());
  }
  output << content;
  if (!output) {
    Fail("failed to write file: " + path.string());
  }
}

} // namespace dscapture::tests::common

#endif // DSCAPTURE_TESTS_COMMON_ASSERTIONS_HPP_
