#include "capture/name_similarity.hpp"

#include <cctype>

namespace dscapture::capture {

std::vector<std::string> LetterPairs(std::string_view text) {
  std::vector<std::string> pairs;
  std::string word;

  const auto flush_word = [&]() {
    for (std::size_t i = 0; i + 1U < word.size(); ++i) {
      pairs.push_back(word.substr(i, 2));
    }
    word.clear();
  };

  for (const char c : text) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      word.push_back(static_cast<char>(std::toupper(uc)));
    } else {
      flush_word();
    }
  }
  flush_word();
  return pairs;
}

double CompareNames(std::string_view first, std::string_view second) {
  const std::vector<std::string> first_pairs = LetterPairs(first);
  std::vector<std::string> second_pairs = LetterPairs(second);

  const std::size_t total = first_pairs.size() + second_pairs.size();
  if (total == 0U) {
    return 0.0;
  }

  std::size_t shared = 0;
  for (const std::string& pair : first_pairs) {
    for (auto it = second_pairs.begin(); it != second_pairs.end(); ++it) {
      if (*it == pair) {
        ++shared;
        // Each pair of the second name matches at most once.
        second_pairs.erase(it);
        break;
      }
    }
  }

  return (2.0 * static_cast<double>(shared)) / static_cast<double>(total);
}

} // namespace dscapture::capture
