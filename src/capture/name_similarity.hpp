#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dscapture::capture {

// Score at or above which a nested instrument folder counts as the same name
// as its parent.
constexpr double kNestedFolderSimilarityThreshold = 0.75;

// Adjacent letter pairs of each alphanumeric run, upper-cased.
std::vector<std::string> LetterPairs(std::string_view text);

// Dice coefficient over letter pairs: 1.0 for identical names, 0.0 when no
// pair is shared. Symbols and whitespace only separate words.
double CompareNames(std::string_view first, std::string_view second);

} // namespace dscapture::capture
