#pragma once

#include <string>

namespace cadence::util {

/// Fold text into a search key: diacritics transliterated to ASCII
/// (Björk -> bjork) and lowercased. Used for both keys and queries so the
/// byte search sees the same folding on each side.
std::string normalize_for_search(const std::string& text);

/// Full Unicode case fold. Comparing folded strings bytewise gives a
/// case-insensitive order; sort keys are folded once instead of per compare.
std::string fold_case(const std::string& text);

/// Drops the last UTF-8 encoded character of text, if any.
void pop_utf8_char(std::string& text);

}  // namespace cadence::util
