#include "util/BoyerMoore.hpp"

namespace cadence::util {

BoyerMooreSearch::BoyerMooreSearch(std::string pattern, bool case_sensitive)
    : pattern_(std::move(pattern)),
      case_sensitive_(case_sensitive) {
    const int m = static_cast<int>(pattern_.size());
    bad_char_.fill(m);

    // Last occurrence of each byte, excluding the final one
    for (int i = 0; i < m - 1; ++i) {
        unsigned char c = normalize_char(static_cast<unsigned char>(pattern_[i]));
        bad_char_[c] = m - 1 - i;
    }
}

int BoyerMooreSearch::search(std::string_view text, int start_pos) const {
    const int m = static_cast<int>(pattern_.size());
    const int n = static_cast<int>(text.size());

    if (m == 0 || start_pos < 0 || start_pos >= n || m > n) {
        return -1;
    }

    int i = start_pos;
    while (i <= n - m) {
        int j = m - 1;
        while (j >= 0 &&
               normalize_char(static_cast<unsigned char>(text[i + j])) ==
               normalize_char(static_cast<unsigned char>(pattern_[j]))) {
            --j;
        }
        if (j < 0) {
            return i;
        }

        unsigned char bad = normalize_char(static_cast<unsigned char>(text[i + m - 1]));
        i += bad_char_[bad] > 0 ? bad_char_[bad] : 1;
    }

    return -1;
}

bool BoyerMooreSearch::matches(std::string_view text) const {
    if (pattern_.empty()) return true;
    return search(text) != -1;
}

}  // namespace cadence::util
