#pragma once

#include <array>
#include <cctype>
#include <string>
#include <string_view>

namespace cadence::util {

/**
 * Boyer-Moore-Horspool literal search.
 * Bad-character table only, so setup is O(m + 256) and the average scan is
 * sublinear. Works on bytes: callers fold UTF-8 text before searching when
 * they need Unicode-aware matching.
 */
class BoyerMooreSearch {
public:
    explicit BoyerMooreSearch(std::string pattern, bool case_sensitive = false);

    /// Position of the first match at or after start_pos, -1 if none.
    int search(std::string_view text, int start_pos = 0) const;

    /// Substring test. The empty pattern matches every text.
    bool matches(std::string_view text) const;

    bool empty() const { return pattern_.empty(); }

private:
    std::array<int, 256> bad_char_{};
    std::string pattern_;
    bool case_sensitive_;

    unsigned char normalize_char(unsigned char c) const {
        return case_sensitive_ ? c : static_cast<unsigned char>(std::tolower(c));
    }
};

}  // namespace cadence::util
