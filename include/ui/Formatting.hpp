#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cadence::ui {

/// One UTF-8 character as the terminal sees it. cols is 0 for a combining
/// mark; complete is false when the text ends mid-sequence.
struct Glyph {
    size_t bytes = 1;
    int cols = 1;
    bool complete = true;
};

/// Decodes the character starting at byte i of s (i < s.size()).
Glyph next_glyph(std::string_view s, size_t i);

/**
 * Display width of a UTF-8 string in terminal columns. Wide (CJK)
 * characters count as two, combining marks as zero.
 */
int display_cols(const std::string& s);

/**
 * Longest prefix of s that fits in `width` columns.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate string if too long (with "…"), pad with spaces if too short.
 * Result is exactly `width` display columns.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Right-align within width (spaces on the left), truncating if too long.
 */
std::string rpad_trunc(const std::string& s, int width);

/**
 * Align left text and right text with space between.
 * Example: lr_align(20, "Vol", "80%") -> "Vol              80%"
 */
std::string lr_align(int width, const std::string& left, const std::string& right);

/**
 * "M:SS", or "H:MM:SS" from an hour on.
 */
std::string format_duration(int total_seconds);

} // namespace cadence::ui
