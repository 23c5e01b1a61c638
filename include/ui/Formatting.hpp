#pragma once

#include <string>

namespace halo::ui {

/**
 * Calculate the display width of a string, accounting for:
 * - ANSI CSI escape sequences (which don't take visual space)
 * - UTF-8 multi-byte characters and wide/combining code points
 */
int display_cols(const std::string& s);

/**
 * Truncate a string to fit within `width` display columns.
 * Escape sequences are copied through untouched.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate string if too long (with an ellipsis), pad with spaces if too
 * short. Result will be exactly `width` display columns.
 */
std::string trunc_pad(const std::string& s, int width);

/**
 * Left padding needed to center `s` inside `width` columns (never negative).
 */
int center_offset(const std::string& s, int width);

} // namespace halo::ui
