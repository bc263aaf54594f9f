#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace cellflow::core {

// Byte length of the UTF-8 sequence starting with `lead`.
size_t utf8_char_len(unsigned char lead);

// Splits UTF-8 text into one string per code point. Each code point
// occupies one cell.
std::vector<std::string> split_glyphs(std::string_view text);

int display_width(std::string_view text);

// Greedy word wrap. Hard newlines always break; words longer than
// `width` are split across lines. A non-positive width disables wrapping.
std::vector<std::string> wrap_text(std::string_view text, int width);

} // namespace cellflow::core
