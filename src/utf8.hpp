#pragma once
/*
 * UTF-8 helpers
 *
 * Purpose: count and cut strings by code point so list rows and boxes fit the terminal width.
 * Note: one code point = one column; wide CJK glyphs are not special-cased.
 */
#include <string>
#include <cstddef>
#include <vector>

size_t utf8_seq_len(unsigned char lead);
size_t utf8_width(const std::string& s);
// Cut to at most `width` columns; when cut and width > 3, ends with "...".
std::string utf8_truncate(const std::string& s, size_t width);
// Cut to at most `width` columns without an ellipsis.
std::string utf8_prefix(const std::string& s, size_t width);
std::string utf8_pad(const std::string& s, size_t width);
// Word-wraps one paragraph line to width columns; words longer than width are split.
void utf8_wrap_into(const std::string& line, size_t width, std::vector<std::string>& out);
