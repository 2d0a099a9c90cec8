#pragma once
/*
 * Grapheme
 *
 * Purpose: extended grapheme cluster segmentation of UTF-8 text.
 * Backend: Boost.Locale boundary analysis (ICU) over a cached UTF-8 locale.
 * Invalid UTF-8: each byte outside a well-formed sequence is its own cluster.
 */
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Byte offsets of every cluster boundary: front() == 0, back() == s.size().
// An empty string yields {0}.
std::vector<size_t> grapheme_bounds(std::string_view s);

size_t grapheme_count(std::string_view s);

std::string to_utf8(wchar_t ch);
