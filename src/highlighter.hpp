#pragma once
/*
 * Highlighter
 *
 * Purpose: classify every grapheme of one Row.
 * Design: an ordered rule table tried at each position, first match wins:
 *   multi-line comment → character literal → line comment → primary keyword
 *   → secondary keyword → string → number; unmatched units are None.
 * Search matches are a separate overlay (highlight_match), applied on top.
 */
#include <string_view>
#include <vector>
#include "filetype.hpp"
#include "highlight_type.hpp"

class Row;

class Highlighter {
public:
  explicit Highlighter(const HighlightingOptions& opts) : opts_(opts) {}

  // Replaces out with one tag per unit of row. start_with_comment is the
  // previous row's result. Returns true when the row ends inside an open
  // multi-line comment.
  bool scan(const Row& row, bool start_with_comment, std::vector<HighlightType>& out) const;

  // Retags every non-overlapping forward occurrence of word as Match.
  static void highlight_match(const Row& row, std::string_view word, std::vector<HighlightType>& tags);

private:
  const HighlightingOptions& opts_;
};

// ASCII punctuation or ASCII whitespace, as a single-byte grapheme.
bool is_separator(std::string_view unit);
