#pragma once
/*
 * HighlightType
 *
 * Purpose: closed set of classification tags a scan assigns to each grapheme.
 * Note: the core never maps tags to colors; renderers own that mapping.
 */
#include <string_view>

enum class HighlightType {
  None,
  Number,
  Match,
  String,
  Character,
  Comment,
  MultilineComment,
  PrimaryKeyword,
  SecondaryKeyword,
};

inline constexpr int kHighlightTypeCount = 9;

constexpr std::string_view highlight_type_name(HighlightType t) {
  switch (t) {
    case HighlightType::None: return "none";
    case HighlightType::Number: return "number";
    case HighlightType::Match: return "match";
    case HighlightType::String: return "string";
    case HighlightType::Character: return "character";
    case HighlightType::Comment: return "comment";
    case HighlightType::MultilineComment: return "multiline-comment";
    case HighlightType::PrimaryKeyword: return "primary-keyword";
    case HighlightType::SecondaryKeyword: return "secondary-keyword";
  }
  return "none";
}
