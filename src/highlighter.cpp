#include "highlighter.hpp"
#include "grapheme.hpp"
#include "row.hpp"
#include <algorithm>
#include <array>
#include <cctype>

bool is_separator(std::string_view unit) {
  if (unit.size() != 1) return false;
  unsigned char c = static_cast<unsigned char>(unit[0]);
  if (c >= 0x80) return false;
  return std::ispunct(c) != 0 || std::isspace(c) != 0;
}

namespace {

struct Scan {
  const Row& row;
  const HighlightingOptions& opts;
  std::vector<HighlightType>& out;
  size_t len;
  size_t index = 0;
  bool open_comment = false;

  bool is(size_t i, char c) const {
    if (i >= len) return false;
    std::string_view u = row.unit(i);
    return u.size() == 1 && u[0] == c;
  }
  bool is_digit(size_t i) const {
    if (i >= len) return false;
    std::string_view u = row.unit(i);
    return u.size() == 1 && u[0] >= '0' && u[0] <= '9';
  }
  bool preceded_by_separator() const {
    return index == 0 || is_separator(row.unit(index - 1));
  }
  // Index just past the first "*/" at or after from, if any.
  size_t find_closing(size_t from) const {
    for (size_t i = from; i + 1 < len; ++i) {
      if (is(i, '*') && is(i + 1, '/')) return i + 2;
    }
    return len;
  }
  bool has_closing(size_t from) const {
    for (size_t i = from; i + 1 < len; ++i) {
      if (is(i, '*') && is(i + 1, '/')) return true;
    }
    return false;
  }
  void tag(size_t n, HighlightType t) {
    out.insert(out.end(), n, t);
    index += n;
  }
};

using Rule = bool (*)(Scan&);

bool multiline_comment(Scan& s) {
  if (!s.opts.multiline_comments || !s.is(s.index, '/') || !s.is(s.index + 1, '*')) return false;
  size_t from = s.index + 2;
  s.open_comment = !s.has_closing(from);
  s.tag(s.find_closing(from) - s.index, HighlightType::MultilineComment);
  return true;
}

bool character(Scan& s) {
  if (!s.opts.characters || !s.is(s.index, '\'') || s.index + 1 >= s.len) return false;
  size_t closing = s.is(s.index + 1, '\\') ? s.index + 3 : s.index + 2;
  if (!s.is(closing, '\'')) return false;
  s.tag(closing - s.index + 1, HighlightType::Character);
  return true;
}

bool line_comment(Scan& s) {
  if (!s.opts.comments || !s.is(s.index, '/') || !s.is(s.index + 1, '/')) return false;
  s.tag(s.len - s.index, HighlightType::Comment);
  return true;
}

// Number of units starting at from whose bytes spell word exactly, or 0.
size_t match_word(const Scan& s, size_t from, std::string_view word) {
  size_t consumed = 0;
  size_t i = from;
  while (consumed < word.size()) {
    if (i >= s.len) return 0;
    std::string_view u = s.row.unit(i);
    if (u.size() > word.size() - consumed || word.compare(consumed, u.size(), u) != 0) return 0;
    consumed += u.size();
    ++i;
  }
  return i - from;
}

bool keywords(Scan& s, const std::vector<std::string>& words, HighlightType type) {
  if (!s.preceded_by_separator()) return false;
  for (const auto& word : words) {
    if (word.empty()) continue;
    size_t n = match_word(s, s.index, word);
    if (n == 0) continue;
    size_t next = s.index + n;
    if (next < s.len && !is_separator(s.row.unit(next))) continue;
    s.tag(n, type);
    return true;
  }
  return false;
}

bool primary_keywords(Scan& s) { return keywords(s, s.opts.primary_keywords, HighlightType::PrimaryKeyword); }
bool secondary_keywords(Scan& s) { return keywords(s, s.opts.secondary_keywords, HighlightType::SecondaryKeyword); }

bool string_literal(Scan& s) {
  if (!s.opts.strings || !s.is(s.index, '"')) return false;
  size_t j = s.index + 1;
  while (j < s.len && !s.is(j, '"')) j++;
  size_t end = j < s.len ? j + 1 : s.len;
  s.tag(end - s.index, HighlightType::String);
  return true;
}

bool number(Scan& s) {
  if (!s.opts.numbers || !s.is_digit(s.index) || !s.preceded_by_separator()) return false;
  size_t j = s.index + 1;
  while (j < s.len && (s.is_digit(j) || s.is(j, '.'))) j++;
  s.tag(j - s.index, HighlightType::Number);
  return true;
}

constexpr std::array<Rule, 7> kRules = {
  multiline_comment,
  character,
  line_comment,
  primary_keywords,
  secondary_keywords,
  string_literal,
  number,
};

}  // namespace

bool Highlighter::scan(const Row& row, bool start_with_comment, std::vector<HighlightType>& out) const {
  out.clear();
  out.reserve(row.len());
  Scan s{row, opts_, out, row.len()};

  if (start_with_comment && opts_.multiline_comments) {
    s.open_comment = !s.has_closing(0);
    s.tag(s.find_closing(0), HighlightType::MultilineComment);
  }

  while (s.index < s.len) {
    bool matched = false;
    for (Rule rule : kRules) {
      if (rule(s)) { matched = true; break; }
    }
    if (!matched) s.tag(1, HighlightType::None);
  }
  return s.open_comment;
}

void Highlighter::highlight_match(const Row& row, std::string_view word, std::vector<HighlightType>& tags) {
  if (word.empty()) return;
  size_t word_len = grapheme_count(word);
  size_t index = 0;
  while (auto found = row.find(word, index, SearchDirection::Forward)) {
    size_t end = std::min(*found + word_len, row.len());
    for (size_t i = *found; i < end && i < tags.size(); ++i) tags[i] = HighlightType::Match;
    if (end <= *found) break;
    index = end;
  }
}
