#include "row.hpp"
#include "config.hpp"
#include "grapheme.hpp"
#include "highlighter.hpp"
#include <algorithm>

Row::Row() : bounds_{0} {}

Row::Row(std::string_view s) : string_(s) { reindex(); }

void Row::reindex() {
  bounds_ = grapheme_bounds(string_);
  len_ = bounds_.size() - 1;
}

std::string_view Row::unit(size_t i) const {
  return std::string_view(string_).substr(bounds_[i], bounds_[i + 1] - bounds_[i]);
}

void Row::insert(size_t at, std::string_view unit) {
  if (at >= len_) string_.append(unit);
  else string_.insert(bounds_[at], unit);
  reindex();
  state_ = HighlightState::Stale;
}

void Row::remove(size_t at) {
  if (at >= len_) return;
  string_.erase(bounds_[at], bounds_[at + 1] - bounds_[at]);
  reindex();
  state_ = HighlightState::Stale;
}

void Row::append(const Row& other) {
  string_ += other.string_;
  reindex();
  state_ = HighlightState::Stale;
}

Row Row::split(size_t at) {
  at = std::min(at, len_);
  Row tail(std::string_view(string_).substr(bounds_[at]));
  string_.resize(bounds_[at]);
  reindex();
  if (base_.size() > len_) base_.resize(len_);
  if (highlighting_.size() > len_) highlighting_.resize(len_);
  state_ = HighlightState::Stale;
  return tail;
}

std::vector<StyledRun> Row::render(size_t start, size_t end) const {
  end = std::min(end, len_);
  start = std::min(start, end);
  std::vector<StyledRun> runs;
  for (size_t i = start; i < end; ++i) {
    HighlightType t = i < highlighting_.size() ? highlighting_[i] : HighlightType::None;
    std::string_view u = unit(i);
    if (u == "\t") u = SCRIBE_TAB_RENDER;
    if (!runs.empty() && runs.back().type == t) runs.back().text.append(u);
    else runs.push_back({std::string(u), t});
  }
  return runs;
}

std::optional<size_t> Row::find(std::string_view query, size_t at, SearchDirection direction) const {
  if (at > len_ || query.empty()) return std::nullopt;
  size_t start = direction == SearchDirection::Forward ? at : 0;
  size_t end = direction == SearchDirection::Forward ? len_ : at;
  size_t base = bounds_[start];
  std::string_view window = std::string_view(string_).substr(base, bounds_[end] - base);

  // Only a match that begins and ends on grapheme boundaries counts.
  auto to_unit = [&](size_t byte) -> std::optional<size_t> {
    auto first = bounds_.begin() + static_cast<std::ptrdiff_t>(start);
    auto last = bounds_.begin() + static_cast<std::ptrdiff_t>(end) + 1;
    auto it = std::lower_bound(first, last, base + byte);
    if (it == last || *it != base + byte) return std::nullopt;
    if (!std::binary_search(it, last, base + byte + query.size())) return std::nullopt;
    return static_cast<size_t>(it - bounds_.begin());
  };

  if (direction == SearchDirection::Forward) {
    for (size_t pos = window.find(query); pos != std::string_view::npos; pos = window.find(query, pos + 1)) {
      if (auto idx = to_unit(pos)) return idx;
    }
  } else {
    for (size_t pos = window.rfind(query); pos != std::string_view::npos; pos = window.rfind(query, pos - 1)) {
      if (auto idx = to_unit(pos)) return idx;
      if (pos == 0) break;
    }
  }
  return std::nullopt;
}

bool Row::highlight(const HighlightingOptions& opts, std::string_view word, bool start_with_comment) {
  if (state_ == HighlightState::Fresh) {
    apply_match(word);
    std::string_view s(string_);
    return !base_.empty() && base_.back() == HighlightType::MultilineComment
        && (s.size() < 2 || s.substr(s.size() - 2) != "*/");
  }
  Highlighter h(opts);
  bool open = h.scan(*this, start_with_comment, base_);
  state_ = open ? HighlightState::FreshPending : HighlightState::Fresh;
  apply_match(word);
  return open;
}

void Row::apply_match(std::string_view word) {
  highlighting_ = base_;
  Highlighter::highlight_match(*this, word, highlighting_);
}
