#pragma once
/*
 * Row
 *
 * Purpose: one editable line: UTF-8 content, cached grapheme boundaries and
 *          the classification tags of its last scan.
 * Unit: every column, length, edit position and tag index counts extended
 *       grapheme clusters. Boundaries are recomputed after each mutation.
 * Freshness: Stale → (highlight) → Fresh | FreshPending; any mutation → Stale.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "filetype.hpp"
#include "highlight_type.hpp"
#include "types.hpp"

struct StyledRun {
  std::string text;
  HighlightType type = HighlightType::None;
  bool operator==(const StyledRun&) const = default;
};

enum class HighlightState {
  Stale,
  Fresh,         // scanned, ends outside any comment
  FreshPending,  // scanned, ends inside an open multi-line comment
};

class Row {
public:
  Row();
  explicit Row(std::string_view s);

  const std::string& string() const { return string_; }
  size_t len() const { return len_; }
  bool is_empty() const { return len_ == 0; }
  // Grapheme at index i; i must be < len().
  std::string_view unit(size_t i) const;

  void insert(size_t at, std::string_view unit);
  void remove(size_t at);
  void append(const Row& other);
  // Keeps [0, at) in this row and returns [at, len) as a new row.
  Row split(size_t at);

  std::vector<StyledRun> render(size_t start, size_t end) const;
  std::optional<size_t> find(std::string_view query, size_t at, SearchDirection direction) const;

  // Returns true when the row ends inside an unterminated multi-line comment.
  bool highlight(const HighlightingOptions& opts, std::string_view word, bool start_with_comment);
  const std::vector<HighlightType>& highlighting() const { return highlighting_; }
  HighlightState highlight_state() const { return state_; }
  bool is_highlighted() const { return state_ != HighlightState::Stale; }
  void unhighlight() { state_ = HighlightState::Stale; }

private:
  void reindex();
  void apply_match(std::string_view word);

  std::string string_;
  std::vector<size_t> bounds_;
  size_t len_ = 0;
  std::vector<HighlightType> base_;
  std::vector<HighlightType> highlighting_;
  HighlightState state_ = HighlightState::Stale;
};
