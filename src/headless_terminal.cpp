#include "headless_terminal.hpp"
#include "grapheme.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), grid_(static_cast<size_t>(rows), std::vector<Cell>(static_cast<size_t>(cols))) {}

void HeadlessTerminal::clear() {
  for (auto& r : grid_) for (auto& c : r) c = Cell{};
}

void HeadlessTerminal::put(int row, int col, const std::string& text, HighlightType type, bool inverted) {
  if (row < 0 || row >= rows_) return;
  auto bounds = grapheme_bounds(text);
  for (size_t i = 0; i + 1 < bounds.size(); ++i, ++col) {
    if (col < 0) continue;
    if (col >= cols_) break;
    grid_[row][col] = Cell{text.substr(bounds[i], bounds[i + 1] - bounds[i]), type, inverted};
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, HighlightType::None, false);
}

void HeadlessTerminal::draw_styled(int row, int col, const std::string& text, HighlightType type) {
  put(row, col, text, type, false);
}

void HeadlessTerminal::draw_inverted(int row, int col, const std::string& text) {
  put(row, col, text, HighlightType::None, true);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) grid_[row][c] = Cell{};
}

Key HeadlessTerminal::read_key() {
  if (keys_.empty()) return Key::of(KeyKind::Escape);
  Key k = std::move(keys_.front());
  keys_.pop_front();
  return k;
}

void HeadlessTerminal::push_text(const std::string& s) {
  auto bounds = grapheme_bounds(s);
  for (size_t i = 0; i + 1 < bounds.size(); ++i) {
    std::string g = s.substr(bounds[i], bounds[i + 1] - bounds[i]);
    if (g == "\n") push_key(Key::of(KeyKind::Enter));
    else push_key(Key::chr(std::move(g)));
  }
}

std::string HeadlessTerminal::line(int row) const {
  std::string out;
  for (const auto& c : grid_[row]) out += c.glyph;
  size_t end = out.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : out.substr(0, end + 1);
}
