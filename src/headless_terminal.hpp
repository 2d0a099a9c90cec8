#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests: records a grid of cells (one
 *          grapheme each, with its style) and replays scripted keys.
 * Note: an exhausted key script reads as Escape so prompts always terminate.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct Cell {
    std::string glyph = " ";
    HighlightType type = HighlightType::None;
    bool inverted = false;
  };

  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, HighlightType type) override;
  void draw_inverted(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { ++refresh_count_; }
  void clear_to_eol(int row, int col) override;
  Key read_key() override;

  void push_key(Key k) { keys_.push_back(std::move(k)); }
  void push_text(const std::string& s);

  // Row contents with trailing blanks stripped.
  std::string line(int row) const;
  const Cell& cell(int row, int col) const { return grid_[row][col]; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, const std::string& text, HighlightType type, bool inverted);

  int rows_;
  int cols_;
  std::vector<std::vector<Cell>> grid_;
  std::deque<Key> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refresh_count_ = 0;
};
