#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncursesw for drawing and key input.
 * Colors: one color pair per HighlightType; RGB palette where the terminal
 *         can redefine colors, the 8 basic colors otherwise.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(bool enable_color);
  ~NcursesTerminal() override;
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, HighlightType type) override;
  void draw_inverted(int row, int col, const std::string& text) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  Key read_key() override;
private:
  bool color_ = false;
};
