#include "ncurses_terminal.hpp"
#include <ncurses.h>
#include <array>

namespace {

struct Rgb { short r, g, b; short fallback; };

// Indexed by HighlightType.
constexpr std::array<Rgb, kHighlightTypeCount> kPalette = {{
  {255, 255, 255, -1},            // None
  {220, 163, 163, COLOR_RED},     // Number
  { 38, 139, 210, COLOR_BLUE},    // Match
  {211,  54, 130, COLOR_MAGENTA}, // String
  {108, 113, 196, COLOR_MAGENTA}, // Character
  {133, 153,   0, COLOR_GREEN},   // Comment
  {133, 153,   0, COLOR_GREEN},   // MultilineComment
  {181, 137,   0, COLOR_YELLOW},  // PrimaryKeyword
  { 42, 161, 152, COLOR_CYAN},    // SecondaryKeyword
}};

constexpr short kFirstCustomColor = 16;

short pair_for(HighlightType t) { return static_cast<short>(static_cast<int>(t) + 1); }

short scale(short c) { return static_cast<short>(c * 1000 / 255); }

}  // namespace

NcursesTerminal::NcursesTerminal(bool enable_color) {
  if (!enable_color || !has_colors()) return;
  start_color();
  bool default_bg = use_default_colors() == OK;
  short bg = default_bg ? -1 : COLOR_BLACK;
  bool rgb = can_change_color() && COLORS >= kFirstCustomColor + kHighlightTypeCount;
  for (int i = 0; i < kHighlightTypeCount; ++i) {
    const Rgb& c = kPalette[static_cast<size_t>(i)];
    short fg = c.fallback;
    if (rgb && i != 0) {
      fg = static_cast<short>(kFirstCustomColor + i);
      init_color(fg, scale(c.r), scale(c.g), scale(c.b));
    }
    if (fg < 0 && !default_bg) fg = COLOR_WHITE;
    init_pair(pair_for(static_cast<HighlightType>(i)), fg, bg);
  }
  color_ = true;
}

NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_styled(int row, int col, const std::string& text, HighlightType type) {
  if (!color_ || type == HighlightType::None) { draw_text(row, col, text); return; }
  attron(COLOR_PAIR(pair_for(type)));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(COLOR_PAIR(pair_for(type)));
}

void NcursesTerminal::draw_inverted(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

Key NcursesTerminal::read_key() {
  wint_t ch = 0;
  int status = get_wch(&ch);
  return decode_key(status, static_cast<unsigned int>(ch));
}
