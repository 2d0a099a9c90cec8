#include "input.hpp"
#include "grapheme.hpp"
#include <ncurses.h>

static constexpr unsigned int ESC = 27;
static constexpr unsigned int DEL = 127;

static Key decode_function_key(unsigned int ch) {
  switch (ch) {
    case KEY_LEFT: return Key::of(KeyKind::Left);
    case KEY_RIGHT: return Key::of(KeyKind::Right);
    case KEY_UP: return Key::of(KeyKind::Up);
    case KEY_DOWN: return Key::of(KeyKind::Down);
    case KEY_HOME: return Key::of(KeyKind::Home);
    case KEY_END: return Key::of(KeyKind::End);
    case KEY_PPAGE: return Key::of(KeyKind::PageUp);
    case KEY_NPAGE: return Key::of(KeyKind::PageDown);
    case KEY_DC: return Key::of(KeyKind::Delete);
    case KEY_BACKSPACE: return Key::of(KeyKind::Backspace);
    case KEY_ENTER: return Key::of(KeyKind::Enter);
    default: return Key{};
  }
}

Key decode_key(int status, unsigned int ch) {
  if (status == ERR) return Key{};
  if (status == KEY_CODE_YES) return decode_function_key(ch);
  if (ch == '\n' || ch == '\r') return Key::of(KeyKind::Enter);
  if (ch == DEL || ch == 8) return Key::of(KeyKind::Backspace);
  if (ch == ESC) return Key::of(KeyKind::Escape);
  if (ch == '\t') return Key::chr("\t");
  if (ch >= 1 && ch <= 26) return Key::with_ctrl(static_cast<char>('a' + ch - 1));
  if (ch < 32) return Key{};
  return Key::chr(to_utf8(static_cast<wchar_t>(ch)));
}
