#pragma once
/*
 * Input
 *
 * Purpose: decode curses key codes (get_wch results) into editor keys.
 * Note: printable input arrives as UTF-8 text; Ctrl-letter keys keep the letter.
 */
#include <string>

enum class KeyKind {
  None,
  Char,
  Ctrl,
  Enter,
  Backspace,
  Delete,
  Left,
  Right,
  Up,
  Down,
  Home,
  End,
  PageUp,
  PageDown,
  Escape,
};

struct Key {
  KeyKind kind = KeyKind::None;
  std::string text;  // Char: the typed grapheme
  char ctrl = 0;     // Ctrl: lowercase letter

  static Key chr(std::string s) { return Key{KeyKind::Char, std::move(s), 0}; }
  static Key with_ctrl(char c) { return Key{KeyKind::Ctrl, std::string(), c}; }
  static Key of(KeyKind k) { return Key{k, std::string(), 0}; }
  bool is_ctrl(char c) const { return kind == KeyKind::Ctrl && ctrl == c; }
};

// status is the get_wch return value: OK, KEY_CODE_YES or ERR.
Key decode_key(int status, unsigned int ch);
