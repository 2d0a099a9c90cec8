#pragma once
/*
 * Editor
 *
 * Purpose: interactive loop around one Document: key dispatch, cursor
 *          movement, prompts (save as, incremental search), quit guard.
 * State: cursor, viewport, search word and status message live here and
 *        are passed into the Document as parameters.
 */
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include "config.hpp"
#include "document.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"
#include "types.hpp"

class Editor {
public:
  Editor(ITerminal& term, const std::optional<std::filesystem::path>& file, EditorConfig cfg = EditorConfig());

  void run();
  void refresh_screen();
  void process_key(const Key& key);

  bool should_quit() const { return should_quit_; }
  const Document& document() const { return doc_; }
  const Position& cursor() const { return cursor_; }
  const Viewport& viewport() const { return vp_; }
  const std::string& search_word() const { return search_word_; }
  const std::string& status_message() const { return message_; }
  void set_status_message(std::string msg);

private:
  using PromptCallback = std::function<void(const Key&, const std::string&)>;

  std::optional<std::string> prompt(const std::string& label, const PromptCallback& callback = nullptr);
  void save();
  void search();
  void move_cursor(KeyKind kind);
  void scroll();
  int text_rows() const;
  int text_cols() const;
  size_t row_len(size_t y) const;

  ITerminal& term_;
  EditorConfig cfg_;
  Document doc_;
  Renderer renderer_;
  Position cursor_;
  Viewport vp_;
  std::string search_word_;
  std::string message_;
  std::chrono::steady_clock::time_point message_time_;
  int quit_times_;
  bool should_quit_ = false;
};
