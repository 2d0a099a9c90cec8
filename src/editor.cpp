#include "editor.hpp"
#include "grapheme.hpp"
#include <glog/logging.h>
#include <algorithm>

Editor::Editor(ITerminal& term, const std::optional<std::filesystem::path>& file, EditorConfig cfg)
  : term_(term), cfg_(cfg), quit_times_(cfg.quit_times) {
  std::string msg = "HELP: Ctrl-F = find | Ctrl-S = save | Ctrl-Q = quit";
  if (file) {
    bool ok = true;
    std::string m;
    doc_ = Document::open(*file, m, ok);
    if (!ok) msg = "ERR: " + m;
  }
  set_status_message(msg);
}

void Editor::set_status_message(std::string msg) {
  message_ = std::move(msg);
  message_time_ = std::chrono::steady_clock::now();
}

int Editor::text_rows() const {
  return std::max(0, term_.get_size().rows - kBarRows);
}

int Editor::text_cols() const {
  return std::max(0, term_.get_size().cols - Renderer::gutter_width(doc_, cfg_));
}

size_t Editor::row_len(size_t y) const {
  const Row* r = doc_.row(y);
  return r ? r->len() : 0;
}

void Editor::scroll() {
  Renderer::scroll(cursor_, vp_, text_rows(), text_cols());
}

void Editor::run() {
  LOG(INFO) << "editor started: "
            << (doc_.file_name() ? doc_.file_name()->string() : std::string("[No Name]"));
  while (!should_quit_) {
    refresh_screen();
    process_key(term_.read_key());
  }
  LOG(INFO) << "editor quit" << (doc_.is_dirty() ? " discarding unsaved changes" : "");
}

void Editor::refresh_screen() {
  doc_.highlight(search_word_, vp_.top_line + static_cast<size_t>(text_rows()));
  auto age = std::chrono::steady_clock::now() - message_time_;
  bool fresh = age < std::chrono::seconds(SCRIBE_MESSAGE_TIMEOUT_SECS);
  renderer_.render(term_, doc_, cursor_, vp_, cfg_, fresh ? message_ : std::string());
}

void Editor::process_key(const Key& key) {
  if (key.is_ctrl('q')) {
    if (quit_times_ > 0 && doc_.is_dirty()) {
      set_status_message("WARNING! File has unsaved changes. Press Ctrl-Q "
                         + std::to_string(quit_times_) + " more times to quit.");
      quit_times_--;
      return;
    }
    should_quit_ = true;
    return;
  }
  switch (key.kind) {
    case KeyKind::Ctrl:
      if (key.ctrl == 's') save();
      else if (key.ctrl == 'f') search();
      break;
    case KeyKind::Enter:
      doc_.insert(cursor_, "\n");
      move_cursor(KeyKind::Right);
      break;
    case KeyKind::Char: {
      size_t before = row_len(cursor_.y);
      doc_.insert(cursor_, key.text);
      size_t after = row_len(cursor_.y);
      // a combining mark joins the grapheme before it
      if (after > before) cursor_.x += after - before;
    } break;
    case KeyKind::Delete:
      doc_.remove(cursor_);
      break;
    case KeyKind::Backspace:
      if (cursor_.x > 0 || cursor_.y > 0) {
        move_cursor(KeyKind::Left);
        doc_.remove(cursor_);
      }
      break;
    case KeyKind::Left: case KeyKind::Right: case KeyKind::Up: case KeyKind::Down:
    case KeyKind::Home: case KeyKind::End: case KeyKind::PageUp: case KeyKind::PageDown:
      move_cursor(key.kind);
      break;
    default: break;
  }
  scroll();
  if (quit_times_ < cfg_.quit_times) {
    quit_times_ = cfg_.quit_times;
    set_status_message(std::string());
  }
}

void Editor::move_cursor(KeyKind kind) {
  size_t page = static_cast<size_t>(std::max(1, text_rows()));
  size_t height = doc_.len();
  size_t y = cursor_.y, x = cursor_.x;
  size_t width = row_len(y);
  switch (kind) {
    case KeyKind::Up: if (y > 0) y--; break;
    case KeyKind::Down: if (y < height) y++; break;
    case KeyKind::Left:
      if (x > 0) x--;
      else if (y > 0) { y--; x = row_len(y); }
      break;
    case KeyKind::Right:
      if (x < width) x++;
      else if (y < height) { y++; x = 0; }
      break;
    case KeyKind::PageUp: y = y > page ? y - page : 0; break;
    case KeyKind::PageDown: y = y + page < height ? y + page : height; break;
    case KeyKind::Home: x = 0; break;
    case KeyKind::End: x = width; break;
    default: break;
  }
  x = std::min(x, row_len(y));
  cursor_ = Position{x, y};
}

std::optional<std::string> Editor::prompt(const std::string& label, const PromptCallback& callback) {
  std::string result;
  while (true) {
    set_status_message(label + result);
    refresh_screen();
    Key key = term_.read_key();
    if (key.kind == KeyKind::Enter) break;
    if (key.kind == KeyKind::Escape) { result.clear(); break; }
    if (key.kind == KeyKind::Backspace && !result.empty()) {
      auto bounds = grapheme_bounds(result);
      result.resize(bounds[bounds.size() - 2]);
    } else if (key.kind == KeyKind::Char && key.text != "\t") {
      result += key.text;
    }
    if (callback) callback(key, result);
  }
  set_status_message(std::string());
  if (result.empty()) return std::nullopt;
  return result;
}

void Editor::save() {
  std::string msg;
  bool ok = false;
  if (!doc_.file_name()) {
    auto name = prompt("Save as: ");
    if (!name) { set_status_message("Save aborted."); return; }
    ok = doc_.save_as(*name, msg);
  } else {
    ok = doc_.save(msg);
  }
  set_status_message(ok ? "File saved successfully: " + msg : "Error writing file! " + msg);
}

void Editor::search() {
  Position old_cursor = cursor_;
  Viewport old_vp = vp_;
  SearchDirection direction = SearchDirection::Forward;
  auto query = prompt("Search (ESC to cancel, Arrows to navigate): ", [&](const Key& key, const std::string& q) {
    bool moved = false;
    switch (key.kind) {
      case KeyKind::Right: case KeyKind::Down:
        direction = SearchDirection::Forward;
        move_cursor(KeyKind::Right);
        moved = true;
        break;
      case KeyKind::Left: case KeyKind::Up:
        direction = SearchDirection::Backward;
        break;
      default:
        direction = SearchDirection::Forward;
        break;
    }
    if (auto pos = doc_.find(q, cursor_, direction)) {
      cursor_ = *pos;
      scroll();
    } else if (moved) {
      move_cursor(KeyKind::Left);
    }
    search_word_ = q;
  });
  if (!query) {
    cursor_ = old_cursor;
    vp_ = old_vp;
  }
  search_word_.clear();
}
