#include "renderer.hpp"
#include "grapheme.hpp"
#include <algorithm>
#include <string>

// First n graphemes of s.
static std::string take_graphemes(const std::string& s, size_t n) {
  auto bounds = grapheme_bounds(s);
  if (bounds.size() - 1 <= n) return s;
  return s.substr(0, bounds[n]);
}

static void render_welcome(ITerminal& term, int row, int cols, int indent) {
  std::string msg = "scribe editor -- version " SCRIBE_VERSION;
  int text_cols = std::max(0, cols - indent);
  msg = take_graphemes(msg, static_cast<size_t>(text_cols));
  int len = static_cast<int>(msg.size());
  int pad = std::max(0, (text_cols - len) / 2);
  term.draw_text(row, 0, "~");
  term.draw_text(row, indent + std::max(1, pad), msg);
}

void Renderer::scroll(const Position& cursor, Viewport& vp, int text_rows, int text_cols) {
  size_t height = static_cast<size_t>(std::max(1, text_rows));
  size_t width = static_cast<size_t>(std::max(1, text_cols));
  if (cursor.y < vp.top_line) vp.top_line = cursor.y;
  else if (cursor.y >= vp.top_line + height) vp.top_line = cursor.y - height + 1;
  if (cursor.x < vp.left_col) vp.left_col = cursor.x;
  else if (cursor.x >= vp.left_col + width) vp.left_col = cursor.x - width + 1;
}

int Renderer::gutter_width(const Document& doc, const EditorConfig& cfg) {
  if (!cfg.show_line_numbers) return 0;
  int digits = 1;
  size_t total = std::max<size_t>(1, doc.len());
  while (total >= 10) { total /= 10; digits++; }
  return digits + 1;  // one space after numbers
}

std::string Renderer::status_line(const Document& doc, const Position& cursor, int cols) {
  std::string name = doc.file_name() ? take_graphemes(doc.file_name()->string(), 20) : std::string("[No Name]");
  std::string status = name + " - " + std::to_string(doc.len()) + " lines" + (doc.is_dirty() ? " (modified)" : "");
  std::string line_indicator = doc.file_type().name() + " | " + std::to_string(cursor.y + 1) + "/" + std::to_string(doc.len());
  size_t width = static_cast<size_t>(std::max(0, cols));
  size_t used = grapheme_count(status) + grapheme_count(line_indicator);
  if (width > used) status.append(width - used, ' ');
  status += line_indicator;
  return take_graphemes(status, width);
}

void Renderer::render(ITerminal& term,
                      const Document& doc,
                      const Position& cursor,
                      Viewport& vp,
                      const EditorConfig& cfg,
                      const std::string& message) {
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  int text_rows = std::max(0, rows - kBarRows);
  int indent = gutter_width(doc, cfg);
  int text_cols = std::max(0, cols - indent);
  scroll(cursor, vp, text_rows, text_cols);
  term.clear();

  for (int i = 0; i < text_rows; ++i) {
    size_t line_idx = vp.top_line + static_cast<size_t>(i);
    const Row* r = doc.row(line_idx);
    if (!r) {
      if (doc.is_empty() && i == text_rows / 3) render_welcome(term, i, cols, indent);
      else term.draw_text(i, 0, "~");
      continue;
    }
    if (indent > 0) {
      std::string num = std::to_string(line_idx + 1);
      std::string pad(static_cast<size_t>(std::max(0, indent - 1 - static_cast<int>(num.size()))), ' ');
      term.draw_text(i, 0, pad + num + " ");
    }
    int col = indent;
    for (const auto& run : r->render(vp.left_col, vp.left_col + static_cast<size_t>(text_cols))) {
      term.draw_styled(i, col, run.text, run.type);
      col += static_cast<int>(grapheme_count(run.text));
      if (col >= cols) break;
    }
    term.clear_to_eol(i, std::min(col, cols));
  }

  if (rows >= kBarRows) {
    term.draw_inverted(rows - 2, 0, status_line(doc, cursor, cols));
    term.draw_text(rows - 1, 0, take_graphemes(message, static_cast<size_t>(std::max(0, cols))));
  }

  int screen_row = static_cast<int>(cursor.y) - static_cast<int>(vp.top_line);
  int screen_col = indent;
  if (const Row* r = doc.row(cursor.y)) {
    for (const auto& run : r->render(vp.left_col, cursor.x)) screen_col += static_cast<int>(grapheme_count(run.text));
  }
  screen_row = std::clamp(screen_row, 0, std::max(0, text_rows - 1));
  screen_col = std::clamp(screen_col, 0, std::max(0, cols - 1));
  term.move_cursor(screen_row, screen_col);
  term.refresh();
}
