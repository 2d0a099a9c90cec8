#pragma once
/*
 * Renderer
 *
 * Purpose: render rows, status bar and message bar; manage viewport scrolling.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from Editor to render.
 */
#include <string>
#include "config.hpp"
#include "document.hpp"
#include "iterminal.hpp"
#include "types.hpp"

// Rows reserved below the text area (status bar + message bar).
inline constexpr int kBarRows = 2;

class Renderer {
public:
  // Adjusts vp so that cursor lies inside a text_rows x text_cols window.
  static void scroll(const Position& cursor, Viewport& vp, int text_rows, int text_cols);

  void render(ITerminal& term,
              const Document& doc,
              const Position& cursor,
              Viewport& vp,
              const EditorConfig& cfg,
              const std::string& message);

  static int gutter_width(const Document& doc, const EditorConfig& cfg);
  static std::string status_line(const Document& doc, const Position& cursor, int cols);
};
