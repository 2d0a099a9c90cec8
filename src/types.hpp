#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Position/Viewport/SearchDirection).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>

// x counts grapheme clusters, y counts rows; both zero-based.
struct Position {
  size_t x = 0;
  size_t y = 0;
  bool operator==(const Position&) const = default;
};

struct Viewport { size_t top_line = 0; size_t left_col = 0; };

enum class SearchDirection { Forward, Backward };
