#pragma once
/*
 * Layout
 *
 * Purpose: split the terminal into header / body / status / footer rows and place overlay boxes.
 * Constraint: computed from the current TermSize on every frame; no height is cached, so a
 *             resize takes effect on the next render.
 */
#include "iterminal.hpp"
#include "types.hpp"

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

struct ScreenLayout {
  Rect header; // title row + filter/blank row
  Rect body;
  Rect status;
  Rect footer;
};

// header 2 rows, status + footer 2 rows; the Detail body is clamped to at least one row
ScreenLayout compute_layout(TermSize size, View view);

// Centers a box of content_rows x content_cols plus border and padding; clipped to the screen.
Rect centered_box(TermSize size, int content_rows, int content_cols, int pad_rows, int pad_cols);

// top row that keeps `cursor` inside a window of `height` rows, moving as little as possible
int follow_cursor(int top, int cursor, int height, int total);
