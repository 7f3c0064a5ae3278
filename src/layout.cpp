#include "layout.hpp"
#include <algorithm>

static const int kHeaderRows = 2;
static const int kBottomRows = 2;

ScreenLayout compute_layout(TermSize size, View view) {
  ScreenLayout l;
  int rows = std::max(0, size.rows);
  int cols = std::max(0, size.cols);
  l.header = Rect{0, 0, std::min(kHeaderRows, rows), cols};
  int body_h = rows - kHeaderRows - kBottomRows;
  if (view == View::Detail) body_h = std::max(1, body_h);
  else body_h = std::max(0, body_h);
  l.body = Rect{kHeaderRows, 0, body_h, cols};
  l.status = Rect{std::max(0, rows - 2), 0, rows >= 2 ? 1 : 0, cols};
  l.footer = Rect{std::max(0, rows - 1), 0, rows >= 1 ? 1 : 0, cols};
  return l;
}

Rect centered_box(TermSize size, int content_rows, int content_cols, int pad_rows, int pad_cols) {
  int h = content_rows + 2 * pad_rows + 2;
  int w = content_cols + 2 * pad_cols + 2;
  h = std::min(h, std::max(0, size.rows));
  w = std::min(w, std::max(0, size.cols));
  int top = std::max(0, (size.rows - h) / 2);
  int left = std::max(0, (size.cols - w) / 2);
  return Rect{top, left, h, w};
}

int follow_cursor(int top, int cursor, int height, int total) {
  if (height <= 0 || total <= 0) return 0;
  if (cursor < top) top = cursor;
  if (cursor >= top + height) top = cursor - height + 1;
  int max_top = std::max(0, total - height);
  return std::clamp(top, 0, max_top);
}
