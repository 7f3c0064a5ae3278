#include "headless_terminal.hpp"
#include "input.hpp"
#include "utf8.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), grid_(rows, std::vector<Cell>(cols)) {}

HeadlessTerminal::~HeadlessTerminal() {}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  for (auto& row : grid_) for (auto& c : row) c = Cell{};
}

void HeadlessTerminal::put(int row, int col, const std::string& text, Style style) {
  if (row < 0 || row >= rows_) return;
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    size_t n = utf8_seq_len(static_cast<unsigned char>(text[i]));
    if (i + n > text.size()) n = text.size() - i;
    if (col >= 0) grid_[row][col] = Cell{text.substr(i, n), style};
    i += n;
    col++;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, Style::Normal);
}

void HeadlessTerminal::draw_styled(int row, int col, const std::string& text, Style style) {
  put(row, col, text, style);
}

void HeadlessTerminal::move_cursor(int row, int col) { cur_row_ = row; cur_col_ = col; }

void HeadlessTerminal::refresh() { frames_.push_back(screen_text()); }

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  for (int c = std::max(0, col); c < cols_; ++c) grid_[row][c] = Cell{};
}

int HeadlessTerminal::read_key(int) {
  if (script_.empty()) return keys::CtrlC;
  int k = script_.front();
  script_.pop_front();
  return k;
}

void HeadlessTerminal::suspend() { suspends_++; suspended_ = true; }

void HeadlessTerminal::resume() { resumes_++; suspended_ = false; }

void HeadlessTerminal::push_key(int key) { script_.push_back(key); }

void HeadlessTerminal::push_keys(const std::string& ascii) {
  for (char c : ascii) script_.push_back(static_cast<unsigned char>(c));
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  grid_.assign(rows, std::vector<Cell>(cols));
  script_.push_front(keys::Resize);
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return {};
  std::string s;
  for (const auto& c : grid_[row]) s += c.ch;
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

std::string HeadlessTerminal::screen_text() const {
  std::string out;
  for (int r = 0; r < rows_; ++r) {
    if (r) out += '\n';
    out += row_text(r);
  }
  return out;
}

bool HeadlessTerminal::contains(const std::string& needle) const {
  return screen_text().find(needle) != std::string::npos;
}

int HeadlessTerminal::find_row(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) if (row_text(r).find(needle) != std::string::npos) return r;
  return -1;
}

Style HeadlessTerminal::style_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return Style::Normal;
  return grid_[row][col].style;
}
