#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render checks.
 * Design: a grid of cells (one UTF-8 code point each, plus its Style); refresh() records
 *         the grid as a frame; read_key() replays a scripted key queue.
 * Note: once the script is exhausted read_key() reports ctrl+c, so every scripted run ends.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows = 24, int cols = 80);
  ~HeadlessTerminal() override;

  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_styled(int row, int col, const std::string& text, Style style) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  int read_key(int timeout_ms) override;
  void suspend() override;
  void resume() override;

  // script
  void push_key(int key);
  void push_keys(const std::string& ascii);
  // changes the grid size and queues a keys::Resize
  void resize(int rows, int cols);
  size_t pending_keys() const { return script_.size(); }

  // inspection
  std::string row_text(int row) const;   // trailing blanks trimmed
  std::string screen_text() const;       // rows joined by '\n'
  bool contains(const std::string& needle) const;
  int find_row(const std::string& needle) const; // -1 when absent
  Style style_at(int row, int col) const;
  const std::vector<std::string>& frames() const { return frames_; }
  int suspend_count() const { return suspends_; }
  int resume_count() const { return resumes_; }
  bool suspended() const { return suspended_; }
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }

private:
  struct Cell { std::string ch = " "; Style style = Style::Normal; };
  void put(int row, int col, const std::string& text, Style style);

  int rows_;
  int cols_;
  std::vector<std::vector<Cell>> grid_;
  std::deque<int> script_;
  std::vector<std::string> frames_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int suspends_ = 0;
  int resumes_ = 0;
  bool suspended_ = false;
};
