#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing, key input and tty handoff.
 * Note: initialization/teardown is managed by Terminal RAII wrapper; construct it after Terminal.
 */
#include "iterminal.hpp"

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal() override;
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
private:
  bool colors_ = false;
  bool suspended_ = false;
};
