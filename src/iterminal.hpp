#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys, handoff).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Note: suspend() releases the tty to a child process; resume() takes it back.
 */
#include <string>

struct TermSize { int rows; int cols; };

enum class Style { Normal, Title, Selected, Dim, Strike, Highlight, Error, Success, Border };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_styled(int row, int col, const std::string& text, Style style) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
  // keys:: code, or keys::None after timeout_ms without input
  virtual int read_key(int timeout_ms) = 0;
  virtual void suspend() = 0;
  virtual void resume() = 0;
};
