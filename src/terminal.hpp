#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct before NcursesTerminal; destructor restores the tty even when run() throws.
 * Note: manages terminal modes (raw/noecho/keypad), not rendering. Throws SelectorError
 *       when no terminal can be opened (e.g. stdout is not a tty and TERM is unusable).
 */
struct screen;

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
private:
  struct screen* screen_ = nullptr;
};
