#include "terminal.hpp"
#include "types.hpp"
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>
#include <locale.h>
#include <cstdio>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) throw SelectorError("can not initialize terminal");
  set_term(screen_);
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  endwin();
  delscreen(screen_);
}
