#include "ncurses_terminal.hpp"
#include "input.hpp"
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>

// color pair ids, one per Style that carries a color
enum : short { PairTitle = 1, PairSelected, PairError, PairSuccess, PairBorder, PairDim };

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    short bg = COLOR_BLACK;
    if (use_default_colors() == OK) bg = -1; // keep the user's background
    init_pair(PairTitle, COLOR_MAGENTA, bg);
    init_pair(PairSelected, COLOR_MAGENTA, bg);
    init_pair(PairError, COLOR_RED, bg);
    init_pair(PairSuccess, COLOR_GREEN, bg);
    init_pair(PairBorder, COLOR_MAGENTA, bg);
    init_pair(PairDim, COLOR_WHITE, bg);
    colors_ = true;
  }
  curs_set(0);
}

NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() {
  if (suspended_) return;
  erase();
}

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (suspended_) return;
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

static attr_t attrs_for(Style style, bool colors) {
  auto pair = [colors](short id) -> attr_t { return colors ? COLOR_PAIR(id) : 0; };
  switch (style) {
    case Style::Normal: return A_NORMAL;
    case Style::Title: return A_BOLD | pair(PairTitle);
    case Style::Selected: return A_BOLD | pair(PairSelected);
    case Style::Dim: return A_DIM | pair(PairDim);
    case Style::Strike: return A_DIM | pair(PairDim);
    case Style::Highlight: return A_REVERSE;
    case Style::Error: return A_BOLD | pair(PairError);
    case Style::Success: return A_BOLD | pair(PairSuccess);
    case Style::Border: return pair(PairBorder);
  }
  return A_NORMAL;
}

void NcursesTerminal::draw_styled(int row, int col, const std::string& text, Style style) {
  if (suspended_) return;
  attr_t a = attrs_for(style, colors_);
  if (a != A_NORMAL) attron(a);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (a != A_NORMAL) attroff(a);
}

void NcursesTerminal::move_cursor(int row, int col) {
  if (suspended_) return;
  move(row, col);
}

// after endwin() a refresh would take the tty back from the child
void NcursesTerminal::refresh() {
  if (suspended_) return;
  ::refresh();
}

void NcursesTerminal::clear_to_eol(int row, int col) {
  if (suspended_) return;
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key(int timeout_ms) {
  wtimeout(stdscr, timeout_ms);
  int ch = wgetch(stdscr);
  switch (ch) {
    case ERR: return keys::None;
    case KEY_UP: return keys::Up;
    case KEY_DOWN: return keys::Down;
    case KEY_LEFT: return keys::Left;
    case KEY_RIGHT: return keys::Right;
    case KEY_PPAGE: return keys::PageUp;
    case KEY_NPAGE: return keys::PageDown;
    case KEY_HOME: return keys::Home;
    case KEY_END: return keys::End;
    case KEY_RESIZE: return keys::Resize;
    case KEY_BACKSPACE: case 8: case 127: return keys::Backspace;
    case KEY_ENTER: case '\r': case '\n': return keys::Enter;
    default: break;
  }
  if (ch > 0xff) return keys::None; // function keys the selector has no use for
  return ch;
}

void NcursesTerminal::suspend() {
  if (suspended_) return;
  def_prog_mode();
  endwin();
  suspended_ = true;
}

void NcursesTerminal::resume() {
  if (!suspended_) return;
  reset_prog_mode();
  ::refresh();
  suspended_ = false;
}
