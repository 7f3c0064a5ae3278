#pragma once
/*
 * List/Detail view
 *
 * Purpose: turn a snapshot of the selector (ViewModel) plus the terminal size into a Screen,
 *          then paint that Screen through ITerminal.
 * Constraint: stateless; compose() is a pure function so it can be tested without a terminal.
 */
#include "iterminal.hpp"
#include "layout.hpp"
#include "types.hpp"
#include <string>
#include <vector>

struct ListRow {
  std::string title;
  std::string description;
  bool skippable = false;
};

enum class OverlayKind { None, Help, Confirmation };

struct ViewModel {
  View view = View::List;
  std::string title;

  // list page
  std::vector<ListRow> rows;   // visible projection only
  int cursor = 0;
  int list_top = 0;
  size_t total_items = 0;
  bool filter_typing = false;
  std::string filter_query;

  // detail page
  std::vector<std::string> detail_lines;
  int detail_top = 0;
  std::string detail_header;   // replaces the action hints in the header (pick modes)

  std::vector<std::string> footer_actions;
  std::string footer_override; // "Refreshing..." or a list-side pick status

  std::string status;
  StatusLevel status_level = StatusLevel::Info;

  OverlayKind overlay = OverlayKind::None;
  std::vector<std::string> overlay_lines;
};

struct Segment {
  int col = 0;
  std::string text;
  Style style = Style::Normal;
};

struct ScreenLine {
  std::vector<Segment> segments;
  std::string text() const; // segments flattened, gaps filled with spaces
};

struct Screen {
  TermSize size{0, 0};
  std::vector<ScreenLine> lines; // exactly size.rows entries
};

class ViewRenderer {
public:
  Screen compose(const ViewModel& vm, TermSize size) const;
  void paint(ITerminal& term, const Screen& screen) const;
  void render(ITerminal& term, const ViewModel& vm) const { paint(term, compose(vm, term.getSize())); }
};

// rows the list body can show at this size
int list_body_height(TermSize size);
int detail_body_height(TermSize size);
