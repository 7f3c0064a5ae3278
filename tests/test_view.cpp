#include "view.hpp"
#include "headless_terminal.hpp"
#include "selector_text.hpp"
#include <cassert>
#include <string>
#include <vector>

static ViewModel list_model() {
  ViewModel vm;
  vm.view = View::List;
  vm.title = "Review comments";
  vm.rows = {ListRow{"first", "", false}, ListRow{"second", "note", false}, ListRow{"gone", "", true}};
  vm.total_items = 3;
  vm.cursor = 1;
  ActionSet set;
  vm.footer_actions = list_footer_actions(set);
  return vm;
}

static void test_list_page() {
  ViewRenderer r;
  Screen s = r.compose(list_model(), TermSize{10, 40});
  assert(s.lines.size() == 10);
  assert(s.lines[0].text() == " Review comments");
  assert(s.lines[1].text() == " 3 items");
  assert(s.lines[2].text() == "  first");
  assert(s.lines[3].text() == "> second - note");
  assert(s.lines[4].text() == "  gone");
  assert(s.lines[3].segments[0].style == Style::Selected);
  assert(s.lines[4].segments[0].style == Style::Strike);
  assert(s.lines[9].text() == "enter:view | ?:help | q:quit");
}

static void test_list_filter_header_and_empty() {
  ViewRenderer r;
  ViewModel vm = list_model();
  vm.filter_typing = true;
  vm.filter_query = "se";
  assert(r.compose(vm, TermSize{10, 40}).lines[1].text() == " Filter: se_");
  vm.filter_typing = false;
  vm.rows.resize(1);
  assert(r.compose(vm, TermSize{10, 40}).lines[1].text() == " Filter: se  (1/3)");

  vm.rows.clear();
  vm.filter_query.clear();
  Screen s = r.compose(vm, TermSize{10, 40});
  assert(s.lines[1].text() == " 0 items");
  assert(s.lines[2].text() == "  No items.");
}

static void test_footer_override_and_status() {
  ViewRenderer r;
  ViewModel vm = list_model();
  vm.footer_override = "Refreshing...";
  vm.status = "Refresh failed: timeout";
  vm.status_level = StatusLevel::Error;
  Screen s = r.compose(vm, TermSize{10, 40});
  assert(s.lines[9].text() == "Refreshing...");
  assert(s.lines[8].text() == "Refresh failed: timeout");
  assert(s.lines[8].segments[0].style == Style::Error);
}

static void test_long_rows_are_truncated() {
  ViewRenderer r;
  ViewModel vm = list_model();
  vm.rows = {ListRow{std::string(100, 'a'), "", false}};
  vm.cursor = 0;
  Screen s = r.compose(vm, TermSize{10, 20});
  std::string row = s.lines[2].text();
  assert(row.size() <= 20);
  assert(row.find("...") != std::string::npos);
}

static void test_detail_page() {
  ViewRenderer r;
  ViewModel vm;
  vm.view = View::Detail;
  for (int i = 0; i < 30; ++i) vm.detail_lines.push_back("line " + std::to_string(i));
  vm.detail_lines[12] = "SELECTED REPLY";
  vm.detail_top = 10;
  ActionSet set;
  vm.footer_actions = detail_footer_actions(set);
  Screen s = r.compose(vm, TermSize{10, 60});
  assert(s.lines[0].text().rfind("Detail View", 0) == 0);
  assert(s.lines[0].text().find("q/esc:back | ctrl+f/b:scroll") != std::string::npos);
  assert(s.lines[2].text() == "line 10");
  assert(s.lines[4].text() == "SELECTED REPLY");
  assert(s.lines[4].segments[0].style == Style::Highlight);
  assert(s.lines[9].text() == "q/esc:back | ctrl+f/b:scroll");

  // the top is clamped so the last page stays full
  vm.detail_top = 100;
  Screen end = r.compose(vm, TermSize{10, 60});
  assert(end.lines[2].text() == "line 24");

  vm.detail_header = "[1/3] @bob: hi (Q=next, Enter=select, Esc=cancel)";
  Screen pick = r.compose(vm, TermSize{10, 60});
  assert(pick.lines[0].text().find("[1/3] @bob: hi") != std::string::npos);
}

static void test_confirmation_overlay() {
  ViewRenderer r;
  ViewModel vm = list_model();
  vm.overlay = OverlayKind::Confirmation;
  vm.overlay_lines = split_text_lines(confirmation_text("Posted https://example.com/pull/1#r2."));
  HeadlessTerminal term(20, 80);
  r.render(term, vm);
  assert(term.contains("Posted https://example.com/pull/1#r2."));
  assert(term.contains("Press any key to continue..."));
  int top = term.find_row("\xE2\x95\xAD");
  assert(top >= 0);
  assert(term.row_text(top).find("\xE2\x95\xAE") != std::string::npos);
  assert(!term.contains("enter:view"));
  assert(term.frames().size() == 1);
}

static void test_help_overlay_lists_actions() {
  ActionSet set;
  set.resolve = "r resolve";
  set.quote = "Q quote";
  set.refresh = true;
  std::vector<std::string> lines = help_lines(set);
  assert(lines.front() == "Keyboard Shortcuts");
  assert(lines.back() == "Press any key to close this help...");
  bool resolve = false, quote = false, refresh = false;
  for (const auto& l : lines) {
    if (l == "  r            resolve") resolve = true;
    if (l == "  Q            quote") quote = true;
    if (l == "  i            refresh") refresh = true;
  }
  assert(resolve && quote && refresh);

  std::vector<std::string> none = help_lines(ActionSet{});
  bool placeholder = false;
  for (const auto& l : none) if (l == "  (none)") placeholder = true;
  assert(placeholder);
}

static void test_paint_styles() {
  ViewRenderer r;
  HeadlessTerminal term(10, 40);
  r.render(term, list_model());
  assert(term.style_at(3, 0) == Style::Selected);
  assert(term.style_at(0, 1) == Style::Title);
  assert(term.row_text(3) == "> second - note");
}

int main() {
  test_list_page();
  test_list_filter_header_and_empty();
  test_footer_override_and_status();
  test_long_rows_are_truncated();
  test_detail_page();
  test_confirmation_overlay();
  test_help_overlay_lists_actions();
  test_paint_styles();
  return 0;
}
