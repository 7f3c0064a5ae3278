#include "input.hpp"
#include "key_map.hpp"
#include "reactions.hpp"
#include "selector_options.hpp"
#include "selector_text.hpp"
#include "utf8.hpp"
#include <cassert>
#include <string>
#include <vector>

static void test_split_action_key() {
  assert(split_action_key("r resolve") == std::make_pair(std::string("r"), std::string("resolve")));
  assert(split_action_key("R resolve with comment").second == "resolve with comment");
  assert(split_action_key("x") == std::make_pair(std::string("x"), std::string()));
  assert(split_action_key("") == std::make_pair(std::string(), std::string()));
  assert(split_action_key("tab toggle").first == "tab");
}

static void test_key_names() {
  assert(key_name(keys::Enter) == "enter");
  assert(key_name(keys::Esc) == "esc");
  assert(key_name(keys::CtrlC) == "ctrl+c");
  assert(key_name(keys::PageUp) == "pgup");
  assert(key_name(' ') == "space");
  assert(key_name('Q') == "Q");
  assert(key_from_name("Q") == 'Q');
  assert(key_from_name("tab") == keys::Tab);
  assert(key_from_name("ctrl+f") == keys::CtrlF);
  assert(key_from_name("space") == ' ');
  assert(key_from_name("nonsense") == keys::None);
  assert(key_from_name("") == keys::None);
  assert(is_printable_key('a') && !is_printable_key(keys::Up) && !is_printable_key(keys::Esc));
}

static void test_input_line() {
  Input in;
  assert(in.consume('a') == Input::Result::Editing);
  in.consume('b');
  in.consume(keys::Up); // ignored
  assert(in.text() == "ab");
  in.consume(keys::Backspace);
  assert(in.text() == "a");
  assert(in.consume(keys::Enter) == Input::Result::Accepted);
  assert(in.text() == "a");
  assert(in.consume(keys::Esc) == Input::Result::Cancelled);
  assert(in.text().empty());
  in.consume(keys::Backspace);
  assert(in.text().empty());
}

static void test_key_map() {
  KeyMap km;
  std::vector<View> seen;
  km.bind('r', "resolve", [&seen](View v) { seen.push_back(v); });
  assert(km.bound('r') && !km.bound('x'));
  assert(km.action('r') == "resolve" && km.action('x').empty());
  assert(km.dispatch('r', View::Detail));
  assert(!km.dispatch('x', View::List));
  assert(seen.size() == 1 && seen[0] == View::Detail);
  assert(km.size() == 1);
}

static void test_footer_order() {
  ActionSet set;
  assert(join_actions(list_footer_actions(set)) == "enter:view | ?:help | q:quit");

  set.open = true;
  set.resolve = "u unresolve";
  set.resolve_comment = "R resolve+comment";
  set.quote = "Q quote";
  set.quote_context = "C quote+context";
  set.agent = "a agent";
  set.edit = "e edit";
  set.react = "x react";
  set.refresh = true;
  set.filter = true;
  assert(join_actions(list_footer_actions(set)) ==
         "enter:view | o:open | u:resolve | R:resolve+comment | Q:quote | C:quote+context | "
         "a:agent | e:edit | x:react | i:refresh | h:hide resolved | ?:help | q:quit");
  assert(join_actions(detail_footer_actions(set)) ==
         "q/esc:back | o:open | u:resolve | R:resolve+comment | Q:quote | C:quote+context | "
         "a:agent | e:edit | x:react | ctrl+f/b:scroll");
}

static void test_status_texts() {
  assert(thread_pick_status(0, 3, "@bob: looks good", "Q") == "[1/3] @bob: looks good (Q=next, Enter=select, Esc=cancel)");
  assert(reaction_status(0, "x") == "React: [1/8] +1 (x=next, Enter=add, Esc=cancel)");
  assert(reaction_status(7, "x").rfind("React: [8/8] eyes", 0) == 0);
  assert(confirmation_text("Done") == "Done\n\nPress any key to continue...");
  assert(contains_url("Posted https://x/1."));
  assert(!contains_url("Posted comment 4"));
}

static void test_reaction_catalog() {
  const char* order[] = {"+1", "-1", "laugh", "confused", "heart", "hooray", "rocket", "eyes"};
  for (size_t i = 0; i < kReactionCount; ++i) {
    assert(std::string(reaction_at(i).name) == order[i]);
    assert(reaction_index(order[i]) == static_cast<int>(i));
  }
  assert(std::string(reaction_at(8).name) == "+1");
  size_t idx = 0;
  for (int i = 0; i < 8; ++i) idx = next_reaction(idx);
  assert(idx == 0);
  assert(reaction_index("thumbs") == -1);
}

static void test_text_helpers() {
  std::vector<std::string> lines = split_text_lines("a\n\nb");
  assert(lines.size() == 3 && lines[1].empty());
  assert(split_text_lines("").size() == 1);
  assert(highlight_offset({"a", "b", "c", "d", "SELECTED REPLY", "e"}) == 2);
  assert(highlight_offset({"SELECTED COMMENT"}) == 0);
  assert(highlight_offset({"nothing"}) == 0);
  assert(contains_ignore_case("src/Main.cpp", "main"));
  assert(contains_ignore_case("anything", ""));
  assert(!contains_ignore_case("abc", "abd"));
}

static void test_utf8() {
  std::string arrow = "\xE2\x96\xB6 x"; // "▶ x"
  assert(utf8_width(arrow) == 3);
  assert(utf8_prefix(arrow, 1) == "\xE2\x96\xB6");
  assert(utf8_truncate("abcdefgh", 6) == "abc...");
  assert(utf8_truncate("abc", 6) == "abc");
  assert(utf8_pad("ab", 4) == "ab  ");
  std::vector<std::string> wrapped;
  utf8_wrap_into("one two three four", 9, wrapped);
  assert((wrapped == std::vector<std::string>{"one two", "three", "four"}));
  wrapped.clear();
  utf8_wrap_into("abcdefghij", 4, wrapped);
  assert((wrapped == std::vector<std::string>{"abcd", "efgh", "ij"}));
}

int main() {
  test_split_action_key();
  test_key_names();
  test_input_line();
  test_key_map();
  test_footer_order();
  test_status_texts();
  test_reaction_catalog();
  test_text_helpers();
  test_utf8();
  return 0;
}
