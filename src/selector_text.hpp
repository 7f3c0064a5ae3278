#pragma once
/*
 * Selector text
 *
 * Purpose: every user-facing string the selector builds: footer hints, help overlay,
 *          pick-mode status lines and confirmation text.
 * Order: action hints always follow open, resolve, resolve+comment, quote, quote+context,
 *        agent, edit, react, refresh, filter-toggle, help, quit; disabled actions are left out.
 */
#include <string>
#include <vector>

// Labels ("<key> <description>") of the enabled actions; empty label = disabled.
struct ActionSet {
  bool open = false;
  std::string resolve;
  std::string resolve_comment;
  std::string quote;
  std::string quote_context;
  std::string agent;
  std::string edit;
  std::string react;
  bool refresh = false;
  bool filter = false;
};

std::vector<std::string> list_footer_actions(const ActionSet& set);
std::vector<std::string> detail_footer_actions(const ActionSet& set);
std::string join_actions(const std::vector<std::string>& actions);
std::vector<std::string> help_lines(const ActionSet& set);

std::string thread_pick_status(int index, int count, const std::string& preview, const std::string& key);
std::string reaction_status(size_t index, const std::string& key);
std::string confirmation_text(const std::string& message);
bool contains_url(const std::string& text);

std::vector<std::string> split_text_lines(const std::string& text);
// first line containing "SELECTED" placed two rows below the top; 0 when absent
int highlight_offset(const std::vector<std::string>& lines);
// case-insensitive substring match; empty needle matches everything
bool contains_ignore_case(const std::string& haystack, const std::string& needle);
