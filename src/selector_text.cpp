#include "selector_text.hpp"
#include "reactions.hpp"
#include "selector_options.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

std::pair<std::string, std::string> split_action_key(const std::string& label) {
  size_t sp = label.find(' ');
  if (sp == std::string::npos) return {label, std::string()};
  return {label.substr(0, sp), label.substr(sp + 1)};
}

static std::string key_of(const std::string& label) { return split_action_key(label).first; }

// shared middle section of both footers
static void append_actions(const ActionSet& set, std::vector<std::string>& out) {
  if (set.open) out.push_back("o:open");
  if (!set.resolve.empty()) out.push_back(key_of(set.resolve) + ":resolve");
  if (!set.resolve_comment.empty()) out.push_back(key_of(set.resolve_comment) + ":resolve+comment");
  if (!set.quote.empty()) out.push_back(key_of(set.quote) + ":quote");
  if (!set.quote_context.empty()) out.push_back(key_of(set.quote_context) + ":quote+context");
  if (!set.agent.empty()) out.push_back(key_of(set.agent) + ":agent");
  if (!set.edit.empty()) out.push_back(key_of(set.edit) + ":edit");
  if (!set.react.empty()) out.push_back(key_of(set.react) + ":react");
}

std::vector<std::string> list_footer_actions(const ActionSet& set) {
  std::vector<std::string> out;
  out.push_back("enter:view");
  append_actions(set, out);
  if (set.refresh) out.push_back("i:refresh");
  if (set.filter) out.push_back("h:hide resolved");
  out.push_back("?:help");
  out.push_back("q:quit");
  return out;
}

std::vector<std::string> detail_footer_actions(const ActionSet& set) {
  std::vector<std::string> out;
  out.push_back("q/esc:back");
  append_actions(set, out);
  out.push_back("ctrl+f/b:scroll");
  return out;
}

std::string join_actions(const std::vector<std::string>& actions) {
  std::string out;
  for (size_t i = 0; i < actions.size(); ++i) {
    if (i) out += " | ";
    out += actions[i];
  }
  return out;
}

static std::string help_entry(const std::string& key, const std::string& desc) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "  %-12s ", key.c_str());
  return std::string(buf) + desc;
}

std::vector<std::string> help_lines(const ActionSet& set) {
  std::vector<std::string> out = {
    "Keyboard Shortcuts",
    "",
    "Navigation:",
    "  \xE2\x86\x91/\xE2\x86\x93, j/k     Move up/down",
    "  enter, l, \xE2\x86\x92  View detail / select",
    "  \xE2\x86\x90, esc       Go back (from detail)",
    "  q            Quit (list) / Back (detail)",
    "  /            Filter items",
  };
  if (set.filter) out.push_back("  h, tab       Toggle hide resolved (list)");
  out.push_back("");
  out.push_back("Actions:");
  size_t before = out.size();
  if (set.open) out.push_back(help_entry("o", "open in browser"));
  auto add = [&out](const std::string& label) {
    if (label.empty()) return;
    auto [key, desc] = split_action_key(label);
    out.push_back(help_entry(key, desc));
  };
  add(set.resolve);
  add(set.resolve_comment);
  add(set.quote);
  add(set.quote_context);
  add(set.agent);
  add(set.edit);
  add(set.react);
  if (set.refresh) out.push_back(help_entry("i", "refresh"));
  if (out.size() == before) out.push_back("  (none)");
  out.push_back("");
  out.push_back("Detail View:");
  out.push_back("  ctrl+f       Page down");
  out.push_back("  ctrl+b       Page up");
  out.push_back("  enter        Select and exit");
  out.push_back("");
  out.push_back("Press any key to close this help...");
  return out;
}

std::string thread_pick_status(int index, int count, const std::string& preview, const std::string& key) {
  return "[" + std::to_string(index + 1) + "/" + std::to_string(count) + "] " + preview +
         " (" + key + "=next, Enter=select, Esc=cancel)";
}

std::string reaction_status(size_t index, const std::string& key) {
  const Reaction& r = reaction_at(index);
  return "React: [" + std::to_string(index % kReactionCount + 1) + "/" + std::to_string(kReactionCount) + "] " +
         r.display + " (" + key + "=next, Enter=add, Esc=cancel)";
}

std::string confirmation_text(const std::string& message) {
  return message + "\n\nPress any key to continue...";
}

bool contains_url(const std::string& text) {
  return text.find("https://") != std::string::npos;
}

std::vector<std::string> split_text_lines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t nl = text.find('\n', start);
    if (nl == std::string::npos) { lines.push_back(text.substr(start)); break; }
    lines.push_back(text.substr(start, nl - start));
    start = nl + 1;
  }
  return lines;
}

int highlight_offset(const std::vector<std::string>& lines) {
  for (size_t i = 0; i < lines.size(); ++i) {
    if (lines[i].find("SELECTED") != std::string::npos) return std::max(0, static_cast<int>(i) - 2);
  }
  return 0;
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
  if (needle.empty()) return true;
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                        [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                        });
  return it != haystack.end();
}
