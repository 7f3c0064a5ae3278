#pragma once
/*
 * SelectorOptions
 *
 * Purpose: the optional callbacks a host plugs into the selector, and their typed results.
 * Rule: an empty std::function disables the action entirely (no key binding, no footer or
 *       help entry). Callbacks may also throw std::exception; that counts as an error result.
 * Keys: labels are "<key> <description>"; the *_alt label is used while is_resolved(item).
 */
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Plain actions and completers: ok=false makes message an error line.
struct ActionResult {
  bool ok = true;
  std::string message;
  static ActionResult success(std::string msg = {}) { return {true, std::move(msg)}; }
  static ActionResult failure(std::string err) { return {false, std::move(err)}; }
};

// Preparers: the text an editor session starts with.
struct PrepareResult {
  bool ok = true;
  std::string text;
  std::string error;
};

// Agent: launch the agent with prompt, or only show message.
struct AgentResult {
  bool ok = true;
  std::optional<std::string> prompt;
  std::string message;
};

struct EditTarget {
  std::string path;
  int line = 0; // 0 = no positioning
};

// Edit: open target in the editor, or only show message.
struct EditResult {
  bool ok = true;
  std::optional<EditTarget> target;
  std::string message;
};

// Reaction: which comment a reaction goes to.
struct ReactionTarget {
  bool ok = true;
  long long comment_id = 0;
  std::string error;
};

template <typename T>
struct RefreshResult {
  bool ok = true;
  std::vector<T> items;
  std::string error;
};

template <typename T>
struct SelectorOptions {
  std::string title = "Select an item";

  std::function<ActionResult(const T&)> on_select;
  std::function<ActionResult(const T&)> on_open;
  std::function<bool(const T&, bool)> filter_predicate;
  bool filter_default = false;
  std::function<bool(const T&)> is_resolved;
  std::function<RefreshResult<T>()> refresh_items;

  // mutates the item in place; the engine writes it back to its snapshot
  std::function<ActionResult(T&)> resolve_action;
  std::string resolve_key = "r resolve";
  std::string resolve_key_alt = "u unresolve";

  std::function<PrepareResult(const T&)> resolve_comment_prepare;
  std::function<ActionResult(T&, const std::string&)> resolve_comment_complete;
  std::string resolve_comment_key = "R resolve with comment";
  std::string resolve_comment_key_alt = "U unresolve with comment";

  std::function<PrepareResult(const T&)> quote_prepare;
  std::function<ActionResult(T&, const std::string&)> quote_complete;
  std::string quote_key = "Q quote reply";

  std::function<PrepareResult(const T&)> quote_context_prepare;
  std::function<ActionResult(T&, const std::string&)> quote_context_complete;
  std::string quote_context_key = "C quote with context";

  std::function<AgentResult(const T&)> agent_action;
  std::string agent_key = "a launch agent";

  std::function<EditResult(const T&)> edit_action;
  std::string edit_key = "e edit file";

  std::function<ReactionTarget(const T&)> reaction_action;
  std::function<ActionResult(long long, const std::string&)> reaction_complete;
  std::string reaction_key = "x add reaction";
};

// "r resolve" -> {"r", "resolve"}; "x" -> {"x", ""}; "" -> {"", ""}
std::pair<std::string, std::string> split_action_key(const std::string& label);
