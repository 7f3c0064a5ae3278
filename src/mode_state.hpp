#pragma once
/*
 * Mode state
 *
 * Purpose: the selector's mutually exclusive UI modes as one std::variant, each mode
 *          carrying only the data it needs.
 * Origin: transient modes remember the page they were entered from (list, or detail with its
 *         scroll position) and return there on cancel or completion.
 */
#include "editor_session.hpp"
#include "types.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

struct Origin {
  View view = View::List;
  int detail_top = 0;
};

struct NormalMode {
  bool filter_typing = false;
};

struct DetailMode {
  std::vector<std::string> lines;
  int top = 0;
  bool loading = false;
  unsigned long long token = 0; // matches the DetailLoaded event that fills it
};

// Which action a thread pick (or reaction pick) was started for.
enum class PickAction { Quote, QuoteWithContext, Agent, React };

template <typename T>
struct ThreadPickMode {
  PickAction action;
  int key;               // pressing it again cycles
  std::string key_label; // shown as "<key>=next"
  T item;
  size_t slot;           // index into the snapshot
  int index = 0;
  int count = 0;
  Origin origin;
};

struct ReactionPickMode {
  int key;
  std::string key_label;
  long long comment_id = 0;
  size_t index = 0;
  Origin origin;
};

template <typename T>
struct EditorPendingMode {
  ExternalKind kind;
  std::optional<EditAction> action; // set for editor sessions feeding a completer
  T item;
  size_t slot;
  unsigned long long generation; // snapshot generation at launch
  std::optional<TempFile> file;
  Origin origin;
};

struct ConfirmationMode {
  std::string message;
  Origin origin;
};

struct HelpOverlayMode {
  Origin origin;
};

template <typename T>
using ModeState = std::variant<NormalMode, DetailMode, ThreadPickMode<T>, ReactionPickMode,
                               EditorPendingMode<T>, ConfirmationMode, HelpOverlayMode>;

inline const char* mode_name(size_t variant_index) {
  static const char* names[] = {"normal", "detail", "thread-pick", "reaction-pick",
                                "editor-pending", "confirmation", "help"};
  return variant_index < sizeof(names) / sizeof(names[0]) ? names[variant_index] : "unknown";
}
