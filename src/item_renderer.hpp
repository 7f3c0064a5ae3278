#pragma once
/*
 * IItemRenderer
 *
 * Purpose: everything the selector knows about an item T. The engine never reads T's fields.
 * Threads: thread_comment_count 0 = not a thread, 1 = thread without replies,
 *          > 1 = sub-selection is offered (index 0 root, 1.. replies in order).
 */
#include <string>

template <typename T>
class IItemRenderer {
public:
  virtual ~IItemRenderer() = default;
  virtual std::string title(const T& item) const = 0;
  virtual std::string description(const T& item) const = 0;
  virtual std::string filter_value(const T& item) const = 0;
  // drawn struck through / dimmed in the list
  virtual bool is_skippable(const T& item) const = 0;
  // highlight_index -1 = no highlight
  virtual std::string preview_with_highlight(const T& item, int highlight_index) const = 0;
  virtual int thread_comment_count(const T& item) const = 0;
  virtual std::string thread_comment_preview(const T& item, int index) const = 0;
  virtual T with_selected_comment(const T& item, int index) const = 0;
};
