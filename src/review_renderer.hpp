#pragma once
/*
 * ReviewItemRenderer
 *
 * Purpose: how review rows look in the selector: a collapsible tree of files with one comment
 *          row and one dimmed body preview row per comment, and the detail page of a thread.
 * Design: collapse state lives in BrowseState, shared with the on_select and filter callbacks.
 */
#include "item_renderer.hpp"
#include "review_comment.hpp"
#include <set>
#include <string>

struct BrowseState {
  std::set<std::string> collapsed;
  bool hide_resolved = true;

  bool is_collapsed(const std::string& path) const { return collapsed.count(path) != 0; }
  // returns true when the path is now collapsed
  bool toggle_collapsed(const std::string& path);
};

// Drops markdown images, keeps only the text of links, trims.
std::string strip_markdown_for_preview(const std::string& text);

// Keeps the first max_lines lines; a cut hunk ends with "...".
std::string truncate_diff(const std::string& hunk, size_t max_lines);

class ReviewItemRenderer : public IItemRenderer<BrowseItem> {
public:
  explicit ReviewItemRenderer(const BrowseState& state) : state_(state) {}

  std::string title(const BrowseItem& item) const override;
  std::string description(const BrowseItem& item) const override;
  std::string filter_value(const BrowseItem& item) const override;
  bool is_skippable(const BrowseItem& item) const override;
  std::string preview_with_highlight(const BrowseItem& item, int highlight_index) const override;
  int thread_comment_count(const BrowseItem& item) const override;
  std::string thread_comment_preview(const BrowseItem& item, int index) const override;
  BrowseItem with_selected_comment(const BrowseItem& item, int index) const override;

private:
  const BrowseState& state_;
};
