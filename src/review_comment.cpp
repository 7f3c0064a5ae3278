#include "review_comment.hpp"
#include <algorithm>
#include <map>

static const Reply* selected_reply(const BrowseItem& item) {
  if (!item.comment || item.selected <= 0) return nullptr;
  size_t idx = static_cast<size_t>(item.selected - 1);
  if (idx >= item.comment->replies.size()) return nullptr;
  return &item.comment->replies[idx];
}

static const std::string kEmpty;

const std::string& BrowseItem::selected_author() const {
  if (const Reply* r = selected_reply(*this)) return r->author;
  return comment ? comment->author : kEmpty;
}

const std::string& BrowseItem::selected_body() const {
  if (const Reply* r = selected_reply(*this)) return r->body;
  return comment ? comment->body : kEmpty;
}

long long BrowseItem::selected_id() const {
  if (const Reply* r = selected_reply(*this)) return r->id;
  return comment ? comment->id : 0;
}

std::vector<BrowseItem> build_comment_tree(const std::vector<std::shared_ptr<ReviewComment>>& comments) {
  std::map<std::string, std::vector<std::shared_ptr<ReviewComment>>> by_path;
  for (const auto& c : comments) {
    if (c) by_path[c->path].push_back(c);
  }

  std::vector<BrowseItem> items;
  for (auto& [path, group] : by_path) {
    std::stable_sort(group.begin(), group.end(),
                     [](const auto& a, const auto& b) { return a->line < b->line; });
    items.push_back(BrowseItem{BrowseKind::File, path, nullptr, 0});
    for (const auto& c : group) {
      items.push_back(BrowseItem{BrowseKind::Comment, path, c, 0});
      items.push_back(BrowseItem{BrowseKind::Preview, path, c, 0});
    }
  }
  return items;
}
