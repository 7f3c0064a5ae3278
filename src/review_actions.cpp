#include "review_actions.hpp"
#include "quote.hpp"
#include "reactions.hpp"
#include "subprocess.hpp"
#include <memory>

static bool open_in_browser(const std::string& url, std::string& msg) {
  return launch_detached(browser_argv(url), msg);
}

bool load_browse_items(ReviewStore& store, std::vector<BrowseItem>& out, std::string& msg) {
  if (!store.load(msg)) return false;
  out = build_comment_tree(store.comments());
  return true;
}

bool browse_item_visible(const BrowseState& state, const BrowseItem& item, bool hide_resolved) {
  if (item.is_file()) return true;
  if (state.is_collapsed(item.path)) return false;
  if (!hide_resolved) return true;
  return item.comment && !item.comment->resolved;
}

static std::string resolve_status(bool resolved_now) {
  return resolved_now ? "Marked as resolved" : "Marked as unresolved";
}

static PrepareResult prepare_error(const std::string& err) {
  PrepareResult r;
  r.ok = false;
  r.error = err;
  return r;
}

static PrepareResult prepare_quote(const BrowseItem& item, bool include_context) {
  if (item.is_file() || !item.comment) return prepare_error("cannot quote reply to file header");
  PrepareResult r;
  r.text = format_quoted_reply(item.selected_author(), item.selected_body(), item.comment->diff_hunk,
                               item.comment->path, include_context);
  return r;
}

static ActionResult post_reply(ReviewStore& store, BrowseItem& item, const std::string& body) {
  if (item.is_file() || !item.comment) return ActionResult::failure("cannot reply to file header");
  Reply reply;
  std::string msg;
  if (!store.add_reply(*item.comment, body, reply, msg)) return ActionResult::failure(msg);
  if (!reply.url.empty()) return ActionResult::success("Posted " + reply.url + ".");
  return ActionResult::success("Posted comment " + std::to_string(reply.id));
}

SelectorOptions<BrowseItem> build_review_options(ReviewStore& store, BrowseState& state, UrlOpener opener) {
  if (!opener) opener = open_in_browser;
  SelectorOptions<BrowseItem> o;
  o.title = "Review comments: " + store.path().filename().string();

  o.on_select = [&state](const BrowseItem& item) {
    if (!item.is_file()) return ActionResult::success();
    bool collapsed = state.toggle_collapsed(item.path);
    return ActionResult::success((collapsed ? "Collapsed " : "Expanded ") + item.path);
  };

  o.on_open = [opener](const BrowseItem& item) {
    if (item.is_file() || !item.comment || item.comment->url.empty()) return ActionResult::failure("comment has no URL");
    std::string msg;
    if (!opener(item.comment->url, msg)) return ActionResult::failure(msg);
    return ActionResult::success("Opened comment " + std::to_string(item.comment->id) + " in browser");
  };

  o.filter_predicate = [&state](const BrowseItem& item, bool hide_resolved) {
    return browse_item_visible(state, item, hide_resolved);
  };
  o.filter_default = state.hide_resolved;
  o.is_resolved = [](const BrowseItem& item) { return item.comment && item.comment->resolved; };

  o.refresh_items = [&store]() {
    RefreshResult<BrowseItem> r;
    std::string msg;
    if (!load_browse_items(store, r.items, msg)) {
      r.ok = false;
      r.error = msg;
    }
    return r;
  };

  o.resolve_action = [&store](BrowseItem& item) {
    if (item.is_file() || !item.comment) return ActionResult::failure("cannot resolve file header");
    if (item.comment->thread_id.empty()) return ActionResult::failure("comment has no thread ID");
    bool now = false;
    std::string msg;
    if (!store.toggle_resolved(*item.comment, now, msg)) return ActionResult::failure(msg);
    return ActionResult::success(resolve_status(now));
  };
  o.resolve_key = "r resolve";
  o.resolve_key_alt = "u unresolve";

  o.resolve_comment_prepare = [](const BrowseItem& item) {
    if (item.is_file() || !item.comment) return prepare_error("cannot add comment to file header");
    return PrepareResult{};
  };
  o.resolve_comment_complete = [&store](BrowseItem& item, const std::string& body) {
    if (item.is_file() || !item.comment) return ActionResult::failure("cannot add comment to file header");
    if (item.comment->thread_id.empty()) return ActionResult::failure("comment has no thread ID");
    Reply reply;
    std::string msg;
    if (!store.add_reply(*item.comment, body, reply, msg)) return ActionResult::failure(msg);
    bool now = false;
    if (!store.toggle_resolved(*item.comment, now, msg)) return ActionResult::failure("Posted a comment, but " + msg);
    std::string out = resolve_status(now) + "\nPosted a comment.";
    if (!reply.url.empty()) out += "\n" + reply.url;
    return ActionResult::success(out);
  };
  o.resolve_comment_key = "R resolve+comment";
  o.resolve_comment_key_alt = "U unresolve+comment";

  o.quote_prepare = [](const BrowseItem& item) { return prepare_quote(item, false); };
  o.quote_complete = [&store](BrowseItem& item, const std::string& body) { return post_reply(store, item, body); };
  o.quote_key = "Q quote";

  o.quote_context_prepare = [](const BrowseItem& item) { return prepare_quote(item, true); };
  o.quote_context_complete = [&store](BrowseItem& item, const std::string& body) { return post_reply(store, item, body); };
  o.quote_context_key = "C quote+context";

  o.agent_action = [](const BrowseItem& item) {
    AgentResult r;
    if (item.is_file() || !item.comment) {
      r.ok = false;
      r.message = "cannot launch agent on file header";
      return r;
    }
    r.prompt = "Review comment on " + item.comment->path + ":" + std::to_string(item.comment->line) +
               "\n\n" + item.selected_body();
    return r;
  };
  o.agent_key = "a agent";

  o.edit_action = [](const BrowseItem& item) {
    EditResult r;
    if (item.is_file() || !item.comment) {
      r.ok = false;
      r.message = "cannot edit file header";
      return r;
    }
    r.target = EditTarget{item.comment->path, item.comment->line};
    return r;
  };
  o.edit_key = "e edit";

  o.reaction_action = [](const BrowseItem& item) {
    ReactionTarget t;
    if (item.is_file() || !item.comment) {
      t.ok = false;
      t.error = "cannot react to file header";
      return t;
    }
    t.comment_id = item.selected_id();
    return t;
  };
  o.reaction_complete = [&store](long long id, const std::string& name) {
    std::string msg;
    if (!store.add_reaction(id, name, msg)) return ActionResult::failure(msg);
    int idx = reaction_index(name);
    std::string emoji = idx >= 0 ? reaction_at(static_cast<size_t>(idx)).emoji : name;
    return ActionResult::success(emoji + " reaction added.");
  };
  o.reaction_key = "x react";
  return o;
}
