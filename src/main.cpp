#include "config.hpp"
#include "log.hpp"
#include "review_actions.hpp"
#include "review_renderer.hpp"
#include "review_store.hpp"
#include "selector.hpp"
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

static void usage(const char* prog) {
  std::fprintf(stderr, "usage: %s [--debug] [--show-resolved] <review-file>\n", prog);
}

int main(int argc, char** argv) {
  bool debug = false;
  bool show_resolved = false;
  std::optional<std::filesystem::path> path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--debug") debug = true;
    else if (arg == "--show-resolved") show_resolved = true;
    else if (arg == "-h" || arg == "--help") { usage(argv[0]); return 0; }
    else if (!arg.empty() && arg[0] == '-') { usage(argv[0]); return 1; }
    else if (!path) path = std::filesystem::path(arg);
    else { usage(argv[0]); return 1; }
  }
  if (!path) { usage(argv[0]); return 1; }

  std::vector<std::string> messages;
  SelectorConfig cfg = load_config(messages);
  for (const auto& m : messages) std::fprintf(stderr, "mselect: %s\n", m.c_str());
  if (debug) cfg.debug = true;
  if (show_resolved) cfg.hide_resolved = false;

  std::string msg;
  if (!init_logging(cfg.log_path, cfg.debug, msg)) std::fprintf(stderr, "mselect: %s\n", msg.c_str());

  ReviewStore store(*path, cfg.user);
  std::vector<BrowseItem> items;
  if (!load_browse_items(store, items, msg)) {
    std::fprintf(stderr, "mselect: %s\n", msg.c_str());
    return 1;
  }
  if (items.empty()) {
    std::fprintf(stderr, "mselect: no review comments in %s\n", path->string().c_str());
    return 0;
  }

  BrowseState state;
  state.hide_resolved = cfg.hide_resolved;
  ReviewItemRenderer renderer(state);
  SelectorOptions<BrowseItem> options = build_review_options(store, state);

  SelectionResult<BrowseItem> result;
  try {
    result = select_from_list(std::move(items), renderer, std::move(options), cfg);
  } catch (const SelectorError& e) {
    spdlog::error("fatal: {}", e.what());
    std::fprintf(stderr, "mselect: %s\n", e.what());
    return 2;
  }

  if (result.ok() && result.item->comment) {
    const ReviewComment& c = *result.item->comment;
    if (c.url.empty()) std::printf("%lld\n", c.id);
    else std::printf("%lld %s\n", c.id, c.url.c_str());
  }
  return 0;
}
