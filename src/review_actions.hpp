#pragma once
/*
 * Review actions
 *
 * Purpose: plugs the review store into the selector: every engine callback for BrowseItem,
 *          with the key labels the browser shows.
 * Note: file header rows only collapse/expand; every comment action refuses them.
 */
#include "review_renderer.hpp"
#include "review_store.hpp"
#include "selector_options.hpp"
#include <functional>
#include <string>
#include <vector>

// Opens a URL outside the terminal. Default: launch_detached(browser_argv(url)).
using UrlOpener = std::function<bool(const std::string& url, std::string& msg)>;

// Loads the store and flattens it into rows; false + msg when the file can not be read or parsed.
bool load_browse_items(ReviewStore& store, std::vector<BrowseItem>& out, std::string& msg);

// Filter rule: rows of collapsed files are hidden; with hide_resolved only headers and
// unresolved comments stay.
bool browse_item_visible(const BrowseState& state, const BrowseItem& item, bool hide_resolved);

SelectorOptions<BrowseItem> build_review_options(ReviewStore& store, BrowseState& state,
                                                 UrlOpener opener = UrlOpener());
