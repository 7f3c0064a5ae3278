#pragma once
/*
 * Review comments
 *
 * Purpose: the data the mselect browser shows: review comments grouped by file, each with its
 *          replies, and the flattened rows (file header / comment / preview) the selector lists.
 * Note: rows share their ReviewComment through shared_ptr, so resolving through one row is
 *       visible through every row of the same comment.
 */
#include <memory>
#include <string>
#include <vector>

struct Reply {
  long long id = 0;
  std::string author;
  std::string body;
  std::string url;
  std::string created;
  std::vector<std::string> reactions;
};

struct ReviewComment {
  long long id = 0;
  std::string thread_id;
  std::string author;
  std::string path;
  int line = 0;
  std::string body;
  std::string diff_hunk;
  std::string url;
  std::string created;
  bool resolved = false;
  bool outdated = false;
  std::vector<std::string> reactions;
  std::vector<Reply> replies;
};

enum class BrowseKind { File, Comment, Preview };

struct BrowseItem {
  BrowseKind kind = BrowseKind::File;
  std::string path;
  std::shared_ptr<ReviewComment> comment; // null for file headers
  int selected = 0;                       // 0 = root comment, i = reply i-1

  bool is_file() const { return kind == BrowseKind::File; }
  // author/body/id of the selected thread entry; falls back to the root when out of range
  const std::string& selected_author() const;
  const std::string& selected_body() const;
  long long selected_id() const;
};

// File header, then comment + preview row per comment; paths sorted, comments by line.
std::vector<BrowseItem> build_comment_tree(const std::vector<std::shared_ptr<ReviewComment>>& comments);
