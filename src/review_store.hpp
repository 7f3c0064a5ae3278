#pragma once
/*
 * ReviewStore
 *
 * Purpose: the review file behind the browser. Stands in for the code-review service:
 *          resolving, replying and reacting mutate the comments and persist the file.
 *
 * File format: one record per line, "<keyword> <value>". A "comment <id>" or "reply <id>" line
 * opens a record; the lines after it fill that record:
 *
 *   comment 101
 *   thread T_1            thread id (comments only; needed to resolve)
 *   author alice
 *   path src/main.cpp     (comments only)
 *   line 42               (comments only)
 *   state resolved        resolved | unresolved (comments only)
 *   outdated              (comments only)
 *   url https://example.com/pr/1#discussion_r101
 *   created 2026-01-02 10:00
 *   react +1              one reaction name per line
 *   diff @@ -40,3 +40,4 @@     one diff hunk line per line (comments only)
 *   body first line       one body line per line; "body" alone is an empty line
 *   reply 102             a reply to the last comment
 *   author bob
 *   body looks good
 *
 * Blank lines and lines starting with '#' are skipped.
 * Threads: load() may run on the refresh worker; every accessor locks the store.
 */
#include "review_comment.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using CommentList = std::vector<std::shared_ptr<ReviewComment>>;

// false + msg ("line N: ...") on the first malformed line
bool parse_review_lines(const std::vector<std::string>& lines, CommentList& out, std::string& msg);
std::string serialize_review(const CommentList& comments);

class ReviewStore {
public:
  ReviewStore(std::filesystem::path path, std::string user);

  // Replaces the comments with the file's contents; the old list is left untouched on failure.
  bool load(std::string& msg);
  bool save(std::string& msg);

  CommentList comments() const;
  const std::filesystem::path& path() const { return path_; }
  const std::string& user() const { return user_; }

  // Flips the resolved flag and saves; resolved_now tells the new state.
  bool toggle_resolved(ReviewComment& comment, bool& resolved_now, std::string& msg);
  // Appends a reply by user() and saves.
  bool add_reply(ReviewComment& comment, const std::string& body, Reply& out, std::string& msg);
  // id is a comment id or a reply id. Adding an existing reaction again is a no-op.
  bool add_reaction(long long id, const std::string& name, std::string& msg);

private:
  bool save_locked(std::string& msg);
  long long next_id_locked() const;

  std::filesystem::path path_;
  std::string user_;
  mutable std::mutex mu_;
  CommentList comments_;
};
