#include "quote.hpp"
#include <cassert>
#include <string>

static bool has(const std::string& s, const std::string& needle) { return s.find(needle) != std::string::npos; }

static void test_blockquote() {
  assert(format_blockquote("") == ">");
  assert(format_blockquote("one") == "> one");
  assert(format_blockquote("one\ntwo") == "> one\n> two");
  assert(format_blockquote("one\n\ntwo") == "> one\n> \n> two");
}

static void test_diff_headers() {
  assert(format_diff_with_headers("@@ -1,3 +1,4 @@\n context\n+added", "") == "@@ -1,3 +1,4 @@\n context\n+added");
  assert(format_diff_with_headers("@@ -1,3 +1,4 @@\n context\n+added", "file.go") ==
         "--- a/file.go\n+++ b/file.go\n@@ -1,3 +1,4 @@\n context\n+added");
  assert(format_diff_with_headers("", "file.go") == "--- a/file.go\n+++ b/file.go\n");
}

static void test_strip_suggestion() {
  assert(strip_suggestion_block("This is a regular comment") == "This is a regular comment");
  assert(strip_suggestion_block("```suggestion\nconst x = 1\n```") == "");
  assert(strip_suggestion_block("Here's a fix:\n```suggestion\nconst x = 1\n```") == "Here's a fix:");
  assert(strip_suggestion_block("```suggestion\nconst x = 1\n```\nWhat do you think?") == "What do you think?");
  assert(strip_suggestion_block("Try this:\n```suggestion\nconst x = 1\n```\nLet me know!") == "Try this:\n\nLet me know!");
  assert(strip_suggestion_block("Option 1:\n```suggestion\na\n```\nOption 2:\n```suggestion\nb\n```") ==
         "Option 1:\n\nOption 2:");
  assert(strip_suggestion_block("  ```suggestion\ncode\n```  ") == "");
  assert(strip_suggestion_block("See this: ![screenshot](https://example.com/img.png)") == "See this:");
  assert(strip_suggestion_block("Look:\n![img](url)\n```suggestion\ncode\n```") == "Look:");
}

static void test_quoted_reply() {
  std::string plain = format_quoted_reply("testuser", "This is a comment", "@@ -1,3 +1,4 @@\n context\n+added",
                                          "file.go", false);
  assert(has(plain, "> @testuser wrote:"));
  assert(has(plain, "> This is a comment"));
  assert(!has(plain, "```diff") && !has(plain, "--- a/"));
  assert(plain.size() >= 2 && plain.compare(plain.size() - 2, 2, "\n\n") == 0);
  assert(plain == "> @testuser wrote:\n>\n> This is a comment\n\n");

  std::string ctx = format_quoted_reply("reviewer", "Please fix this", "@@ -10,5 +10,7 @@\n context line\n+new line",
                                        "src/main.go", true);
  assert(has(ctx, "> ```diff"));
  assert(has(ctx, "> --- a/src/main.go"));
  assert(has(ctx, "> +++ b/src/main.go"));
  assert(has(ctx, "> @@ -10,5 +10,7 @@"));
  assert(has(ctx, "> Please fix this"));
  assert(ctx.find("```diff") < ctx.find("@reviewer wrote:"));

  std::string no_hunk = format_quoted_reply("user", "Comment body", "", "file.go", true);
  assert(!has(no_hunk, "```diff"));
  assert(has(no_hunk, "> Comment body"));

  std::string suggestion = format_quoted_reply("reviewer", "Here's a fix:\n```suggestion\nconst x = 1\n```", "", "", false);
  assert(!has(suggestion, "```suggestion") && !has(suggestion, "const x = 1"));
  assert(has(suggestion, "> Here's a fix:"));

  std::string multi = format_quoted_reply("reviewer", "Line 1\nLine 2\nLine 3", "", "", false);
  assert(has(multi, "> Line 1\n> Line 2\n> Line 3"));
}

int main() {
  test_blockquote();
  test_diff_headers();
  test_strip_suggestion();
  test_quoted_reply();
  return 0;
}
