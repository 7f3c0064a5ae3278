#pragma once
/*
 * Quote formatting
 *
 * Purpose: the markdown a quoting reply starts with: the quoted comment under an
 *          "@author wrote:" line, optionally preceded by the diff context as a quoted code fence.
 */
#include <string>

// Every line prefixed with "> "; empty text gives ">".
std::string format_blockquote(const std::string& text);

// "--- a/path\n+++ b/path\n" + hunk; hunk unchanged when path is empty.
std::string format_diff_with_headers(const std::string& diff_hunk, const std::string& path);

// Drops ```suggestion fences and markdown images, then trims.
std::string strip_suggestion_block(const std::string& body);

// Ends with two empty lines where the reply goes.
std::string format_quoted_reply(const std::string& author, const std::string& body,
                                const std::string& diff_hunk, const std::string& path,
                                bool include_context);
