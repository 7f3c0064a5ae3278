#include "quote.hpp"
#include "file_io.hpp"
#include <regex>
#include <vector>

static std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static std::string join(const std::vector<std::string>& parts, const char* sep) {
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i) out += sep;
    out += parts[i];
  }
  return out;
}

std::string format_blockquote(const std::string& text) {
  if (text.empty()) return ">";
  std::vector<std::string> out;
  for (const auto& line : split_lines(text)) out.push_back("> " + line);
  return join(out, "\n");
}

std::string format_diff_with_headers(const std::string& diff_hunk, const std::string& path) {
  if (path.empty()) return diff_hunk;
  return "--- a/" + path + "\n+++ b/" + path + "\n" + diff_hunk;
}

std::string strip_suggestion_block(const std::string& body) {
  static const std::regex suggestion(R"(```suggestion[^\n]*\n[\s\S]*?```)");
  static const std::regex image(R"(!\[[^\]]*\]\([^)]*\))");
  std::string out = std::regex_replace(body, suggestion, "");
  out = std::regex_replace(out, image, "");
  // strip per line so "a\n```..```\nb" keeps a single blank separator
  std::vector<std::string> lines;
  for (const auto& line : split_lines(out)) lines.push_back(trim(line).empty() ? "" : line);
  return trim(join(lines, "\n"));
}

std::string format_quoted_reply(const std::string& author, const std::string& body,
                                const std::string& diff_hunk, const std::string& path,
                                bool include_context) {
  std::vector<std::string> parts;
  if (include_context && !diff_hunk.empty()) {
    parts.push_back("> ```diff");
    for (const auto& line : split_lines(format_diff_with_headers(diff_hunk, path))) parts.push_back("> " + line);
    parts.push_back("> ```");
    parts.push_back(">");
  }
  parts.push_back(format_blockquote("@" + author + " wrote:"));
  parts.push_back(">");
  std::string clean = strip_suggestion_block(body);
  if (!clean.empty()) parts.push_back(format_blockquote(clean));
  parts.push_back("");
  parts.push_back("");
  return join(parts, "\n");
}
