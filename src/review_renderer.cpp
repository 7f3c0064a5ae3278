#include "review_renderer.hpp"
#include "quote.hpp"
#include "file_io.hpp"
#include "utf8.hpp"
#include <regex>
#include <sstream>
#include <vector>

static constexpr size_t kWrapWidth = 80;
static constexpr size_t kBodyLines = 200;
static constexpr size_t kReplyLines = 100;
static constexpr size_t kContextLines = 8;
static constexpr size_t kPreviewRowWidth = 80;
static constexpr size_t kThreadPreviewWidth = 100;

static std::string trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

// caps the line count, then wraps each line
static std::string wrap_body(const std::string& body, size_t max_lines) {
  std::vector<std::string> lines = split_lines(body);
  bool cut = lines.size() > max_lines;
  if (cut) lines.resize(max_lines);
  std::vector<std::string> out;
  for (const auto& l : lines) utf8_wrap_into(l, kWrapWidth, out);
  std::string text;
  for (size_t i = 0; i < out.size(); ++i) {
    if (i) text += '\n';
    text += out[i];
  }
  if (cut) text += "\n\n...(truncated, content too long)";
  return text;
}

static std::string reactions_line(const std::vector<std::string>& reactions) {
  std::string out;
  for (const auto& r : reactions) {
    if (!out.empty()) out += ' ';
    out += r;
  }
  return out;
}

bool BrowseState::toggle_collapsed(const std::string& path) {
  if (collapsed.erase(path)) return false;
  collapsed.insert(path);
  return true;
}

std::string strip_markdown_for_preview(const std::string& text) {
  static const std::regex image(R"(!\[[^\]]*\]\([^)]*\))");
  static const std::regex link(R"(\[([^\]]*)\]\([^)]*\))");
  std::string out = std::regex_replace(text, image, "");
  out = std::regex_replace(out, link, "$1");
  return trim(out);
}

std::string truncate_diff(const std::string& hunk, size_t max_lines) {
  std::vector<std::string> lines = split_lines(hunk);
  if (lines.size() <= max_lines) return hunk;
  std::string out;
  for (size_t i = 0; i < max_lines; ++i) out += lines[i] + "\n";
  return out + "...";
}

std::string ReviewItemRenderer::title(const BrowseItem& item) const {
  if (item.is_file()) {
    const char* icon = state_.is_collapsed(item.path) ? "\xE2\x96\xB6" : "\xE2\x96\xBC"; // ▶ ▼
    return std::string(icon) + " \xF0\x9F\x93\x82 " + item.path;                      // 📂
  }
  const ReviewComment& c = *item.comment;
  if (item.kind == BrowseKind::Preview) {
    std::vector<std::string> lines = split_lines(strip_suggestion_block(c.body));
    std::string preview = "...";
    if (!lines.empty()) {
      preview = lines[0];
      if (utf8_width(preview) > kPreviewRowWidth) preview = utf8_prefix(preview, kPreviewRowWidth - 3) + "...";
      else if (lines.size() > 1) preview += "...";
    }
    return "      " + preview;
  }
  std::ostringstream os;
  os << "  \xE2\x94\x94\xE2\x94\x80\xE2\x94\x80 @" << c.author << " #" << c.id << " Line " << c.line // └──
     << (c.resolved ? " [resolved]" : " [unresolved]");
  if (c.outdated) os << " [outdated]";
  return os.str();
}

std::string ReviewItemRenderer::description(const BrowseItem&) const { return ""; }

std::string ReviewItemRenderer::filter_value(const BrowseItem& item) const {
  if (item.is_file()) return item.path;
  return item.path + " " + title(item) + " " + description(item) + " " + item.comment->body;
}

bool ReviewItemRenderer::is_skippable(const BrowseItem&) const { return false; }

std::string ReviewItemRenderer::preview_with_highlight(const BrowseItem& item, int highlight_index) const {
  if (item.is_file() || !item.comment) {
    return "File: " + item.path + "\n\nSelect a comment below to view details.";
  }
  const ReviewComment& c = *item.comment;
  std::ostringstream os;
  os << "Author: @" << c.author << "\n";
  os << "Location: " << c.path << ":" << c.line << "\n";
  os << "Status: " << (c.resolved ? "resolved" : "unresolved") << "\n";
  if (!c.url.empty()) os << "URL: " << c.url << "\n";
  if (!c.created.empty()) os << "Time: " << c.created << "\n";
  if (!c.reactions.empty()) os << "Reactions: " << reactions_line(c.reactions) << "\n";
  if (c.outdated) os << "\xE2\x9A\xA0\xEF\xB8\x8F  OUTDATED\n"; // ⚠️

  std::string body = strip_suggestion_block(c.body);
  if (!body.empty()) {
    if (highlight_index == 0) os << "\n\xE2\x96\xB6\xE2\x96\xB6\xE2\x96\xB6 SELECTED COMMENT \xE2\x97\x80\xE2\x97\x80\xE2\x97\x80\n";
    os << "\n--- Comment ---\n";
    os << wrap_body(body, kBodyLines) << "\n";
    if (highlight_index == 0) os << "\xE2\x96\xB6\xE2\x96\xB6\xE2\x96\xB6 END SELECTED \xE2\x97\x80\xE2\x97\x80\xE2\x97\x80\n";
  }

  if (!c.diff_hunk.empty() && split_lines(c.diff_hunk).size() > 2) {
    os << "\n--- Context ---\n" << truncate_diff(c.diff_hunk, kContextLines) << "\n";
  }

  if (!c.replies.empty()) {
    os << "\n--- Replies ---\n";
    for (size_t i = 0; i < c.replies.size(); ++i) {
      const Reply& r = c.replies[i];
      bool highlighted = highlight_index == static_cast<int>(i) + 1;
      os << "\n";
      if (highlighted) os << "\xE2\x96\xB6\xE2\x96\xB6\xE2\x96\xB6 SELECTED REPLY \xE2\x97\x80\xE2\x97\x80\xE2\x97\x80\n";
      os << "Reply " << i + 1 << " by @" << r.author;
      if (!r.url.empty()) os << " | " << r.url;
      if (!r.created.empty()) os << " | " << r.created;
      os << "\n";
      os << wrap_body(r.body, kReplyLines) << "\n";
      if (!r.reactions.empty()) os << "Reactions: " << reactions_line(r.reactions) << "\n";
      if (highlighted) os << "\xE2\x96\xB6\xE2\x96\xB6\xE2\x96\xB6 END SELECTED \xE2\x97\x80\xE2\x97\x80\xE2\x97\x80\n";
    }
  }
  return os.str();
}

int ReviewItemRenderer::thread_comment_count(const BrowseItem& item) const {
  // preview rows repeat their comment; threads are picked from the comment row
  if (item.kind != BrowseKind::Comment || !item.comment) return 0;
  return 1 + static_cast<int>(item.comment->replies.size());
}

std::string ReviewItemRenderer::thread_comment_preview(const BrowseItem& item, int index) const {
  if (!item.comment) return "";
  std::string author, body;
  if (index == 0) {
    author = item.comment->author;
    body = item.comment->body;
  } else if (index > 0 && static_cast<size_t>(index - 1) < item.comment->replies.size()) {
    const Reply& r = item.comment->replies[static_cast<size_t>(index - 1)];
    author = r.author;
    body = r.body;
  }
  std::string joined;
  for (const auto& line : split_lines(strip_markdown_for_preview(body))) {
    std::string t = trim(line);
    if (t.empty() || t[0] == '>') continue;
    if (!joined.empty()) joined += ' ';
    joined += t;
  }
  if (utf8_width(joined) > kThreadPreviewWidth) joined = utf8_prefix(joined, kThreadPreviewWidth - 3) + "...";
  return "@" + author + ": " + joined;
}

BrowseItem ReviewItemRenderer::with_selected_comment(const BrowseItem& item, int index) const {
  BrowseItem out = item;
  out.selected = index;
  return out;
}
