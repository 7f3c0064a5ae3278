#include "review_store.hpp"
#include "file_io.hpp"
#include "log.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

static std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> log = category_logger("review");
  return log;
}

static bool parse_number(const std::string& s, long long& out) {
  if (s.empty() || s.size() > 18) return false;
  for (char c : s) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  out = std::stoll(s);
  return true;
}

// the reply URL points at the thread page, anchored at the reply
static std::string reply_url(const std::string& comment_url, long long id) {
  if (comment_url.empty()) return "";
  return comment_url.substr(0, comment_url.find('#')) + "#discussion_r" + std::to_string(id);
}

static void write_lines(std::ostringstream& os, const char* keyword, const std::string& text) {
  for (const auto& l : split_lines(text)) {
    os << keyword;
    if (!l.empty()) os << ' ' << l;
    os << '\n';
  }
}

bool parse_review_lines(const std::vector<std::string>& lines, CommentList& out, std::string& msg) {
  CommentList comments;
  ReviewComment* comment = nullptr;
  Reply* reply = nullptr;
  // bodies keep their blank lines; track whether a record has started its body/diff
  bool body_started = false, diff_started = false;

  for (size_t i = 0; i < lines.size(); ++i) {
    const std::string& raw = lines[i];
    auto fail = [&](const std::string& what) {
      msg = "line " + std::to_string(i + 1) + ": " + what;
      return false;
    };
    if (raw.empty() || raw[0] == '#') continue;
    size_t sp = raw.find(' ');
    std::string key = raw.substr(0, sp);
    std::string value = sp == std::string::npos ? "" : raw.substr(sp + 1);

    if (key == "comment") {
      long long id = 0;
      if (!parse_number(value, id)) return fail("comment needs a numeric id");
      comments.push_back(std::make_shared<ReviewComment>());
      comment = comments.back().get();
      comment->id = id;
      reply = nullptr;
      body_started = diff_started = false;
      continue;
    }
    if (!comment) return fail(key + " before the first comment");
    if (key == "reply") {
      long long id = 0;
      if (!parse_number(value, id)) return fail("reply needs a numeric id");
      comment->replies.push_back(Reply{});
      reply = &comment->replies.back();
      reply->id = id;
      body_started = false;
      continue;
    }

    bool on_reply = reply != nullptr;
    auto comment_only = [&]() { return on_reply ? fail(key + " only applies to comments") : true; };

    if (key == "author") {
      (on_reply ? reply->author : comment->author) = value;
    } else if (key == "url") {
      (on_reply ? reply->url : comment->url) = value;
    } else if (key == "created") {
      (on_reply ? reply->created : comment->created) = value;
    } else if (key == "react") {
      if (value.empty()) return fail("react needs a reaction name");
      (on_reply ? reply->reactions : comment->reactions).push_back(value);
    } else if (key == "body") {
      std::string& body = on_reply ? reply->body : comment->body;
      if (body_started) body += '\n';
      body += value;
      body_started = true;
    } else if (key == "thread") {
      if (!comment_only()) return false;
      comment->thread_id = value;
    } else if (key == "path") {
      if (!comment_only()) return false;
      if (value.empty()) return fail("path is empty");
      comment->path = value;
    } else if (key == "line") {
      if (!comment_only()) return false;
      long long n = 0;
      if (!parse_number(value, n) || n > 10000000) return fail("line must be a number");
      comment->line = static_cast<int>(n);
    } else if (key == "state") {
      if (!comment_only()) return false;
      if (value == "resolved") comment->resolved = true;
      else if (value == "unresolved") comment->resolved = false;
      else return fail("state must be resolved|unresolved");
    } else if (key == "outdated") {
      if (!comment_only()) return false;
      comment->outdated = true;
    } else if (key == "diff") {
      if (!comment_only()) return false;
      if (diff_started) comment->diff_hunk += '\n';
      comment->diff_hunk += value;
      diff_started = true;
    } else {
      return fail("unknown record: " + key);
    }
  }
  out = std::move(comments);
  return true;
}

std::string serialize_review(const CommentList& comments) {
  std::ostringstream os;
  os << "# mselect review file\n";
  for (const auto& c : comments) {
    os << "\ncomment " << c->id << '\n';
    if (!c->thread_id.empty()) os << "thread " << c->thread_id << '\n';
    os << "author " << c->author << '\n';
    os << "path " << c->path << '\n';
    os << "line " << c->line << '\n';
    os << "state " << (c->resolved ? "resolved" : "unresolved") << '\n';
    if (c->outdated) os << "outdated\n";
    if (!c->url.empty()) os << "url " << c->url << '\n';
    if (!c->created.empty()) os << "created " << c->created << '\n';
    for (const auto& r : c->reactions) os << "react " << r << '\n';
    write_lines(os, "diff", c->diff_hunk);
    write_lines(os, "body", c->body);
    for (const auto& r : c->replies) {
      os << "reply " << r.id << '\n';
      os << "author " << r.author << '\n';
      if (!r.url.empty()) os << "url " << r.url << '\n';
      if (!r.created.empty()) os << "created " << r.created << '\n';
      for (const auto& name : r.reactions) os << "react " << name << '\n';
      write_lines(os, "body", r.body);
    }
  }
  return os.str();
}

ReviewStore::ReviewStore(std::filesystem::path path, std::string user)
  : path_(std::move(path)), user_(std::move(user)) {}

bool ReviewStore::load(std::string& msg) {
  std::vector<std::string> lines;
  if (!read_file_lines(path_, lines, msg)) return false;
  CommentList parsed;
  std::string err;
  if (!parse_review_lines(lines, parsed, err)) {
    msg = path_.filename().string() + ": " + err;
    logger()->warn("load failed: {}", msg);
    return false;
  }
  size_t n = parsed.size();
  {
    std::lock_guard<std::mutex> lk(mu_);
    comments_ = std::move(parsed);
  }
  logger()->info("loaded {} comments from {}", n, path_.string());
  msg = "loaded " + std::to_string(n) + " comments";
  return true;
}

bool ReviewStore::save(std::string& msg) {
  std::lock_guard<std::mutex> lk(mu_);
  return save_locked(msg);
}

bool ReviewStore::save_locked(std::string& msg) {
  if (!write_file_atomic(path_, serialize_review(comments_), msg)) {
    logger()->error("{}", msg);
    return false;
  }
  return true;
}

CommentList ReviewStore::comments() const {
  std::lock_guard<std::mutex> lk(mu_);
  return comments_;
}

long long ReviewStore::next_id_locked() const {
  long long max_id = 0;
  for (const auto& c : comments_) {
    max_id = std::max(max_id, c->id);
    for (const auto& r : c->replies) max_id = std::max(max_id, r.id);
  }
  return max_id + 1;
}

bool ReviewStore::toggle_resolved(ReviewComment& comment, bool& resolved_now, std::string& msg) {
  std::lock_guard<std::mutex> lk(mu_);
  comment.resolved = !comment.resolved;
  if (!save_locked(msg)) {
    comment.resolved = !comment.resolved;
    return false;
  }
  resolved_now = comment.resolved;
  logger()->info("comment {} {}", comment.id, resolved_now ? "resolved" : "unresolved");
  return true;
}

bool ReviewStore::add_reply(ReviewComment& comment, const std::string& body, Reply& out, std::string& msg) {
  std::lock_guard<std::mutex> lk(mu_);
  Reply r;
  r.id = next_id_locked();
  r.author = user_;
  r.body = body;
  r.url = reply_url(comment.url, r.id);
  comment.replies.push_back(r);
  if (!save_locked(msg)) {
    comment.replies.pop_back();
    return false;
  }
  logger()->info("reply {} added to comment {}", r.id, comment.id);
  out = std::move(r);
  return true;
}

bool ReviewStore::add_reaction(long long id, const std::string& name, std::string& msg) {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string>* target = nullptr;
  for (const auto& c : comments_) {
    if (c->id == id) { target = &c->reactions; break; }
    for (auto& r : c->replies) {
      if (r.id == id) { target = &r.reactions; break; }
    }
    if (target) break;
  }
  if (!target) {
    msg = "comment " + std::to_string(id) + " not found";
    return false;
  }
  if (std::find(target->begin(), target->end(), name) != target->end()) return true;
  target->push_back(name);
  if (!save_locked(msg)) {
    target->pop_back();
    return false;
  }
  logger()->info("reaction {} added to {}", name, id);
  return true;
}
