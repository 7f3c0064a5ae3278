#include "editor_session.hpp"
#include "config.hpp"
#include "file_io.hpp"
#include "posix_fd.hpp"
#include "types.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

std::string temp_directory() {
  const char* dir = std::getenv("TMPDIR");
  if (dir && *dir) {
    std::string d(dir);
    while (d.size() > 1 && d.back() == '/') d.pop_back();
    return d;
  }
  return "/tmp";
}

TempFile TempFile::create() {
  std::string pattern = temp_directory() + "/" MS_TMP_PREFIX "XXXXXX" MS_TMP_SUFFIX;
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');
  UniqueFd fd(::mkstemps(buf.data(), static_cast<int>(std::strlen(MS_TMP_SUFFIX))));
  if (!fd.valid()) {
    throw SelectorError(std::string("Failed to create temp file: ") + std::strerror(errno));
  }
  return TempFile(std::string(buf.data()));
}

TempFile::~TempFile() { remove(); }

TempFile::TempFile(TempFile&& other) noexcept : path_(std::move(other.path_)) { other.path_.clear(); }

TempFile& TempFile::operator=(TempFile&& other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

bool TempFile::write(const std::string& content, std::string& msg) {
  if (!valid()) { msg = "Failed to write temp file: no file"; return false; }
  UniqueFd fd(::open(path_.c_str(), O_WRONLY | O_TRUNC));
  if (!fd.valid() || !write_all(fd.get(), content.data(), content.size())) {
    msg = std::string("Failed to write temp file: ") + std::strerror(errno);
    return false;
  }
  msg.clear();
  return true;
}

bool TempFile::read(std::string& out, std::string& msg) const {
  if (!valid()) { msg = "Failed to read temp file: no file"; return false; }
  std::string m;
  if (!read_file_text(path_, out, m)) { msg = "Failed to read temp file: " + m; return false; }
  msg.clear();
  return true;
}

void TempFile::remove() {
  if (path_.empty()) return;
  ::unlink(path_.c_str());
  path_.clear();
}

static std::string trim_space(const std::string& s) {
  const char* ws = " \t\r\n\f\v";
  size_t b = s.find_first_not_of(ws);
  if (b == std::string::npos) return std::string();
  size_t e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

std::string sanitize_editor_content(const std::string& text) {
  std::string s = trim_space(text);
  while (!s.empty()) {
    size_t nl = s.rfind('\n');
    size_t start = (nl == std::string::npos) ? 0 : nl + 1;
    std::string last = trim_space(s.substr(start));
    if (last.empty() || last[0] != '#') break;
    s = (nl == std::string::npos) ? std::string() : trim_space(s.substr(0, nl));
  }
  return s;
}
