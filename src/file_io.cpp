#include "file_io.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>

bool read_file_text(const std::filesystem::path& path,
                    std::string& out,
                    std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) {
    // pipes and some special files refuse mmap; fall back to plain reads
    if (!read_all(fd.get(), out)) { msg = std::string("can not read file: ") + path.string(); return false; }
    msg = std::string("opened file: ") + path.string();
    return true;
  }
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  out.assign(static_cast<const char*>(mem), n);
  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  const size_t n = text.size();
  for (size_t i = 0; i < n; ++i) {
    if (text[i] == '\n') {
      size_t end = i;
      if (end > start && text[end - 1] == '\r') end--;
      lines.emplace_back(text, start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && text[end - 1] == '\r') end--;
    lines.emplace_back(text, start, end - start);
  }
  return lines;
}

bool read_file_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg) {
  out_lines.clear();
  std::string text;
  if (!read_file_text(path, text, msg)) return false;
  out_lines = split_lines(text);
  return true;
}

bool write_file_atomic(const std::filesystem::path& path,
                       const std::string& content,
                       std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  if (!write_all(ufd.get(), content.data(), content.size())) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
