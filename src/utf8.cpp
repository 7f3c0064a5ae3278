#include "utf8.hpp"

size_t utf8_seq_len(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1; // stray continuation byte; count it on its own
}

size_t utf8_width(const std::string& s) {
  size_t cols = 0;
  for (size_t i = 0; i < s.size(); i += utf8_seq_len(static_cast<unsigned char>(s[i]))) cols++;
  return cols;
}

std::string utf8_prefix(const std::string& s, size_t width) {
  size_t i = 0, cols = 0;
  while (i < s.size() && cols < width) {
    size_t n = utf8_seq_len(static_cast<unsigned char>(s[i]));
    if (i + n > s.size()) n = s.size() - i;
    i += n;
    cols++;
  }
  return s.substr(0, i);
}

std::string utf8_truncate(const std::string& s, size_t width) {
  if (utf8_width(s) <= width) return s;
  if (width <= 3) return utf8_prefix(s, width);
  return utf8_prefix(s, width - 3) + "...";
}

std::string utf8_pad(const std::string& s, size_t width) {
  size_t w = utf8_width(s);
  if (w >= width) return s;
  return s + std::string(width - w, ' ');
}

void utf8_wrap_into(const std::string& line, size_t width, std::vector<std::string>& out) {
  if (width == 0 || utf8_width(line) <= width) { out.push_back(line); return; }
  std::string cur;
  size_t start = 0;
  while (start <= line.size()) {
    size_t sp = line.find(' ', start);
    std::string word = line.substr(start, sp == std::string::npos ? std::string::npos : sp - start);
    while (utf8_width(word) > width) {
      if (!cur.empty()) { out.push_back(cur); cur.clear(); }
      std::string head = utf8_prefix(word, width);
      out.push_back(head);
      word = word.substr(head.size());
    }
    if (cur.empty()) cur = word;
    else if (utf8_width(cur) + 1 + utf8_width(word) <= width) cur += " " + word;
    else { out.push_back(cur); cur = word; }
    if (sp == std::string::npos) break;
    start = sp + 1;
  }
  if (!cur.empty()) out.push_back(cur);
}
