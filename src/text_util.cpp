#include "text_util.hpp"
#include <cctype>

std::string to_lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

int utf8_seq_len(const std::string& s, size_t i) {
  if (i >= s.size()) return 0;
  unsigned char c = static_cast<unsigned char>(s[i]);
  if (c < 0x80) return 1;
  int n = 0;
  if (c >= 0xC2 && c <= 0xDF) n = 2;
  else if (c >= 0xE0 && c <= 0xEF) n = 3;
  else if (c >= 0xF0 && c <= 0xF4) n = 4;
  else return 0;
  if (i + n > s.size()) return 0;
  for (int k = 1; k < n; ++k) {
    if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 0;
  }
  unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
  if (c == 0xE0 && c1 < 0xA0) return 0; // overlong
  if (c == 0xED && c1 > 0x9F) return 0; // surrogate
  if (c == 0xF0 && c1 < 0x90) return 0; // overlong
  if (c == 0xF4 && c1 > 0x8F) return 0; // > U+10FFFF
  return n;
}

static size_t step(const std::string& s, size_t i) {
  int n = utf8_seq_len(s, i);
  return n > 0 ? static_cast<size_t>(n) : 1;
}

std::string sanitize_line(const std::string& s, int tab_width) {
  if (tab_width < 1) tab_width = 1;
  std::string out;
  out.reserve(s.size());
  int col = 0;
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c == '\t') {
      int pad = tab_width - (col % tab_width);
      out.append(static_cast<size_t>(pad), ' ');
      col += pad;
      i++;
      continue;
    }
    if (c < 0x20 || c == 0x7F) { out.push_back('?'); col++; i++; continue; }
    int n = utf8_seq_len(s, i);
    if (n == 0) { out.push_back('?'); col++; i++; continue; }
    // C1 controls (U+0080..U+009F) are interpreted by terminals
    if (n == 2 && c == 0xC2 && static_cast<unsigned char>(s[i + 1]) < 0xA0) {
      out.push_back('?'); col++; i += 2; continue;
    }
    out.append(s, i, static_cast<size_t>(n));
    col++;
    i += static_cast<size_t>(n);
  }
  return out;
}

int display_width(const std::string& s) {
  int w = 0;
  for (size_t i = 0; i < s.size(); i += step(s, i)) w++;
  return w;
}

std::string clip_columns(const std::string& s, int start, int count) {
  if (count <= 0) return std::string();
  if (start < 0) start = 0;
  size_t i = 0;
  int col = 0;
  while (i < s.size() && col < start) { i += step(s, i); col++; }
  size_t from = i;
  int taken = 0;
  while (i < s.size() && taken < count) { i += step(s, i); taken++; }
  if (i > s.size()) i = s.size();
  return s.substr(from, i - from);
}

std::vector<std::string> wrap_line(const std::string& s, int width) {
  std::vector<std::string> out;
  if (width <= 0 || s.empty()) { out.push_back(s); return out; }
  size_t i = 0;
  while (i < s.size()) {
    size_t from = i;
    int taken = 0;
    while (i < s.size() && taken < width) { i += step(s, i); taken++; }
    if (i > s.size()) i = s.size();
    out.emplace_back(s.substr(from, i - from));
  }
  return out;
}
