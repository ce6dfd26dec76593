#include "headless_terminal.hpp"
#include <algorithm>
#include "text_util.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(0), cols_(0) {
  resize(rows, cols);
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  cells_.assign(rows_, std::vector<std::string>(cols_, " "));
  attrs_.assign(rows_, std::string(cols_, ' '));
}

TermSize HeadlessTerminal::getSize() const { return {rows_, cols_}; }

void HeadlessTerminal::clear() {
  for (auto& r : cells_) std::fill(r.begin(), r.end(), std::string(" "));
  for (auto& a : attrs_) std::fill(a.begin(), a.end(), ' ');
}

void HeadlessTerminal::put(int row, int col, const std::string& text, char attr) {
  if (row < 0 || row >= rows_) return;
  size_t i = 0;
  while (i < text.size() && col < cols_) {
    int n = utf8_seq_len(text, i);
    size_t len = n > 0 ? static_cast<size_t>(n) : 1;
    if (col >= 0) {
      cells_[row][col] = text.substr(i, len);
      attrs_[row][col] = attr;
    }
    i += len;
    col++;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, ' ');
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = display_width(text);
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  put(row, col, clip_columns(text, 0, hl_start), ' ');
  put(row, col + hl_start, clip_columns(text, hl_start, hl_end - hl_start), 'R');
  put(row, col + hl_end, clip_columns(text, hl_end, len - hl_end), ' ');
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, static_cast<char>('0' + color_pair_id));
}

void HeadlessTerminal::move_cursor(int row, int col) {
  cur_row_ = row;
  cur_col_ = col;
}

void HeadlessTerminal::refresh() { refreshes_++; }

int HeadlessTerminal::read_key() {
  if (keys_.empty()) return INPUT_CLOSED;
  int ch = keys_.front();
  keys_.pop_front();
  return ch;
}

void HeadlessTerminal::push_keys(const std::string& keys) {
  for (unsigned char c : keys) keys_.push_back(c);
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::string s;
  for (const auto& cell : cells_[row]) s += cell;
  size_t end = s.find_last_not_of(' ');
  return end == std::string::npos ? std::string() : s.substr(0, end + 1);
}

char HeadlessTerminal::attr_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return ' ';
  return attrs_[row][col];
}

int HeadlessTerminal::find_row(const std::string& needle) const {
  for (int r = 0; r < rows_; ++r) {
    if (row_text(r).find(needle) != std::string::npos) return r;
  }
  return -1;
}
