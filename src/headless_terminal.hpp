#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render checks.
 * Model: one cell per display column plus an attribute per cell
 *        (' ' plain, 'R' reverse, '0'+pair for colored); keys come from a
 *        scripted queue and read_key() reports INPUT_CLOSED once it drains.
 */
#include "iterminal.hpp"
#include <deque>
#include <string>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  int read_key() override;

  void resize(int rows, int cols);
  void push_key(int ch) { keys_.push_back(ch); }
  void push_keys(const std::string& keys);

  std::string row_text(int row) const;      // trailing blanks trimmed
  char attr_at(int row, int col) const;
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  int refresh_count() const { return refreshes_; }
  // first row whose text contains needle, -1 if none
  int find_row(const std::string& needle) const;

private:
  void put(int row, int col, const std::string& text, char attr);

  int rows_;
  int cols_;
  std::vector<std::vector<std::string>> cells_;
  std::vector<std::string> attrs_;
  std::deque<int> keys_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  int refreshes_ = 0;
};
