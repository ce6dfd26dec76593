#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>

struct TermSize { int rows; int cols; };

// returned by read_key() once no more input can arrive
constexpr int INPUT_CLOSED = -1;

enum ColorPair : int {
  PAIR_KEYWORD = 1,
  PAIR_TEXT = 2,
  PAIR_BORDER = 3,
  PAIR_BORDER_FOCUS = 4,
  PAIR_BAR = 5,
  PAIR_CURSOR_BLUR = 6,
};

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void refresh() = 0;
  virtual int read_key() = 0;
};
