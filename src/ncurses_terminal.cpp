#include "ncurses_terminal.hpp"
#include <algorithm>
#include "text_util.hpp"

NcursesTerminal::NcursesTerminal() {
  if (!has_colors()) return;
  colors_ = true;
  start_color();
  short bg = COLOR_BLACK;
  if (use_default_colors() == OK) bg = -1;
  init_pair(PAIR_KEYWORD, COLOR_YELLOW, bg);
  init_pair(PAIR_TEXT, bg == -1 ? -1 : COLOR_WHITE, bg);
  init_pair(PAIR_BORDER, COLOR_GREEN, bg);
  init_pair(PAIR_BORDER_FOCUS, COLOR_YELLOW, bg);
  init_pair(PAIR_BAR, COLOR_BLACK, COLOR_CYAN);
  init_pair(PAIR_CURSOR_BLUR, COLOR_WHITE, COLOR_BLUE);
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (colors_) attron(COLOR_PAIR(PAIR_TEXT));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (colors_) attroff(COLOR_PAIR(PAIR_TEXT));
}

// hl_start/hl_len are display columns within text
void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = display_width(text);
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  if (hl_start > 0) {
    std::string left = clip_columns(text, 0, hl_start);
    mvaddnstr(row, col, left.c_str(), (int)left.size());
    col += hl_start;
  }
  if (hl_end > hl_start) {
    std::string mid = clip_columns(text, hl_start, hl_end - hl_start);
    attron(A_REVERSE);
    mvaddnstr(row, col, mid.c_str(), (int)mid.size());
    attroff(A_REVERSE);
    col += hl_end - hl_start;
  }
  if (hl_end < len) {
    std::string right = clip_columns(text, hl_end, len - hl_end);
    mvaddnstr(row, col, right.c_str(), (int)right.size());
  }
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (!colors_) {
    // monochrome: bars and the inactive cursor still need to stand out
    bool standout = color_pair_id == PAIR_BAR || color_pair_id == PAIR_CURSOR_BLUR;
    if (standout) attron(A_REVERSE);
    mvaddnstr(row, col, text.c_str(), (int)text.size());
    if (standout) attroff(A_REVERSE);
    return;
  }
  attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

int NcursesTerminal::read_key() {
  int ch = getch();
  return ch == ERR ? INPUT_CLOSED : ch;
}
