#pragma once
/*
 * PaneLayout
 *
 * Purpose: carve the screen into header, sidebar, border, content and footer.
 * Note: pure arithmetic on Rects; Renderer and Viewer both call it so they
 *       agree on pane sizes.
 */

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
  bool empty() const { return height <= 0 || width <= 0; }
};

struct ScreenLayout {
  int header_row = -1;  // -1: not drawn
  int footer_row = -1;
  Rect tree;
  int border_col = -1;
  Rect content;
};

ScreenLayout compute_layout(const Rect& screen, bool sidebar_visible, int sidebar_percent);

// text area of the content pane: one title row, one column of padding each side
Rect content_text_area(const Rect& content);
