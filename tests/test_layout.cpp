#undef NDEBUG
#include "pane_layout.hpp"
#include <cassert>

static void test_split_with_sidebar() {
  ScreenLayout l = compute_layout(Rect{0, 0, 24, 80}, true, 30);
  assert(l.header_row == 0);
  assert(l.footer_row == 23);
  assert(l.tree.row == 1 && l.tree.col == 0);
  assert(l.tree.height == 22);
  assert(l.tree.width == 23);
  assert(l.border_col == 23);
  assert(l.content.col == 24);
  assert(l.tree.width + 1 + l.content.width == 80);
  assert(l.content.height == l.tree.height);
}

static void test_hidden_sidebar() {
  ScreenLayout l = compute_layout(Rect{0, 0, 24, 80}, false, 30);
  assert(l.tree.empty());
  assert(l.border_col == 0);
  assert(l.content.col == 1);
  assert(l.content.width == 79);
}

static void test_extreme_ratio_keeps_both_panes() {
  ScreenLayout l = compute_layout(Rect{0, 0, 10, 10}, true, 90);
  assert(l.tree.width == 8);
  assert(l.content.width == 1);
  l = compute_layout(Rect{0, 0, 10, 10}, true, 10);
  assert(l.tree.width == 1);
  assert(l.content.width == 8);
}

static void test_tiny_screens() {
  ScreenLayout l = compute_layout(Rect{0, 0, 1, 80}, true, 30);
  assert(l.header_row == 0);
  assert(l.footer_row == -1);
  assert(l.tree.empty() && l.content.empty());
  assert(l.border_col == -1);

  l = compute_layout(Rect{0, 0, 0, 0}, true, 30);
  assert(l.header_row == -1);

  l = compute_layout(Rect{0, 0, 10, 2}, true, 30);
  assert(l.tree.width == 2);
  assert(l.content.empty());
  assert(l.border_col == -1);
}

static void test_content_text_area() {
  Rect t = content_text_area(Rect{1, 24, 22, 56});
  assert(t.row == 2 && t.col == 25);
  assert(t.height == 21 && t.width == 54);
  // too narrow for padding
  t = content_text_area(Rect{1, 5, 4, 2});
  assert(t.col == 5 && t.width == 2);
  t = content_text_area(Rect{1, 5, 0, 0});
  assert(t.empty());
}

int main() {
  test_split_with_sidebar();
  test_hidden_sidebar();
  test_extreme_ratio_keeps_both_panes();
  test_tiny_screens();
  test_content_text_area();
  return 0;
}
