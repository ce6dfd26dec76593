#include "pane_layout.hpp"
#include <algorithm>

static int clamp_split(int total, float ratio) {
  if (total <= 1) return total;
  int primary = static_cast<int>(total * ratio);
  primary = std::clamp(primary, 1, total - 1);
  return primary;
}

ScreenLayout compute_layout(const Rect& screen, bool sidebar_visible, int sidebar_percent) {
  ScreenLayout out;
  if (screen.empty()) return out;
  out.header_row = screen.row;
  if (screen.height >= 2) out.footer_row = screen.row + screen.height - 1;
  Rect body{screen.row + 1, screen.col, std::max(0, screen.height - 2), screen.width};
  if (body.empty()) return out;

  if (sidebar_visible) {
    if (body.width < 3) {
      out.tree = body;
      return out;
    }
    // the border column is carved out of the sidebar's share
    int tree_w = clamp_split(body.width - 1, static_cast<float>(sidebar_percent) / 100.0f);
    out.tree = Rect{body.row, body.col, body.height, tree_w};
    out.border_col = body.col + tree_w;
    out.content = Rect{body.row, out.border_col + 1, body.height, body.width - tree_w - 1};
    return out;
  }
  if (body.width < 2) {
    out.content = body;
    return out;
  }
  out.border_col = body.col;
  out.content = Rect{body.row, body.col + 1, body.height, body.width - 1};
  return out;
}

Rect content_text_area(const Rect& content) {
  if (content.empty()) return Rect{content.row, content.col, 0, 0};
  int pad = content.width > 2 ? 1 : 0;
  return Rect{content.row + 1, content.col + pad, std::max(0, content.height - 1), content.width - 2 * pad};
}
