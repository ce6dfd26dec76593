#include "renderer.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include "pane_layout.hpp"
#include "text_util.hpp"

static const char* const kFooterHints = " q Quit  Tab Focus  ~ Sidebar  fk Viewer  fh Tree";

static const std::unordered_set<std::string>& keywords_for(Syntax syn) {
  static const std::unordered_set<std::string> none;
  static const std::unordered_set<std::string> c = {
    "if","else","for","while","do","return","switch","case","default","break","continue","goto",
    "struct","union","enum","typedef","const","static","extern","register","volatile","auto",
    "sizeof","void","int","char","float","double","long","short","signed","unsigned",
    "include","define","ifdef","ifndef","endif","undef","pragma"
  };
  static const std::unordered_set<std::string> make = {
    "ifeq","ifneq","ifdef","ifndef","else","endif","include","define","endef",
    "export","unexport","override","vpath","PHONY","all","clean","install"
  };
  if (syn == Syntax::C) return c;
  if (syn == Syntax::Makefile) return make;
  return none;
}

static bool is_ascii_line(const std::string& t) {
  for (unsigned char c : t) { if (c >= 128) return false; }
  return true;
}

static void draw_bar(ITerminal& term, int row, int cols, const std::string& text) {
  std::string s = clip_columns(text, 0, cols);
  int w = display_width(s);
  if (w < cols) s.append(static_cast<size_t>(cols - w), ' ');
  term.draw_colored(row, 0, s, PAIR_BAR);
}

std::string tree_row_text(const VisibleRow& row) {
  const TreeNode& n = *row.node;
  std::string s(static_cast<size_t>(row.depth) * 2, ' ');
  if (n.is_dir()) {
    s += n.expanded ? "- " : "+ ";
    s += n.label;
    s += "/";
  } else {
    s += kind_tag(n.kind);
    s += " ";
    s += n.label;
  }
  return s;
}

static void render_tree(ITerminal& term, const Rect& area, const FileTree& tree, Viewport& vp, bool focused) {
  int h = area.height;
  int count = tree.visible_count();
  int cursor = tree.cursor();
  if (cursor < vp.top_line) vp.top_line = cursor;
  if (cursor >= vp.top_line + h) vp.top_line = cursor - h + 1;
  vp.top_line = std::clamp(vp.top_line, 0, std::max(0, count - h));
  const auto& rows = tree.visible_rows();
  for (int i = 0; i < h; ++i) {
    int idx = vp.top_line + i;
    if (idx >= count) break;
    std::string line = clip_columns(tree_row_text(rows[idx]), 0, area.width);
    if (idx != cursor) {
      term.draw_text(area.row + i, area.col, line);
      continue;
    }
    int w = display_width(line);
    if (w < area.width) line.append(static_cast<size_t>(area.width - w), ' ');
    if (focused) term.draw_highlighted(area.row + i, area.col, line, 0, area.width);
    else term.draw_colored(area.row + i, area.col, line, PAIR_CURSOR_BLUR);
  }
}

static void draw_content_row(ITerminal& term, int row, int col, const std::string& text,
                             const std::unordered_set<std::string>& kwords) {
  if (kwords.empty() || !is_ascii_line(text)) {
    term.draw_text(row, col, text);
    return;
  }
  auto is_word = [](unsigned char c){ return std::isalnum(c) != 0 || c == '_'; };
  int n = static_cast<int>(text.size());
  int p = 0;
  while (p < n) {
    int start = p;
    bool word = is_word(static_cast<unsigned char>(text[p]));
    while (p < n && is_word(static_cast<unsigned char>(text[p])) == word) p++;
    std::string tok = text.substr(start, p - start);
    if (word && kwords.count(tok)) term.draw_colored(row, col + start, tok, PAIR_KEYWORD);
    else term.draw_text(row, col + start, tok);
  }
}

static void render_content(ITerminal& term, const Rect& area, const ContentView& cv, bool enable_color) {
  Rect text = content_text_area(area);
  std::string title = cv.title();
  if (cv.row_count() > text.height && text.height > 0) {
    int first = cv.scroll_y() + 1;
    int last = std::min(cv.row_count(), cv.scroll_y() + text.height);
    title += "  (" + std::to_string(first) + "-" + std::to_string(last) + "/" + std::to_string(cv.row_count()) + ")";
  }
  term.draw_text(area.row, text.col, clip_columns(title, 0, text.width));
  const auto& kwords = keywords_for(enable_color ? cv.syntax() : Syntax::None);
  const auto& rows = cv.rows();
  for (int i = 0; i < text.height; ++i) {
    int idx = cv.scroll_y() + i;
    if (idx >= cv.row_count()) break;
    draw_content_row(term, text.row + i, text.col, clip_columns(rows[idx], 0, text.width), kwords);
  }
}

void Renderer::render(ITerminal& term, const RenderState& st) {
  TermSize sz = term.getSize();
  term.clear();
  ScreenLayout lay = compute_layout(Rect{0, 0, sz.rows, sz.cols}, st.sidebar_visible, st.sidebar_percent);

  if (lay.header_row >= 0) {
    std::string header = " " + st.title;
    if (!st.root.empty()) header += " - " + st.root;
    draw_bar(term, lay.header_row, sz.cols, header);
  }
  if (!lay.tree.empty() && st.tree && st.tree_vp) {
    render_tree(term, lay.tree, *st.tree, *st.tree_vp, st.focus == Focus::Tree);
  }
  if (lay.border_col >= 0) {
    const Rect& body = lay.content.empty() ? lay.tree : lay.content;
    int pair = st.focus == Focus::Content ? PAIR_BORDER_FOCUS : PAIR_BORDER;
    for (int r = body.row; r < body.row + body.height; ++r) term.draw_colored(r, lay.border_col, "|", pair);
  }
  if (!lay.content.empty() && st.content) {
    render_content(term, lay.content, *st.content, st.enable_color);
  }
  if (lay.footer_row >= 0) {
    // the status message goes first so narrow screens still show it
    std::string footer = kFooterHints;
    if (!st.message.empty()) footer = " " + st.message + "  |" + footer;
    draw_bar(term, lay.footer_row, sz.cols, footer);
  }

  if (st.focus == Focus::Tree && !lay.tree.empty() && st.tree && st.tree_vp) {
    term.move_cursor(lay.tree.row + st.tree->cursor() - st.tree_vp->top_line, lay.tree.col);
  } else if (!lay.content.empty()) {
    Rect text = content_text_area(lay.content);
    term.move_cursor(text.row, text.col);
  } else {
    term.move_cursor(0, 0);
  }
  term.refresh();
}
