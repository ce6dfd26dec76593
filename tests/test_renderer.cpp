#undef NDEBUG
#include "renderer.hpp"
#include "headless_terminal.hpp"
#include "pane_layout.hpp"
#include "test_support.hpp"
#include <cassert>
#include <string>

struct Fixture {
  TempDir tmp;
  FileTree tree;
  Viewport vp;
  ContentView content;
  Fixture() {
    std::string msg;
    bool ok = tree.load_directory(make_sample_tree(tmp), msg);
    assert(ok);
    content.show_welcome();
  }
  RenderState state(Focus f = Focus::Tree, bool sidebar = true) {
    RenderState st;
    st.tree = &tree;
    st.tree_vp = &vp;
    st.content = &content;
    st.focus = f;
    st.sidebar_visible = sidebar;
    st.sidebar_percent = 30;
    st.enable_color = true;
    st.title = "splitview";
    st.root = "root";
    return st;
  }
  void sync(const HeadlessTerminal& term, bool sidebar = true) {
    TermSize sz = term.getSize();
    ScreenLayout l = compute_layout(Rect{0, 0, sz.rows, sz.cols}, sidebar, 30);
    Rect text = content_text_area(l.content);
    content.set_viewport(text.width, text.height);
  }
};

static void test_tree_row_text() {
  TreeNode dir;
  dir.label = "beta";
  dir.kind = FileKind::Directory;
  TreeNode file;
  file.label = "Alpha.c";
  file.kind = FileKind::Source;
  assert(tree_row_text(VisibleRow{&dir, 1}) == "  + beta/");
  dir.expanded = true;
  assert(tree_row_text(VisibleRow{&dir, 0}) == "- beta/");
  assert(tree_row_text(VisibleRow{&file, 2}) == "    c Alpha.c");
}

static void test_full_frame() {
  Fixture fx;
  HeadlessTerminal term(12, 60);
  fx.sync(term);
  Renderer r;
  RenderState st = fx.state();
  st.message = "hello";
  r.render(term, st);
  assert(term.refresh_count() == 1);

  assert(term.row_text(0).find("splitview - root") != std::string::npos);
  assert(term.attr_at(0, 0) == '0' + PAIR_BAR);
  assert(term.row_text(11).find("q Quit") != std::string::npos);
  assert(term.row_text(11).rfind(" hello  |", 0) == 0);

  // body: tree width 17, border at 17, content text from column 19
  assert(term.row_text(1).rfind("- root/", 0) == 0);
  assert(term.attr_at(1, 0) == 'R');
  assert(term.attr_at(1, 16) == 'R');
  assert(term.row_text(2).rfind("  + beta/", 0) == 0);
  assert(term.attr_at(2, 2) == ' ');
  assert(term.attr_at(1, 17) == '0' + PAIR_BORDER);
  assert(term.attr_at(10, 17) == '0' + PAIR_BORDER);
  assert(term.row_text(1).find("splitview") == 19);
  assert(term.find_row("Welcome to splitview!") == 2);
  assert(term.cursor_row() == 1 && term.cursor_col() == 0);
}

static void test_unfocused_tree_and_border() {
  Fixture fx;
  HeadlessTerminal term(12, 60);
  fx.sync(term);
  Renderer r;
  r.render(term, fx.state(Focus::Content));
  assert(term.attr_at(1, 0) == '0' + PAIR_CURSOR_BLUR);
  assert(term.attr_at(1, 17) == '0' + PAIR_BORDER_FOCUS);
  assert(term.cursor_row() == 2 && term.cursor_col() == 19);
}

static void test_hidden_sidebar() {
  Fixture fx;
  HeadlessTerminal term(12, 60);
  fx.sync(term, false);
  Renderer r;
  r.render(term, fx.state(Focus::Content, false));
  assert(term.find_row("root/") == -1);
  assert(term.attr_at(1, 0) == '0' + PAIR_BORDER_FOCUS);
  assert(term.row_text(1).find("splitview") == 2);
}

static void test_tree_viewport_follows_cursor() {
  Fixture fx;
  std::string msg;
  for (int i = 0; i < 30; ++i) fx.tmp.write("many/f" + std::to_string(100 + i) + ".txt", "x\n");
  assert(fx.tree.load_directory(fx.tmp.path() / "many", msg));
  HeadlessTerminal term(8, 40);     // 6 body rows
  fx.sync(term);
  Renderer r;
  fx.tree.cursor_end();
  r.render(term, fx.state());
  assert(fx.vp.top_line == 31 - 6);
  assert(term.row_text(6).find("f129.txt") != std::string::npos);
  assert(term.attr_at(6, 0) == 'R');
  assert(term.cursor_row() == 6);

  fx.tree.cursor_home();
  r.render(term, fx.state());
  assert(fx.vp.top_line == 0);
  assert(term.row_text(1).rfind("- many/", 0) == 0);

  // collapsing leaves no gap at the bottom
  fx.tree.cursor_end();
  r.render(term, fx.state());
  fx.tree.cursor_home();
  fx.tree.collapse();
  fx.vp.top_line = 20;
  r.render(term, fx.state());
  assert(fx.vp.top_line == 0);
}

static void test_keyword_color() {
  Fixture fx;
  HeadlessTerminal term(12, 60);
  fx.sync(term);
  fx.content.set_text("x.c", {"int x;"}, Syntax::C);
  Renderer r;
  r.render(term, fx.state());
  int row = term.find_row("int x;");
  assert(row == 2);
  int col = static_cast<int>(term.row_text(row).find("int x;"));
  assert(term.attr_at(row, col) == '0' + PAIR_KEYWORD);
  assert(term.attr_at(row, col + 2) == '0' + PAIR_KEYWORD);
  assert(term.attr_at(row, col + 4) == ' ');

  RenderState st = fx.state();
  st.enable_color = false;
  r.render(term, st);
  assert(term.attr_at(row, col) == ' ');
}

static void test_scroll_position_in_title() {
  Fixture fx;
  HeadlessTerminal term(12, 60);
  fx.sync(term);
  std::vector<std::string> lines;
  for (int i = 0; i < 30; ++i) lines.push_back("l" + std::to_string(i));
  fx.content.set_text("long.txt", lines);
  fx.content.scroll_down();
  Renderer r;
  r.render(term, fx.state());
  assert(term.row_text(1).find("long.txt  (2-10/30)") != std::string::npos);
  assert(term.row_text(2).find("l1") != std::string::npos);
}

static void test_tiny_terminal() {
  Fixture fx;
  HeadlessTerminal term(1, 5);
  fx.sync(term);
  Renderer r;
  r.render(term, fx.state());
  assert(term.row_text(0) == " spli");
}

int main() {
  test_tree_row_text();
  test_full_frame();
  test_unfocused_tree_and_border();
  test_hidden_sidebar();
  test_tree_viewport_follows_cursor();
  test_keyword_color();
  test_scroll_position_in_title();
  test_tiny_terminal();
  return 0;
}
