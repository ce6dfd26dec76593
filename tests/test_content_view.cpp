#undef NDEBUG
#include "content_view.hpp"
#include "config.hpp"
#include "file_reader.hpp"
#include "test_support.hpp"
#include <sys/stat.h>
#include <cassert>
#include <string>
#include <vector>

static std::vector<std::string> numbered(int n) {
  std::vector<std::string> v;
  for (int i = 0; i < n; ++i) v.push_back("row " + std::to_string(i));
  return v;
}

static void test_scroll_is_clamped() {
  ContentView cv;
  cv.set_viewport(20, 4);
  cv.set_text("t", numbered(10));
  assert(cv.max_scroll() == 6);
  for (int i = 0; i < 10; ++i) cv.scroll_down();
  assert(cv.scroll_y() == 6);
  cv.scroll_up();
  assert(cv.scroll_y() == 5);
  cv.scroll_home();
  assert(cv.scroll_y() == 0);
  cv.scroll_up();
  assert(cv.scroll_y() == 0);
  cv.scroll_end();
  assert(cv.scroll_y() == 6);
  cv.scroll_home();
  cv.page_down();
  assert(cv.scroll_y() == 2);
  cv.page_up();
  cv.page_up();
  assert(cv.scroll_y() == 0);

  // a taller pane shrinks the scroll range
  cv.scroll_end();
  cv.set_viewport(20, 20);
  assert(cv.max_scroll() == 0);
  assert(cv.scroll_y() == 0);

  // new text starts at the top
  cv.set_viewport(20, 4);
  cv.scroll_end();
  cv.set_text("u", numbered(3));
  assert(cv.scroll_y() == 0);
  assert(cv.max_scroll() == 0);
}

static void test_page_size_floor() {
  ContentView cv;
  cv.set_viewport(10, 2);
  cv.set_text("t", numbered(10));
  assert(cv.page_size() == 1);
  cv.page_down();
  assert(cv.scroll_y() == 1);
}

static void test_wrapping_follows_width() {
  ContentView cv;
  cv.set_viewport(4, 10);
  cv.set_text("t", {"abcdefghij", ""});
  assert(cv.row_count() == 4);
  assert(cv.rows()[0] == "abcd");
  assert(cv.rows()[2] == "ij");
  cv.set_viewport(5, 10);
  assert(cv.row_count() == 3);
  assert(cv.lines().size() == 2);
}

static void test_describe_file() {
  TempDir tmp;
  auto p = tmp.write("a.c", "int main(void) {\r\n\treturn 0;\r\n}\n");
  TreeNode n;
  n.label = "a.c";
  n.path = p;
  n.kind = file_kind(p);
  ContentView cv;
  cv.set_viewport(40, 10);
  cv.describe(n);
  assert(cv.title() == "a.c");
  assert(cv.syntax() == Syntax::C);
  assert(cv.lines().size() == 3);
  assert(cv.lines()[0] == "int main(void) {");
  assert(cv.lines()[1] == "    return 0;");
  assert(cv.lines()[2] == "}");

  cv.set_tab_width(2);
  cv.describe(n);
  assert(cv.lines()[1] == "  return 0;");
}

static void test_describe_empty_and_missing() {
  TempDir tmp;
  TreeNode n;
  n.label = "empty.txt";
  n.path = tmp.write("empty.txt", "");
  ContentView cv;
  cv.describe(n);
  assert(cv.lines().size() == 1);
  assert(cv.lines()[0] == "No content available for empty.txt");

  n.label = "gone.txt";
  n.path = tmp.path() / "gone.txt";
  cv.describe(n);
  assert(cv.lines().size() == 1);
  assert(cv.lines()[0].rfind("Error reading file: can not open file: ", 0) == 0);
  assert(cv.syntax() == Syntax::None);
}

static void test_describe_directory() {
  TempDir tmp;
  tmp.write("d/one.c", "x\n");
  tmp.write("d/two.txt", "y\n");
  tmp.write("d/.dot", "z\n");
  tmp.mkdir("d/inner");
  TreeNode n;
  n.label = "d";
  n.path = tmp.path() / "d";
  n.kind = FileKind::Directory;
  ContentView cv;
  cv.describe(n);
  std::vector<std::string> want = {
    "# d", "", "This directory contains:", "- 3 files", "- 1 directories", "",
    "Select a file to view its contents.",
  };
  assert(cv.lines() == want);
}

static void test_syntax_hints_and_welcome() {
  assert(syntax_for("Makefile") == Syntax::Makefile);
  assert(syntax_for("GNUMakefile.old") == Syntax::Makefile);
  assert(syntax_for("build.mk") == Syntax::Makefile);
  assert(syntax_for("x.H") == Syntax::C);
  assert(syntax_for("x.txt") == Syntax::None);

  ContentView cv;
  cv.show_welcome();
  assert(cv.title() == SV_TITLE);
  assert(cv.lines()[0] == "Welcome to splitview!");
}

static void test_reader_limits_and_crlf() {
  TempDir tmp;
  auto p = tmp.write("f.txt", "abc\r\ndef\nghi");
  std::vector<std::string> lines;
  std::string msg;
  assert(mmap_readlines(p, lines, msg));
  assert(lines.size() == 3);
  assert(lines[0] == "abc" && lines[2] == "ghi");

  assert(mmap_readlines(p, lines, msg, 6));
  assert(lines.size() == 2);
  assert(lines[1] == "d");
  assert(msg.find("truncated") != std::string::npos);

  assert(!mmap_readlines(tmp.path(), lines, msg));
  assert(msg.find("is a directory") != std::string::npos);
}

static void test_fifo_is_not_opened() {
  TempDir tmp;
  auto pipe = tmp.path() / "pipe";
  assert(::mkfifo(pipe.c_str(), 0600) == 0);
  TreeNode n;
  n.label = "pipe";
  n.path = pipe;
  n.kind = file_kind(pipe);
  ContentView cv;
  cv.describe(n);
  assert(cv.title() == "pipe");
  assert(cv.lines().size() == 1);
  assert(cv.lines()[0] == "Not a regular file: pipe");

  std::vector<std::string> lines;
  std::string msg;
  assert(!mmap_readlines(pipe, lines, msg));
  assert(msg.rfind("not a regular file: ", 0) == 0);
  assert(lines.empty());
}

int main() {
  test_scroll_is_clamped();
  test_page_size_floor();
  test_wrapping_follows_width();
  test_describe_file();
  test_describe_empty_and_missing();
  test_describe_directory();
  test_syntax_hints_and_welcome();
  test_reader_limits_and_crlf();
  test_fifo_is_not_opened();
  return 0;
}
