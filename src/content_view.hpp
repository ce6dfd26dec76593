#pragma once
/*
 * ContentView
 *
 * Purpose: the right-hand pane model; text of the highlighted tree entry,
 *          soft-wrapped to the pane width, with a clamped scroll offset.
 * Invariant: 0 <= scroll_y() <= max_scroll() after every call.
 */
#include <string>
#include <vector>
#include "file_tree.hpp"

enum class Syntax { None, C, Makefile };

Syntax syntax_for(const std::filesystem::path& path);

class ContentView {
public:
  void set_text(const std::string& title, const std::vector<std::string>& lines, Syntax syntax = Syntax::None);
  void show_welcome();
  // file text or directory summary for the node; errors become the content
  void describe(const TreeNode& node);

  void set_tab_width(int width) { tab_width_ = width < 1 ? 1 : width; }
  int tab_width() const { return tab_width_; }
  void set_viewport(int width, int height);

  void scroll_down();
  void scroll_up();
  void scroll_home();
  void scroll_end();
  void page_down();
  void page_up();

  const std::string& title() const { return title_; }
  Syntax syntax() const { return syntax_; }
  const std::vector<std::string>& lines() const { return lines_; }
  const std::vector<std::string>& rows() const { return rows_; }
  int row_count() const { return static_cast<int>(rows_.size()); }
  int scroll_y() const { return scroll_y_; }
  int max_scroll() const;
  int page_size() const;

private:
  void rewrap();
  void scroll_to(int y);

  std::string title_;
  std::vector<std::string> lines_;
  std::vector<std::string> rows_;
  Syntax syntax_ = Syntax::None;
  int width_ = 0;
  int height_ = 0;
  int scroll_y_ = 0;
  int tab_width_ = 4;
};
