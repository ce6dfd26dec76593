#pragma once
/*
 * FileTree
 *
 * Purpose: the sidebar menu; a directory tree flattened into visible rows
 *          with a single selected (cursor) row.
 * Invariant: 0 <= cursor < visible_count() after every operation; the root
 *            is always row 0.
 * Order: directories first, then files, each by case-insensitive name;
 *        dot-entries and __pycache__ are skipped.
 */
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

enum class FileKind { Directory, Source, Document, Build, Other };

FileKind file_kind(const std::filesystem::path& path);
const char* kind_tag(FileKind kind);

struct TreeNode {
  std::string label;
  std::filesystem::path path;
  FileKind kind = FileKind::Other;
  bool expanded = false;
  TreeNode* parent = nullptr;
  std::vector<std::unique_ptr<TreeNode>> children;

  bool is_dir() const { return kind == FileKind::Directory; }
};

struct VisibleRow {
  TreeNode* node = nullptr;
  int depth = 0;
};

class FileTree {
public:
  FileTree();

  // replaces the whole tree; false + msg when root is not a readable directory
  bool load_directory(const std::filesystem::path& root, std::string& msg);

  const TreeNode& root() const { return *root_; }
  const std::vector<VisibleRow>& visible_rows() const { return rows_; }
  int visible_count() const { return static_cast<int>(rows_.size()); }
  int cursor() const { return cursor_; }
  TreeNode* cursor_node() const;

  // movement returns true when the selected row changed
  bool set_cursor(int row);
  bool cursor_up();
  bool cursor_down();
  bool cursor_home();
  bool cursor_end();
  bool page_up(int rows);
  bool page_down(int rows);

  // expansion returns true when the tree shape changed
  bool expand();
  bool collapse();
  bool toggle();
  // collapse an expanded directory, otherwise select its parent
  bool collapse_or_parent();

private:
  void rebuild_visible();

  std::unique_ptr<TreeNode> root_;
  std::vector<VisibleRow> rows_;
  int cursor_ = 0;
};
