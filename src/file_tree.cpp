#include "file_tree.hpp"
#include <algorithm>
#include <system_error>
#include "logger.hpp"
#include "text_util.hpp"

namespace fs = std::filesystem;

FileKind file_kind(const fs::path& path) {
  std::string name = path.filename().string();
  if (name == "Makefile" || name == "makefile" || name == "GNUmakefile") return FileKind::Build;
  std::string ext = to_lower(path.extension().string());
  if (ext == ".c" || ext == ".h") return FileKind::Source;
  if (ext == ".txt" || ext == ".md" || ext == ".info") return FileKind::Document;
  if (ext == ".mk") return FileKind::Build;
  return FileKind::Other;
}

const char* kind_tag(FileKind kind) {
  switch (kind) {
    case FileKind::Directory: return "/";
    case FileKind::Source:    return "c";
    case FileKind::Document:  return "t";
    case FileKind::Build:     return "m";
    case FileKind::Other:     return ".";
  }
  return ".";
}

static bool skip_entry(const std::string& name) {
  return name.empty() || name[0] == '.' || name == "__pycache__";
}

static void add_children(TreeNode& node) {
  std::error_code ec;
  fs::directory_iterator it(node.path, ec);
  if (ec) {
    SV_LOG_WARN("can not list %s: %s", node.path.string().c_str(), ec.message().c_str());
    return;
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      SV_LOG_WARN("listing %s stopped: %s", node.path.string().c_str(), ec.message().c_str());
      break;
    }
    const fs::directory_entry& entry = *it;
    std::string name = entry.path().filename().string();
    if (skip_entry(name)) continue;
    std::error_code dir_ec, link_ec;
    // symlinked directories are shown as leaves and never followed
    bool is_dir = entry.is_directory(dir_ec) && !entry.is_symlink(link_ec);
    auto child = std::make_unique<TreeNode>();
    child->label = sanitize_line(name, 1);
    child->path = entry.path();
    child->kind = is_dir ? FileKind::Directory : file_kind(entry.path());
    child->parent = &node;
    node.children.push_back(std::move(child));
  }
  std::sort(node.children.begin(), node.children.end(),
            [](const std::unique_ptr<TreeNode>& a, const std::unique_ptr<TreeNode>& b) {
              if (a->is_dir() != b->is_dir()) return a->is_dir();
              std::string la = to_lower(a->label), lb = to_lower(b->label);
              if (la != lb) return la < lb;
              return a->label < b->label;
            });
  for (auto& c : node.children) {
    if (c->is_dir()) add_children(*c);
  }
}

static std::string root_label(const fs::path& root) {
  fs::path p = root;
  std::string name = p.filename().string();
  if (name.empty() || name == ".") name = p.parent_path().filename().string();
  if (name.empty()) name = root.string();
  return name;
}

FileTree::FileTree() : root_(std::make_unique<TreeNode>()) {
  root_->kind = FileKind::Directory;
  root_->expanded = true;
  rebuild_visible();
}

bool FileTree::load_directory(const fs::path& root, std::string& msg) {
  auto node = std::make_unique<TreeNode>();
  node->label = sanitize_line(root_label(root), 1);
  node->path = root;
  node->kind = FileKind::Directory;
  node->expanded = true;
  std::error_code ec;
  bool ok = fs::is_directory(root, ec);
  if (ok) {
    add_children(*node);
    msg = std::string("loaded ") + root.string();
  } else {
    msg = std::string("can not open directory: ") + root.string();
    if (ec) msg += ": " + ec.message();
    SV_LOG_WARN("%s", msg.c_str());
  }
  root_ = std::move(node);
  cursor_ = 0;
  rebuild_visible();
  return ok;
}

void FileTree::rebuild_visible() {
  rows_.clear();
  struct Frame { TreeNode* node; int depth; };
  std::vector<Frame> stack{{root_.get(), 0}};
  while (!stack.empty()) {
    Frame f = stack.back();
    stack.pop_back();
    rows_.push_back(VisibleRow{f.node, f.depth});
    if (!f.node->expanded) continue;
    for (auto it = f.node->children.rbegin(); it != f.node->children.rend(); ++it) {
      stack.push_back(Frame{it->get(), f.depth + 1});
    }
  }
  cursor_ = std::clamp(cursor_, 0, visible_count() - 1);
}

TreeNode* FileTree::cursor_node() const { return rows_[cursor_].node; }

bool FileTree::set_cursor(int row) {
  int next = std::clamp(row, 0, visible_count() - 1);
  if (next == cursor_) return false;
  cursor_ = next;
  return true;
}

bool FileTree::cursor_up() { return set_cursor(cursor_ - 1); }
bool FileTree::cursor_down() { return set_cursor(cursor_ + 1); }
bool FileTree::cursor_home() { return set_cursor(0); }
bool FileTree::cursor_end() { return set_cursor(visible_count() - 1); }
bool FileTree::page_up(int rows) { return set_cursor(cursor_ - std::max(1, rows)); }
bool FileTree::page_down(int rows) { return set_cursor(cursor_ + std::max(1, rows)); }

bool FileTree::expand() {
  TreeNode* n = cursor_node();
  if (!n->is_dir() || n->expanded) return false;
  n->expanded = true;
  rebuild_visible();
  return true;
}

bool FileTree::collapse() {
  TreeNode* n = cursor_node();
  if (!n->is_dir() || !n->expanded) return false;
  // descendants sit after the cursor, so the cursor row index is unaffected
  n->expanded = false;
  rebuild_visible();
  return true;
}

bool FileTree::toggle() {
  TreeNode* n = cursor_node();
  if (!n->is_dir()) return false;
  return n->expanded ? collapse() : expand();
}

bool FileTree::collapse_or_parent() {
  if (collapse()) return true;
  TreeNode* parent = cursor_node()->parent;
  if (!parent) return false;
  for (int i = cursor_ - 1; i >= 0; --i) {
    if (rows_[i].node == parent) return set_cursor(i);
  }
  return false;
}
