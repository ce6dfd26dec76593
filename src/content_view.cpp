#include "content_view.hpp"
#include <algorithm>
#include <iterator>
#include <system_error>
#include "config.hpp"
#include "file_reader.hpp"
#include "logger.hpp"
#include "text_util.hpp"

namespace fs = std::filesystem;

static const char* const kWelcome[] = {
  "Welcome to splitview!",
  "",
  "Navigation:",
  "- Up/Down, j/k: move in the tree or scroll the content",
  "- Enter: open/close folders in the tree, focus the viewer for files",
  "- Enter (in viewer): return to the tree",
  "- Right/zo, Left/zc: expand/collapse directories",
  "- fk: focus viewer",
  "- fh: focus sidebar",
  "- Tab: switch between tree and content",
  "- ~: toggle sidebar",
  "- q: quit",
  "",
  "Content view additional controls:",
  "- Ctrl+u/Ctrl+d, PageUp/PageDown: page up/down",
  "- gg/G, Home/End: jump to top/bottom",
};

Syntax syntax_for(const fs::path& path) {
  std::string ext = to_lower(path.extension().string());
  if (ext == ".c" || ext == ".h") return Syntax::C;
  if (ext == ".mk" || path.filename().string().find("Makefile") != std::string::npos) return Syntax::Makefile;
  return Syntax::None;
}

void ContentView::set_text(const std::string& title, const std::vector<std::string>& lines, Syntax syntax) {
  title_ = title;
  lines_.clear();
  lines_.reserve(lines.size());
  for (const auto& l : lines) lines_.push_back(sanitize_line(l, tab_width_));
  syntax_ = syntax;
  scroll_y_ = 0;
  rewrap();
}

void ContentView::show_welcome() {
  set_text(SV_TITLE, std::vector<std::string>(std::begin(kWelcome), std::end(kWelcome)));
}

void ContentView::describe(const TreeNode& node) {
  std::error_code st_ec;
  fs::file_status st = fs::status(node.path, st_ec);
  // symlinked directories are leaves in the tree but still get a summary
  if (!node.is_dir() && !fs::is_directory(st)) {
    // fifos, sockets and devices are never opened; a fifo would block
    if (fs::exists(st) && !fs::is_regular_file(st)) {
      SV_LOG_DEBUG("not reading %s: not a regular file", node.path.string().c_str());
      set_text(node.label, {"Not a regular file: " + node.label});
      return;
    }
    std::vector<std::string> file_lines;
    std::string msg;
    if (!mmap_readlines(node.path, file_lines, msg, SV_MAX_FILE_BYTES)) {
      SV_LOG_WARN("%s", msg.c_str());
      set_text(node.label, {"Error reading file: " + msg});
      return;
    }
    SV_LOG_DEBUG("%s (%zu lines)", msg.c_str(), file_lines.size());
    if (file_lines.size() == 1 && file_lines[0].empty()) {
      set_text(node.label, {"No content available for " + node.label});
      return;
    }
    set_text(node.label, file_lines, syntax_for(node.path));
    return;
  }

  int files = 0, dirs = 0;
  std::error_code ec;
  fs::directory_iterator it(node.path, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code kind_ec;
    if (it->is_regular_file(kind_ec)) files++;
    else if (it->is_directory(kind_ec)) dirs++;
  }
  if (ec) {
    std::string msg = node.path.string() + ": " + ec.message();
    SV_LOG_WARN("can not read directory %s", msg.c_str());
    set_text(node.label, {"Error reading directory: " + msg});
    return;
  }
  std::string name = node.path.filename().string();
  if (name.empty()) name = node.label;
  set_text(node.label, {
    "# " + name,
    "",
    "This directory contains:",
    "- " + std::to_string(files) + " files",
    "- " + std::to_string(dirs) + " directories",
    "",
    "Select a file to view its contents.",
  });
}

void ContentView::set_viewport(int width, int height) {
  height_ = std::max(0, height);
  if (width != width_) {
    width_ = width;
    rewrap();
  } else {
    scroll_to(scroll_y_);
  }
}

void ContentView::rewrap() {
  rows_.clear();
  for (const auto& l : lines_) {
    auto parts = wrap_line(l, width_);
    rows_.insert(rows_.end(), parts.begin(), parts.end());
  }
  scroll_to(scroll_y_);
}

int ContentView::max_scroll() const { return std::max(0, row_count() - height_); }
int ContentView::page_size() const { return std::max(1, height_ - 2); }

void ContentView::scroll_to(int y) { scroll_y_ = std::clamp(y, 0, max_scroll()); }

void ContentView::scroll_down() { scroll_to(scroll_y_ + 1); }
void ContentView::scroll_up() { scroll_to(scroll_y_ - 1); }
void ContentView::scroll_home() { scroll_to(0); }
void ContentView::scroll_end() { scroll_to(max_scroll()); }
void ContentView::page_down() { scroll_to(scroll_y_ + page_size()); }
void ContentView::page_up() { scroll_to(scroll_y_ - page_size()); }
