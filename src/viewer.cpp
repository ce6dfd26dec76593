#include <ncurses.h>
#include "viewer.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include "file_reader.hpp"
#include "logger.hpp"

namespace fs = std::filesystem;

static constexpr int CTRL_c = 'C'-64;
static constexpr int CTRL_d = 'D'-64;
static constexpr int CTRL_u = 'U'-64;

static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }

static std::string key_label(int ch) {
  if (ch >= 32 && ch < 127) return std::string(1, static_cast<char>(ch));
  if (ch >= 0 && ch < 32) return std::string("^") + static_cast<char>(ch + 64);
  switch (ch) {
    case KEY_UP: return "up";
    case KEY_DOWN: return "down";
    case KEY_LEFT: return "left";
    case KEY_RIGHT: return "right";
    case KEY_ENTER: return "enter";
    case KEY_RESIZE: return "resize";
    default: return "key " + std::to_string(ch);
  }
}

static const char* focus_name(Focus f) { return f == Focus::Tree ? "tree" : "content"; }

Viewer::Viewer(ITerminal& term, const fs::path& root) : term_(term), root_(root) {
  register_commands();
  content_.set_tab_width(SV_TAB_WIDTH);
  std::string msg;
  if (!tree_.load_directory(root_, msg)) message_ = msg;
  SV_LOG_INFO("%s (%d rows visible)", msg.c_str(), tree_.visible_count());
  content_.show_welcome();
}

std::optional<fs::path> Viewer::default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home || !*home) return std::nullopt;
  return fs::path(home) / SV_RC_NAME;
}

int Viewer::run() {
  SV_LOG_DEBUG("event loop started");
  while (!should_quit_) {
    render();
    int ch = term_.read_key();
    if (ch == INPUT_CLOSED) {
      SV_LOG_WARN("input closed, leaving event loop");
      break;
    }
    handle_key(ch);
  }
  SV_LOG_DEBUG("event loop finished");
  return 0;
}

ScreenLayout Viewer::sync_layout() {
  TermSize sz = term_.getSize();
  layout_ = compute_layout(Rect{0, 0, sz.rows, sz.cols}, sidebar_visible_, sidebar_percent_);
  Rect text = content_text_area(layout_.content);
  content_.set_viewport(text.width, text.height);
  return layout_;
}

void Viewer::render() {
  sync_layout();
  RenderState st;
  st.tree = &tree_;
  st.tree_vp = &tree_vp_;
  st.content = &content_;
  st.focus = focus_;
  st.sidebar_visible = sidebar_visible_;
  st.sidebar_percent = sidebar_percent_;
  st.enable_color = enable_color_;
  st.title = title_;
  st.root = root_.string();
  st.message = message_;
  renderer_.render(term_, st);
}

void Viewer::handle_key(int ch) {
  SV_LOG_DEBUG("key %s (focus %s)", key_label(ch).c_str(), focus_name(focus_));
  sync_layout();
  if (ch == KEY_RESIZE) return;

  switch (input_.feed(ch)) {
    case Chord::Pending:
      return;
    case Chord::Top:
      if (focus_ == Focus::Content) content_.scroll_home();
      else if (tree_.cursor_home()) on_highlight();
      return;
    case Chord::Expand:
      if (focus_ == Focus::Tree && tree_.expand()) SV_LOG_DEBUG("expanded %s", tree_.cursor_node()->path.string().c_str());
      return;
    case Chord::Collapse:
      if (focus_ == Focus::Tree && tree_.collapse()) SV_LOG_DEBUG("collapsed %s", tree_.cursor_node()->path.string().c_str());
      return;
    case Chord::FocusViewer:
      focus_viewer();
      return;
    case Chord::FocusTree:
      focus_tree();
      return;
    case Chord::None:
      break;
  }

  if (ch == 'q' || ch == CTRL_c) {
    SV_LOG_INFO("quit requested");
    should_quit_ = true;
    return;
  }
  if (ch == '\t') { switch_focus(); return; }
  if (ch == '~') { toggle_sidebar(); return; }
  if (focus_ == Focus::Tree) handle_tree_key(ch);
  else handle_content_key(ch);
}

void Viewer::handle_tree_key(int ch) {
  int page = std::max(1, layout_.tree.height - 1);
  int before = tree_.cursor();
  switch (ch) {
    case KEY_UP: case 'k': tree_.cursor_up(); break;
    case KEY_DOWN: case 'j': tree_.cursor_down(); break;
    case KEY_HOME: tree_.cursor_home(); break;
    case KEY_END: case 'G': tree_.cursor_end(); break;
    case KEY_PPAGE: tree_.page_up(page); break;
    case KEY_NPAGE: tree_.page_down(page); break;
    case KEY_RIGHT:
      if (tree_.expand()) SV_LOG_DEBUG("expanded %s", tree_.cursor_node()->path.string().c_str());
      break;
    case KEY_LEFT:
      if (tree_.collapse_or_parent() && tree_.cursor() == before) {
        SV_LOG_DEBUG("collapsed %s", tree_.cursor_node()->path.string().c_str());
      }
      break;
    default:
      if (is_enter(ch)) confirm_selection();
      break;
  }
  if (tree_.cursor() != before) on_highlight();
}

void Viewer::handle_content_key(int ch) {
  switch (ch) {
    case KEY_DOWN: case 'j': content_.scroll_down(); break;
    case KEY_UP: case 'k': content_.scroll_up(); break;
    case KEY_HOME: content_.scroll_home(); break;
    case KEY_END: case 'G': content_.scroll_end(); break;
    case KEY_NPAGE: case CTRL_d: content_.page_down(); break;
    case KEY_PPAGE: case CTRL_u: content_.page_up(); break;
    default:
      if (is_enter(ch)) focus_tree();
      break;
  }
}

void Viewer::on_highlight() {
  const TreeNode* node = tree_.cursor_node();
  SV_LOG_DEBUG("highlighted %s", node->path.string().c_str());
  content_.describe(*node);
}

void Viewer::confirm_selection() {
  TreeNode* node = tree_.cursor_node();
  if (node->is_dir()) {
    bool was_open = node->expanded;
    if (tree_.toggle()) SV_LOG_DEBUG("%s %s", was_open ? "collapsed" : "expanded", node->path.string().c_str());
    return;
  }
  // the highlight already loaded the file; keep its scroll position
  focus_viewer();
}

void Viewer::set_focus(Focus f) {
  if (f == focus_) return;
  SV_LOG_DEBUG("focus %s -> %s", focus_name(focus_), focus_name(f));
  focus_ = f;
  input_.reset();
}

void Viewer::switch_focus() {
  if (focus_ == Focus::Tree) focus_viewer();
  else focus_tree();
}

void Viewer::focus_viewer() { set_focus(Focus::Content); }

void Viewer::focus_tree() {
  if (!sidebar_visible_) {
    sidebar_visible_ = true;
    SV_LOG_DEBUG("sidebar shown to take focus");
  }
  set_focus(Focus::Tree);
}

void Viewer::toggle_sidebar() {
  sidebar_visible_ = !sidebar_visible_;
  SV_LOG_DEBUG("sidebar %s", sidebar_visible_ ? "shown" : "hidden");
  set_focus(sidebar_visible_ ? Focus::Tree : Focus::Content);
}

void Viewer::load_rc(const fs::path& rc) {
  std::error_code ec;
  if (!fs::exists(rc, ec)) return;
  std::vector<std::string> lines;
  std::string msg;
  if (!mmap_readlines(rc, lines, msg)) {
    SV_LOG_WARN("%s", msg.c_str());
    message_ = msg;
    return;
  }
  SV_LOG_INFO("loading %s", rc.string().c_str());
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  for (std::string s : lines) {
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    execute_command(s);
  }
}

void Viewer::execute_command(const std::string& line) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd.empty()) return;
  std::string name = cmd;
  if (cmd == "set" && !args.empty()) {
    std::string opt = args[0];
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      value = opt.substr(eq + 1);
      opt = opt.substr(0, eq);
    }
    name = "set " + opt;
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    subargs.insert(subargs.end(), args.begin() + 1, args.end());
    args = std::move(subargs);
  }
  std::string msg;
  CommandRegistry::Result r = registry_.execute(name, args, msg);
  if (r == CommandRegistry::Result::Ok) SV_LOG_DEBUG("%s: %s", line.c_str(), msg.c_str());
  else SV_LOG_WARN("%s: %s", line.c_str(), msg.c_str());
  message_ = msg;
}
