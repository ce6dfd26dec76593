#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "cmd_registry.hpp"
#include "config.hpp"
#include "content_view.hpp"
#include "file_tree.hpp"
#include "input.hpp"
#include "iterminal.hpp"
#include "pane_layout.hpp"
#include "renderer.hpp"
#include "types.hpp"

class Viewer {
public:
  Viewer(ITerminal& term, const std::filesystem::path& root);

  // render / read one key / dispatch until quit; returns the exit status
  int run();
  void handle_key(int ch);

  // ~/.splitviewrc when HOME is set
  static std::optional<std::filesystem::path> default_rc_path();
  void load_rc(const std::filesystem::path& rc);
  void execute_command(const std::string& line);

  const FileTree& tree() const { return tree_; }
  const ContentView& content() const { return content_; }
  Focus focus() const { return focus_; }
  bool sidebar_visible() const { return sidebar_visible_; }
  int sidebar_percent() const { return sidebar_percent_; }
  bool enable_color() const { return enable_color_; }
  const std::string& title() const { return title_; }
  bool should_quit() const { return should_quit_; }
  const std::string& message() const { return message_; }

private:
  void register_commands();
  void render();
  ScreenLayout sync_layout();
  void handle_tree_key(int ch);
  void handle_content_key(int ch);
  void on_highlight();
  void confirm_selection();
  void set_focus(Focus f);
  void switch_focus();
  void focus_viewer();
  void focus_tree();
  void toggle_sidebar();

  ITerminal& term_;
  ScreenLayout layout_;
  std::filesystem::path root_;
  FileTree tree_;
  Viewport tree_vp_;
  ContentView content_;
  Input input_;
  Renderer renderer_;
  CommandRegistry registry_;
  Focus focus_ = Focus::Tree;
  bool sidebar_visible_ = true;
  int sidebar_percent_ = SV_SIDEBAR_PERCENT;
  bool enable_color_ = true;
  bool should_quit_ = false;
  std::string title_ = SV_TITLE;
  std::string message_;
};
