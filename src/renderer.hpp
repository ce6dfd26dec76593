#pragma once
/*
 * Renderer
 *
 * Purpose: draw header, file tree, border, content pane and footer.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives a snapshot from Viewer each frame. The only
 *             thing written back is the tree viewport, scrolled so the
 *             selected row stays visible.
 */
#include <string>
#include "config.hpp"
#include "content_view.hpp"
#include "file_tree.hpp"
#include "iterminal.hpp"
#include "types.hpp"

struct RenderState {
  const FileTree* tree = nullptr;
  Viewport* tree_vp = nullptr;
  const ContentView* content = nullptr;
  Focus focus = Focus::Tree;
  bool sidebar_visible = true;
  int sidebar_percent = SV_SIDEBAR_PERCENT;
  bool enable_color = true;
  std::string title;
  std::string root;
  std::string message;
};

// one sidebar line before clipping: indent, marker, label
std::string tree_row_text(const VisibleRow& row);

class Renderer {
public:
  void render(ITerminal& term, const RenderState& st);
};
