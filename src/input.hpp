#pragma once
/*
 * Input
 *
 * Purpose: resolve two-key sequences (gg, zo, zc, fk, fh) with minimal state.
 * Usage: feed every key first; Pending means the key was swallowed as a
 *        prefix, None means handle the key normally (a stale prefix is
 *        dropped in that case).
 */

enum class Chord { None, Pending, Top, Expand, Collapse, FocusViewer, FocusTree };

class Input {
public:
  Chord feed(int ch);
  bool pending() const { return prefix_ != 0; }
  void reset() { prefix_ = 0; }
private:
  int prefix_ = 0;
};
