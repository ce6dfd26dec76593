#include "input.hpp"

static bool is_prefix(int ch) { return ch == 'g' || ch == 'z' || ch == 'f'; }

Chord Input::feed(int ch) {
  if (prefix_ != 0) {
    int p = prefix_;
    prefix_ = 0;
    if (p == 'g' && ch == 'g') return Chord::Top;
    if (p == 'z' && ch == 'o') return Chord::Expand;
    if (p == 'z' && ch == 'c') return Chord::Collapse;
    if (p == 'f' && ch == 'k') return Chord::FocusViewer;
    if (p == 'f' && ch == 'h') return Chord::FocusTree;
    return Chord::None;
  }
  if (is_prefix(ch)) {
    prefix_ = ch;
    return Chord::Pending;
  }
  return Chord::None;
}
