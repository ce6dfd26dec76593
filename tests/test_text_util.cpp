#undef NDEBUG
#include "text_util.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  assert(to_lower("MakeFile.MK") == "makefile.mk");

  assert(sanitize_line("a\tb", 4) == "a   b");
  assert(sanitize_line("\tx", 4) == "    x");
  assert(sanitize_line("abcd\tx", 4) == "abcd    x");
  assert(sanitize_line("\t", 0) == " ");
  assert(sanitize_line("a\x01" "b", 4) == "a?b");
  assert(sanitize_line("bell\x7f", 4) == "bell?");
  assert(sanitize_line("\xff" "ok", 4) == "?ok");
  assert(sanitize_line("caf\xc3\xa9", 4) == "caf\xc3\xa9");
  assert(sanitize_line("\xc2\x85" "x", 4) == "?x");
  assert(sanitize_line("\xe0\x80\xaf", 4) == "???");    // overlong
  assert(sanitize_line("\xc3", 4) == "?");              // truncated sequence
  // tab stops count code points, not bytes
  assert(sanitize_line("\xc3\xa9\tx", 4) == "\xc3\xa9   x");

  assert(utf8_seq_len("\xe2\x82\xac", 0) == 3);
  assert(utf8_seq_len("\xed\xa0\x80", 0) == 0);          // surrogate

  const std::string hello = "h\xc3\xa9llo";
  assert(display_width(hello) == 5);
  assert(clip_columns(hello, 1, 2) == "\xc3\xa9l");
  assert(clip_columns(hello, 0, 0).empty());
  assert(clip_columns(hello, 4, 10) == "o");
  assert(clip_columns(hello, 9, 3).empty());

  std::vector<std::string> w = wrap_line("abcdefg", 3);
  assert(w.size() == 3);
  assert(w[0] == "abc" && w[1] == "def" && w[2] == "g");
  w = wrap_line("", 3);
  assert(w.size() == 1 && w[0].empty());
  w = wrap_line("abc", 0);
  assert(w.size() == 1 && w[0] == "abc");
  w = wrap_line(hello, 2);
  assert(w.size() == 3 && w[0] == "h\xc3\xa9");
  return 0;
}
