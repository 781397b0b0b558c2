#include "text_buffer.hpp"
#include <cassert>
#include <string>
#include <vector>

int main() {
  TextBuffer b;
  assert(b.line_count() == 1);
  assert(b.line(0).empty());
  b.init_from_lines({"a", "b", "c"});
  assert(b.line_count() == 3);
  b.insert_line(1, "x");
  assert(b.line_count() == 4);
  assert(b.line(1) == std::string("x"));
  b.erase_line(2);
  assert(b.line_count() == 3);
  assert(b.line(0) == std::string("a"));
  assert(b.line(1) == std::string("x"));
  assert(b.line(2) == std::string("c"));
  b.replace_line(2, "z");
  assert(b.line(2) == std::string("z"));
  b.erase_lines(1, 3);
  assert(b.line_count() == 1);
  assert(b.line(0) == std::string("a"));

  // erasing everything still leaves one empty line
  b.erase_lines(0, 1);
  assert(b.line_count() == 1);
  assert(b.line(0).empty());

  b.init_from_lines({"hello world"});
  b.insert_text(0, 5, ",");
  assert(b.line(0) == "hello, world");
  b.erase_text(0, 5, 1);
  assert(b.line(0) == "hello world");
  b.split_line(0, 5);
  assert(b.line_count() == 2);
  assert(b.line(0) == "hello");
  assert(b.line(1) == " world");
  b.join_with_next(0);
  assert(b.line_count() == 1);
  assert(b.line(0) == "hello world");
  b.truncate_line(0, 5);
  b.append_to_line(0, "!");
  assert(b.line(0) == "hello!");
  assert(b.line_length(0) == 6);

  // out of range columns clamp to the line
  b.insert_text(0, 100, "?");
  assert(b.line(0) == "hello!?");
  b.join_with_next(0);
  assert(b.line_count() == 1);
  return 0;
}
