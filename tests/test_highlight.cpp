#include "ncurses_terminal.hpp"
#include <cassert>
#include <string>

static void test_defaults() {
  SgrAttrs a;
  assert(parse_sgr("\x1b[7m", a));
  assert(a.on == A_REVERSE && a.off == A_NORMAL);
  assert(parse_sgr("\x1b[27m", a));
  assert(a.on == A_NORMAL && a.off == A_REVERSE);
}

static void test_combined_params() {
  SgrAttrs a;
  assert(parse_sgr("\x1b[1;4m", a));
  assert(a.on == (A_BOLD | A_UNDERLINE));
  assert(parse_sgr("\x1b[22;24m", a));
  assert(a.off == (A_BOLD | A_DIM | A_UNDERLINE));
  // several sequences back to back
  assert(parse_sgr("\x1b[1m\x1b[5m", a));
  assert(a.on == (A_BOLD | A_BLINK));
  // a later parameter cancels an earlier one
  assert(parse_sgr("\x1b[1;22m", a));
  assert(a.on == A_NORMAL && a.off == (A_BOLD | A_DIM));
}

static void test_colours_and_reset() {
  SgrAttrs a;
  // colour parameters are accepted but carry no attribute
  assert(parse_sgr("\x1b[31;7m", a));
  assert(a.on == A_REVERSE);
  assert(parse_sgr("\x1b[m", a));
  assert(a.on == A_NORMAL);
  assert((a.off & A_REVERSE) && (a.off & A_BOLD) && (a.off & A_UNDERLINE));
  assert(parse_sgr("\x1b[0m", a));
  assert((a.off & A_REVERSE) != 0);
}

static void test_rejects() {
  SgrAttrs a;
  assert(!parse_sgr("", a));
  assert(!parse_sgr("<", a));
  assert(!parse_sgr("\x1b[7", a));
  assert(!parse_sgr("\x1b[2J", a));
  assert(a.on == A_NORMAL && a.off == A_NORMAL);
}

int main() {
  test_defaults();
  test_combined_params();
  test_colours_and_reset();
  test_rejects();
  return 0;
}
