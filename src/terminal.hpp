#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; destructor restores terminal.
 * Note: manages terminal modes (raw/noecho, program vs shell mode), not
 *       rendering; keys are read from stdin by the KeyDecoder, never getch.
 */
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  // leave curses mode keeping the editing mode for resume()
  static void suspend();
  static void resume();
  static void resize_to_tty();
};
