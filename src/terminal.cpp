#include "terminal.hpp"
#include <locale.h>
#include <sys/ioctl.h>
#include <unistd.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, FALSE);
  intrflush(stdscr, FALSE);
  idlok(stdscr, TRUE);
}

Terminal::~Terminal() {
  endwin();
}

void Terminal::suspend() {
  def_prog_mode();
  endwin();
}

void Terminal::resume() {
  reset_prog_mode();
  clearok(stdscr, TRUE);
  ::refresh();
}

void Terminal::resize_to_tty() {
  winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
    resizeterm(ws.ws_row, ws.ws_col);
  }
}
