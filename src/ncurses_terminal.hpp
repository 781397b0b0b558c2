#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 * Highlight: the configured begin/end SGR sequences are translated into
 *            ncurses attributes once, when they are set.
 */
#include "iterminal.hpp"
#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>

// attributes an SGR sequence ("\x1b[1;4m", possibly several) turns on and off
struct SgrAttrs {
  attr_t on = A_NORMAL;
  attr_t off = A_NORMAL;
};

// false when text holds no well-formed SGR sequence
bool parse_sgr(const std::string& text, SgrAttrs& out);

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void set_highlight_markers(const std::string& begin, const std::string& end) override;
  void draw_row(int row, const RowImage& img) override;
  void draw_status(int row, const std::string& text) override;
  void scroll_rows(int top, int bottom, int delta) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visible(bool visible) override;
  void refresh() override;
private:
  void draw_span(const std::string& text, int from, int to);
  attr_t hl_on_ = A_REVERSE;
  attr_t hl_off_ = A_REVERSE;
};
