#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, rows, scroll region, cursor, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Note: draw_row gets the selection as offsets; the backend renders it with
 *       the formatting named by set_highlight_markers.
 */
#include <string>
#include "row_image.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void set_highlight_markers(const std::string& begin, const std::string& end) = 0;
  virtual void draw_row(int row, const RowImage& img) = 0;
  virtual void draw_status(int row, const std::string& text) = 0;
  // shift rows [top, bottom] up by delta (down when negative); exposed rows are blank
  virtual void scroll_rows(int top, int bottom, int delta) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual void refresh() = 0;
};
