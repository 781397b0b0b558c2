#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Records: the current text of every row (with the highlight markers
 *          spliced in at the selection offsets, and without them), each
 *          scroll operation, draw counts and the final cursor cell.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  struct ScrollOp { int top; int bottom; int delta; };

  HeadlessTerminal(int rows, int cols);

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override;
  void set_highlight_markers(const std::string& begin, const std::string& end) override;
  void draw_row(int row, const RowImage& img) override;
  void draw_status(int row, const std::string& text) override;
  void scroll_rows(int top, int bottom, int delta) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void set_cursor_visible(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refresh_count_++; }

  void resize(int rows, int cols);
  void reset_counters();

  const std::string& row_text(int row) const { return screen_[static_cast<size_t>(row)]; }
  const std::string& plain_row(int row) const { return plain_[static_cast<size_t>(row)]; }
  const std::vector<int>& drawn_rows() const { return drawn_rows_; }
  const std::vector<ScrollOp>& scrolls() const { return scrolls_; }
  int clear_count() const { return clear_count_; }
  int status_row() const { return status_row_; } // last on-screen status row, -1 if none
  int refresh_count() const { return refresh_count_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }

private:
  int rows_;
  int cols_;
  std::vector<std::string> screen_;
  std::vector<std::string> plain_;
  std::vector<int> drawn_rows_;
  std::vector<ScrollOp> scrolls_;
  std::string mark_begin_;
  std::string mark_end_;
  int clear_count_ = 0;
  int status_row_ = -1;
  int refresh_count_ = 0;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = true;
};
