#pragma once
/*
 * Viewport / DirtyTracker
 *
 * Purpose: visible window (origin + size in cells) over the buffer, and the
 *          accumulated row range that needs redraw since the last render.
 * Note: any nonzero line delta forces a full redraw downstream.
 */

class Viewport {
public:
  int min_row() const { return min_row_; }
  int min_col() const { return min_col_; }
  int height() const { return height_; }
  int width() const { return width_; }
  int max_row() const { return min_row_ + height_ - 1; }
  int max_col() const { return min_col_ + width_ - 1; }

  void resize(int height, int width);
  void scroll_by(int delta);
  void pan_by(int delta);
  void reset_origin() { min_row_ = 0; min_col_ = 0; }

  int required_scroll(int cursor_row) const;
  int required_pan(int cursor_vcol) const;
  bool contains(int row, int vcol) const;

private:
  int min_row_ = 0;
  int min_col_ = 0;
  int height_ = 1;
  int width_ = 1;
};

struct DirtyRegion {
  int first_row = -1;
  int last_row = -1;
  int line_delta = 0;
  bool lines_shifted = false; // some request carried a nonzero delta
  bool full_redraw = false;

  bool has_rows() const { return first_row >= 0; }
};

class DirtyTracker {
public:
  void record(int first_row, int last_row, int line_delta = 0);
  void request_full_redraw() { region_.full_redraw = true; }
  bool needs_full_redraw() const { return region_.full_redraw || region_.lines_shifted; }
  bool empty() const { return !region_.has_rows() && !needs_full_redraw(); }
  const DirtyRegion& region() const { return region_; }
  void clear() { region_ = DirtyRegion{}; }
private:
  DirtyRegion region_;
};
