#include "viewport.hpp"
#include <algorithm>

void Viewport::resize(int height, int width) {
  height_ = std::max(1, height);
  width_ = std::max(1, width);
}

void Viewport::scroll_by(int delta) { min_row_ = std::max(0, min_row_ + delta); }

void Viewport::pan_by(int delta) { min_col_ = std::max(0, min_col_ + delta); }

int Viewport::required_scroll(int cursor_row) const {
  if (cursor_row < min_row_) return cursor_row - min_row_;
  if (cursor_row > max_row()) return cursor_row - max_row();
  return 0;
}

int Viewport::required_pan(int cursor_vcol) const {
  if (cursor_vcol < min_col_) return cursor_vcol - min_col_;
  if (cursor_vcol > max_col()) return cursor_vcol - max_col();
  return 0;
}

bool Viewport::contains(int row, int vcol) const {
  return row >= min_row_ && row <= max_row() && vcol >= min_col_ && vcol <= max_col();
}

void DirtyTracker::record(int first_row, int last_row, int line_delta) {
  if (last_row < first_row) std::swap(first_row, last_row);
  if (!region_.has_rows()) {
    region_.first_row = first_row;
    region_.last_row = last_row;
  } else {
    region_.first_row = std::min(region_.first_row, first_row);
    region_.last_row = std::max(region_.last_row, last_row);
  }
  region_.line_delta += line_delta;
  if (line_delta != 0) region_.lines_shifted = true;
}
