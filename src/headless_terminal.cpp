#include "headless_terminal.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(rows), cols_(cols), screen_(static_cast<size_t>(rows)), plain_(static_cast<size_t>(rows)) {}

void HeadlessTerminal::clear() {
  for (auto& s : screen_) s.clear();
  for (auto& s : plain_) s.clear();
  clear_count_++;
}

void HeadlessTerminal::set_highlight_markers(const std::string& begin, const std::string& end) {
  mark_begin_ = begin;
  mark_end_ = end;
}

void HeadlessTerminal::draw_row(int row, const RowImage& img) {
  if (row < 0 || row >= rows_) return;
  screen_[static_cast<size_t>(row)] = splice_markers(img, mark_begin_, mark_end_);
  plain_[static_cast<size_t>(row)] = img.text;
  drawn_rows_.push_back(row);
}

void HeadlessTerminal::draw_status(int row, const std::string& text) {
  if (row < 0 || row >= rows_) return;
  screen_[static_cast<size_t>(row)] = text.substr(0, static_cast<size_t>(cols_));
  plain_[static_cast<size_t>(row)] = screen_[static_cast<size_t>(row)];
  status_row_ = row;
}

static void shift_region(std::vector<std::string>& rows, int top, int bottom, int delta) {
  std::vector<std::string> region(rows.begin() + top, rows.begin() + bottom + 1);
  int n = static_cast<int>(region.size());
  for (int i = 0; i < n; ++i) {
    int src = i + delta;
    rows[static_cast<size_t>(top + i)] = (src >= 0 && src < n) ? region[static_cast<size_t>(src)] : std::string();
  }
}

void HeadlessTerminal::scroll_rows(int top, int bottom, int delta) {
  scrolls_.push_back({top, bottom, delta});
  shift_region(screen_, top, bottom, delta);
  shift_region(plain_, top, bottom, delta);
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  screen_.assign(static_cast<size_t>(rows), std::string());
  plain_.assign(static_cast<size_t>(rows), std::string());
}

void HeadlessTerminal::reset_counters() {
  drawn_rows_.clear();
  scrolls_.clear();
  clear_count_ = 0;
  refresh_count_ = 0;
  status_row_ = -1;
}
