#include "ncurses_terminal.hpp"
#include <algorithm>
#include <vector>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    (void)use_default_colors(); // keep the user's background
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

static constexpr attr_t kSgrAll = A_BOLD | A_DIM | A_UNDERLINE | A_BLINK | A_REVERSE;

static void apply_sgr_param(int p, SgrAttrs& out) {
  attr_t on = A_NORMAL, off = A_NORMAL;
  switch (p) {
    case 0: off = kSgrAll; break;
    case 1: on = A_BOLD; break;
    case 2: on = A_DIM; break;
    case 4: on = A_UNDERLINE; break;
    case 5: on = A_BLINK; break;
    case 7: on = A_REVERSE; break;
    case 22: off = A_BOLD | A_DIM; break;
    case 24: off = A_UNDERLINE; break;
    case 25: off = A_BLINK; break;
    case 27: off = A_REVERSE; break;
    default: return; // colours and unknown parameters carry no attribute
  }
  out.on = (out.on & ~off) | on;
  out.off = (out.off & ~on) | off;
}

bool parse_sgr(const std::string& text, SgrAttrs& out) {
  out = SgrAttrs{};
  bool found = false;
  size_t i = 0;
  while ((i = text.find("\x1b[", i)) != std::string::npos) {
    size_t j = i + 2;
    std::vector<int> params;
    int value = 0;
    bool ok = true;
    for (; j < text.size(); ++j) {
      char c = text[j];
      if (c >= '0' && c <= '9') value = std::min(value * 10 + (c - '0'), 9999);
      else if (c == ';') { params.push_back(value); value = 0; }
      else { ok = (c == 'm'); break; }
    }
    if (ok && j < text.size()) {
      params.push_back(value); // "\x1b[m" is a reset
      for (int p : params) apply_sgr_param(p, out);
      found = true;
    }
    i = j;
  }
  return found;
}

void NcursesTerminal::set_highlight_markers(const std::string& begin, const std::string& end) {
  SgrAttrs b, e;
  hl_on_ = (parse_sgr(begin, b) && b.on != A_NORMAL) ? b.on : A_REVERSE;
  hl_off_ = parse_sgr(end, e) ? e.off : hl_on_;
}

void NcursesTerminal::draw_span(const std::string& text, int from, int to) {
  if (to <= from) return;
  addnstr(text.c_str() + from, to - from);
}

void NcursesTerminal::draw_row(int row, const RowImage& img) {
  move(row, 0);
  clrtoeol();
  attrset(A_NORMAL);
  const int n = static_cast<int>(img.text.size());
  if (!img.highlighted()) {
    draw_span(img.text, 0, n);
    return;
  }
  const int b = std::min(img.hl_begin, n);
  const int e = std::min(img.hl_end, n);
  draw_span(img.text, 0, b);
  attron(hl_on_);
  draw_span(img.text, b, e);
  attroff(hl_off_);
  draw_span(img.text, e, n);
  attrset(A_NORMAL);
}

void NcursesTerminal::draw_status(int row, const std::string& text) {
  move(row, 0);
  clrtoeol();
  attron(A_REVERSE);
  addnstr(text.c_str(), static_cast<int>(text.size()));
  int cols = getSize().cols;
  for (int c = static_cast<int>(text.size()); c < cols - 1; ++c) addch(' ');
  attroff(A_REVERSE);
}

void NcursesTerminal::scroll_rows(int top, int bottom, int delta) {
  scrollok(stdscr, TRUE);
  setscrreg(top, bottom);
  scrl(delta);
  setscrreg(0, std::max(0, getSize().rows - 1));
  scrollok(stdscr, FALSE);
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }
