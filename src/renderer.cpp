#include "renderer.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>
#include "column_map.hpp"

RowImage compose_row(std::string_view line, int min_col, int width, int tab_stop,
                     int sel_begin_vcol, int sel_end_vcol) {
  RowImage img;
  std::string expanded = expand_tabs(line, tab_stop);
  expanded.push_back(' '); // implicit end-of-line cell
  int len = static_cast<int>(expanded.size());
  if (min_col < len && width > 0) {
    img.text = expanded.substr(static_cast<size_t>(min_col), static_cast<size_t>(width));
  }
  if (sel_begin_vcol >= 0 && sel_end_vcol > sel_begin_vcol) {
    int n = static_cast<int>(img.text.size());
    int b = std::clamp(sel_begin_vcol - min_col, 0, n);
    int e = std::clamp(sel_end_vcol - min_col, 0, n);
    if (e > b) { img.hl_begin = b; img.hl_end = e; }
  }
  return img;
}

void Renderer::draw_text_row(ITerminal& term, const EditorSession& s, int screen_row) {
  const Viewport& vp = s.viewport();
  const TextBuffer& buf = s.buffer();
  int doc_row = vp.min_row() + screen_row;
  if (doc_row >= buf.line_count()) {
    term.draw_row(screen_row, RowImage{});
    return;
  }
  const std::string& line = buf.line(doc_row);
  const int tab = s.config().tab_stop;
  int sb = -1, se = -1;
  if (s.selection_exists()) {
    SelectionRange r = s.selection_range();
    if (doc_row >= r.ar && doc_row <= r.br) {
      sb = (doc_row == r.ar) ? visual_column(line, r.ac, tab) : 0;
      // a selection running past this line covers its end-of-line cell
      se = (doc_row == r.br) ? visual_column(line, r.bc, tab) : visual_width(line, tab) + 1;
    }
  }
  RowImage img = compose_row(line, vp.min_col(), vp.width(), tab, sb, se);
  term.draw_row(screen_row, img);
}

void Renderer::draw_status(ITerminal& term, const EditorSession& s, int row, int cols, const std::string& prompt) {
  std::string status;
  if (!prompt.empty()) {
    status = prompt;
  } else {
    Position cur = s.cursor();
    std::ostringstream oss;
    if (!s.message().empty()) oss << s.message();
    else oss << s.display_name() << (s.modified() ? " [+]" : "");
    oss << "  row:" << (cur.row + 1) << " col:" << (cur.col + 1) << " vcol:" << (s.cursor_vcol() + 1);
    status = oss.str();
  }
  if (static_cast<int>(status.size()) > cols) status.resize(static_cast<size_t>(std::max(0, cols)));
  term.draw_status(row, status);
}

RenderKind Renderer::render(ITerminal& term, EditorSession& s, const std::string& prompt) {
  TermSize sz = term.getSize();
  // a single-row terminal has no room for the status bar
  const bool has_status = sz.rows >= 2;
  int text_rows = has_status ? sz.rows - 1 : 1;
  Viewport& vp = s.viewport();
  DirtyTracker& dirty = s.dirty();
  if (vp.height() != text_rows || vp.width() != sz.cols) {
    vp.resize(text_rows, sz.cols);
    dirty.request_full_redraw();
  }
  term.set_highlight_markers(s.config().select_begin, s.config().select_end);
  term.set_cursor_visible(false);

  if (!has_status && !prompt.empty()) {
    // the prompt borrows the only row; the text comes back in full afterwards
    dirty.clear();
    dirty.request_full_redraw();
    draw_status(term, s, 0, sz.cols, prompt);
    term.move_cursor(0, std::min(static_cast<int>(prompt.size()), std::max(0, sz.cols - 1)));
    term.set_cursor_visible(true);
    term.refresh();
    return RenderKind::StatusOnly;
  }

  Position cur = s.cursor();
  int vcol = s.cursor_vcol();
  int scroll = vp.required_scroll(cur.row);
  int pan = vp.required_pan(vcol);
  const int h = vp.height();
  RenderKind kind = RenderKind::StatusOnly;

  if (dirty.needs_full_redraw() || pan != 0 || std::abs(scroll) >= h) {
    vp.scroll_by(scroll);
    vp.pan_by(pan);
    term.clear();
    for (int i = 0; i < h; ++i) draw_text_row(term, s, i);
    kind = RenderKind::Full;
  } else {
    if (scroll != 0) {
      vp.scroll_by(scroll);
      term.scroll_rows(0, h - 1, scroll);
      int first = scroll > 0 ? h - scroll : 0;
      int last = scroll > 0 ? h - 1 : -scroll - 1;
      for (int i = first; i <= last; ++i) draw_text_row(term, s, i);
      kind = RenderKind::Scrolled;
    }
    const DirtyRegion& r = dirty.region();
    if (r.has_rows()) {
      int first = std::max(r.first_row, vp.min_row());
      int last = std::min(r.last_row, vp.max_row());
      for (int row = first; row <= last; ++row) draw_text_row(term, s, row - vp.min_row());
      if (first <= last && kind == RenderKind::StatusOnly) kind = RenderKind::Partial;
    }
  }
  dirty.clear();

  if (has_status) draw_status(term, s, text_rows, sz.cols, prompt);
  if (!prompt.empty()) {
    term.move_cursor(text_rows, std::min(static_cast<int>(prompt.size()), std::max(0, sz.cols - 1)));
  } else {
    term.move_cursor(cur.row - vp.min_row(), vcol - vp.min_col());
  }
  term.set_cursor_visible(true);
  term.refresh();
  return kind;
}

void Renderer::render_overlay(ITerminal& term, EditorSession& s, const std::vector<std::string>& lines,
                              const std::string& footer) {
  TermSize sz = term.getSize();
  const bool has_status = sz.rows >= 2;
  const int text_rows = has_status ? sz.rows - 1 : 1;
  term.set_cursor_visible(false);
  term.clear();
  for (int i = 0; i < text_rows; ++i) {
    RowImage img;
    if (i < static_cast<int>(lines.size()) && sz.cols > 0) {
      img.text = lines[static_cast<size_t>(i)].substr(0, static_cast<size_t>(sz.cols));
    }
    term.draw_row(i, img);
  }
  if (has_status) term.draw_status(text_rows, footer.substr(0, static_cast<size_t>(std::max(0, sz.cols))));
  term.refresh();
  s.dirty().request_full_redraw();
}
