#include "renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <optional>
#include <string>
#include <vector>

static void load(EditorSession& s, const std::vector<std::string>& lines) {
  TextBuffer b;
  b.init_from_lines(lines);
  s.replace_document(std::move(b), std::nullopt);
}

static void check_contained(const EditorSession& s, const HeadlessTerminal& term) {
  const Viewport& vp = s.viewport();
  assert(vp.contains(s.cursor().row, s.cursor_vcol()));
  assert(term.cursor_row() == s.cursor().row - vp.min_row());
  assert(term.cursor_col() == s.cursor_vcol() - vp.min_col());
}

static void test_compose_row() {
  RowImage img = compose_row("a\tb", 0, 20, 8, -1, -1);
  assert(img.text == "a       b ");
  assert(img.hl_begin == -1);
  img = compose_row("abcdef", 2, 3, 8, 0, 4);
  assert(img.text == "cde");
  assert(img.hl_begin == 0 && img.hl_end == 2);
  img = compose_row("abc", 10, 5, 8, -1, -1);
  assert(img.text.empty());
  img = compose_row("", 0, 5, 8, 0, 1);
  assert(img.text == " " && img.hl_begin == 0 && img.hl_end == 1);

  RowImage h;
  h.text = "hello";
  h.hl_begin = 1;
  h.hl_end = 3;
  assert(splice_markers(h, "[", "]") == "h[el]lo");
  h.hl_begin = 0;
  h.hl_end = 5;
  assert(splice_markers(h, "<<", ">>") == "<<hello>>");
}

static void test_scroll_and_partial() {
  EditorConfig cfg;
  EditorSession s(cfg);
  std::vector<std::string> lines;
  for (int i = 0; i < 20; ++i) lines.push_back("line" + std::to_string(i));
  load(s, lines);
  HeadlessTerminal term(6, 20);
  Renderer r;

  assert(r.render(term, s) == RenderKind::Full);
  assert(s.viewport().height() == 5 && s.viewport().width() == 20);
  assert(term.plain_row(0) == "line0 ");
  assert(term.plain_row(4) == "line4 ");
  assert(term.row_text(5).find("[no file]") != std::string::npos);
  assert(term.row_text(5).find("row:1 col:1 vcol:1") != std::string::npos);
  check_contained(s, term);

  // nothing changed: only the status bar
  term.reset_counters();
  assert(r.render(term, s) == RenderKind::StatusOnly);
  assert(term.drawn_rows().empty());

  // one row down past the bottom edge: native scroll + the exposed row
  term.reset_counters();
  s.move_cursor(5, 0);
  assert(r.render(term, s) == RenderKind::Scrolled);
  assert(term.scrolls().size() == 1 && term.scrolls()[0].delta == 1);
  assert(term.drawn_rows() == std::vector<int>{4});
  assert(term.plain_row(0) == "line1 ");
  assert(term.plain_row(4) == "line5 ");
  assert(term.clear_count() == 0);
  check_contained(s, term);

  // single-line edit: only that row
  term.reset_counters();
  s.insert_text("X");
  assert(r.render(term, s) == RenderKind::Partial);
  assert(term.drawn_rows() == std::vector<int>{4});
  assert(term.plain_row(4) == "Xline5 ");
  assert(term.row_text(5).find("[+]") != std::string::npos);

  // scrolling back up exposes the top row
  term.reset_counters();
  s.move_cursor(0, 0);
  assert(r.render(term, s) == RenderKind::Scrolled);
  assert(term.scrolls()[0].delta == -1);
  assert(term.drawn_rows() == std::vector<int>{0});
  assert(term.plain_row(0) == "line0 ");
  assert(term.plain_row(1) == "line1 ");
  check_contained(s, term);

  // line count change repaints everything
  term.reset_counters();
  s.insert_newline();
  assert(r.render(term, s) == RenderKind::Full);
  assert(term.clear_count() == 1);
  assert(term.drawn_rows().size() == 5);
  assert(term.plain_row(0) == " ");
  assert(term.plain_row(1) == "line0 ");
  check_contained(s, term);

  // a jump further than the window height repaints everything
  term.reset_counters();
  s.move_cursor(18, 0);
  assert(r.render(term, s) == RenderKind::Full);
  assert(s.viewport().min_row() == 14);
  check_contained(s, term);

  // the end of the document renders blank rows
  s.move_doc_end();
  r.render(term, s);
  assert(s.viewport().max_row() >= 20);
  check_contained(s, term);
}

static void test_pan() {
  EditorConfig cfg;
  EditorSession s(cfg);
  load(s, {std::string(40, 'x') + "END", "\tshort"});
  HeadlessTerminal term(4, 20);
  Renderer r;
  r.render(term, s);
  term.reset_counters();
  s.move_cursor(0, 43);
  assert(r.render(term, s) == RenderKind::Full);
  assert(s.viewport().min_col() == 43 - 19);
  assert(term.plain_row(0) == std::string(16, 'x') + "END ");
  check_contained(s, term);

  // the cursor's visual column, not its logical one, drives the pan
  s.move_cursor(1, 1);
  assert(s.cursor_vcol() == 8);
  r.render(term, s);
  assert(s.viewport().min_col() == 8);
  check_contained(s, term);
}

static void test_selection_markers() {
  EditorConfig cfg;
  cfg.select_begin = "<";
  cfg.select_end = ">";
  EditorSession s(cfg);
  load(s, {"abc", "def", "ghi"});
  HeadlessTerminal term(5, 20);
  Renderer r;
  r.render(term, s);

  s.move_cursor(0, 1);
  s.set_selecting(true);
  s.move_cursor(1, 1);
  s.set_selecting(false);
  term.reset_counters();
  assert(r.render(term, s) == RenderKind::Partial);
  assert(term.row_text(0) == "a<bc >");
  assert(term.row_text(1) == "<d>ef ");
  assert(term.row_text(2) == "ghi ");
  assert(term.plain_row(0) == "abc ");

  // collapsing redraws the rows that were highlighted
  s.move_cursor(2, 0);
  term.reset_counters();
  r.render(term, s);
  assert(term.row_text(0) == "abc ");
  assert(term.row_text(1) == "def ");

  EditorConfig tabs;
  tabs.select_begin = "[";
  tabs.select_end = "]";
  EditorSession t(tabs);
  load(t, {"a\tb"});
  t.move_cursor(0, 1);
  t.set_selecting(true);
  t.move_cursor(0, 3);
  t.set_selecting(false);
  r.render(term, t);
  assert(term.row_text(0) == "a[       b] ");
  assert(term.row_text(4).find("row:1 col:4 vcol:10") != std::string::npos);

  // marker bytes inside the document are plain text
  EditorSession m(cfg);
  load(m, {"x<y>z", "<>"});
  m.move_cursor(0, 0);
  m.set_selecting(true);
  m.move_cursor(0, 1);
  m.set_selecting(false);
  r.render(term, m);
  assert(term.row_text(0) == "<x><y>z ");
  assert(term.plain_row(0) == "x<y>z ");
  assert(term.row_text(1) == "<> ");
  assert(term.plain_row(1) == "<> ");
}

static void test_single_row_terminal() {
  EditorConfig cfg;
  EditorSession s(cfg);
  load(s, {"first", "second"});
  HeadlessTerminal term(1, 20);
  Renderer r;
  r.render(term, s);
  assert(s.viewport().height() == 1);
  assert(term.plain_row(0) == "first ");
  assert(term.status_row() == -1);
  assert(term.cursor_row() == 0 && term.cursor_col() == 0);

  s.move_cursor(1, 3);
  r.render(term, s);
  assert(term.plain_row(0) == "second ");
  assert(term.cursor_row() == 0 && term.cursor_col() == 3);

  // a prompt takes over the row, the text returns once it is gone
  term.reset_counters();
  r.render(term, s, "open: a");
  assert(term.row_text(0) == "open: a");
  assert(term.status_row() == 0);
  assert(term.cursor_col() == 7);
  assert(r.render(term, s) == RenderKind::Full);
  assert(term.plain_row(0) == "second ");
}

static void test_resize_and_prompt() {
  EditorConfig cfg;
  EditorSession s(cfg);
  load(s, {"abc"});
  HeadlessTerminal term(5, 20);
  Renderer r;
  r.render(term, s);
  s.set_message("saved file: x");
  r.render(term, s);
  assert(term.row_text(4).rfind("saved file: x", 0) == 0);

  term.resize(8, 30);
  term.reset_counters();
  assert(r.render(term, s) == RenderKind::Full);
  assert(s.viewport().height() == 7 && s.viewport().width() == 30);

  r.render(term, s, "save as: foo");
  assert(term.row_text(7) == "save as: foo");
  assert(term.cursor_row() == 7 && term.cursor_col() == 12);
}

int main() {
  test_compose_row();
  test_scroll_and_partial();
  test_pan();
  test_selection_markers();
  test_resize_and_prompt();
  test_single_row_terminal();
  return 0;
}
