#include "session.hpp"
#include <algorithm>
#include "column_map.hpp"

EditorSession::EditorSession(const EditorConfig& cfg) : cfg_(cfg) {}

void EditorSession::replace_document(TextBuffer&& buf, const std::optional<std::filesystem::path>& path) {
  buf_ = std::move(buf);
  file_path_ = path;
  modified_ = false;
  cur_ = anchor_ = Position{};
  selecting_ = false;
  vcol_memory_.reset();
  vp_.reset_origin();
  dirty_.request_full_redraw();
}

std::string EditorSession::display_name() const {
  return file_path_ ? file_path_->string() : std::string("[no file]");
}

int EditorSession::cursor_vcol() const {
  return visual_column(buf_.line(cur_.row), cur_.col, cfg_.tab_stop);
}

SelectionRange EditorSession::selection_range() const {
  Position a = anchor_, b = cur_;
  if (b < a) std::swap(a, b);
  return SelectionRange{a.row, a.col, b.row, b.col};
}

void EditorSession::mark_selection_rows(bool had_selection, const SelectionRange& before) {
  bool has_selection = selection_exists();
  if (!had_selection && !has_selection) return;
  SelectionRange after = selection_range();
  int first = has_selection ? after.ar : before.ar;
  int last = has_selection ? after.br : before.br;
  if (had_selection) {
    first = std::min(first, before.ar);
    last = std::max(last, before.br);
  }
  dirty_.record(first, last);
}

void EditorSession::move_cursor(int row, int col, bool keep_vcol_memory) {
  bool had = selection_exists();
  SelectionRange before = selection_range();
  cur_.row = std::clamp(row, 0, buf_.line_count() - 1);
  cur_.col = std::clamp(col, 0, buf_.line_length(cur_.row));
  if (!selecting_) anchor_ = cur_;
  if (!keep_vcol_memory) vcol_memory_.reset();
  mark_selection_rows(had, before);
}

void EditorSession::place_cursor(Position p) {
  cur_ = p;
  anchor_ = p;
  vcol_memory_.reset();
}

void EditorSession::collapse_selection() {
  bool saved = selecting_;
  selecting_ = false;
  move_cursor(cur_.row, cur_.col);
  selecting_ = saved;
}

void EditorSession::move_vertical(int delta_rows) {
  if (selection_exists() && !selecting_) {
    SelectionRange r = selection_range();
    if (delta_rows < 0) move_cursor(r.ar, r.ac);
    else move_cursor(r.br, r.bc);
    return;
  }
  if (delta_rows == 0) return;
  const int last = buf_.line_count() - 1;
  if (delta_rows < 0 && cur_.row == 0) {
    if (cfg_.edge_jump) move_cursor(0, 0);
    return;
  }
  if (delta_rows > 0 && cur_.row == last) {
    if (cfg_.edge_jump) move_cursor(last, buf_.line_length(last));
    return;
  }
  if (!vcol_memory_) vcol_memory_ = cursor_vcol();
  int target = std::clamp(cur_.row + delta_rows, 0, last);
  int col = logical_column(buf_.line(target), *vcol_memory_, cfg_.tab_stop);
  move_cursor(target, col, true);
}

void EditorSession::move_horizontal(int direction, bool by_word) {
  if (selection_exists() && !selecting_) {
    SelectionRange r = selection_range();
    if (direction < 0) move_cursor(r.ar, r.ac);
    else move_cursor(r.br, r.bc);
    return;
  }
  if (by_word) move_word(direction);
  else move_char(direction);
}

void EditorSession::move_char(int direction) {
  const int len = buf_.line_length(cur_.row);
  if (direction < 0) {
    if (cur_.col > 0) move_cursor(cur_.row, cur_.col - 1);
    else if (cfg_.wrap_at_edges && cur_.row > 0) move_cursor(cur_.row - 1, buf_.line_length(cur_.row - 1));
    else move_cursor(cur_.row, cur_.col);
  } else {
    if (cur_.col < len) move_cursor(cur_.row, cur_.col + 1);
    else if (cfg_.wrap_at_edges && cur_.row + 1 < buf_.line_count()) move_cursor(cur_.row + 1, 0);
    else move_cursor(cur_.row, cur_.col);
  }
}

void EditorSession::move_word(int direction) {
  const std::string& s = buf_.line(cur_.row);
  const int n = static_cast<int>(s.size());
  int c = cur_.col;
  auto is_word = [this](char ch){ return cfg_.is_word_char(static_cast<unsigned char>(ch)); };
  if (direction < 0) {
    if (c == 0) { move_char(-1); return; }
    while (c > 0 && !is_word(s[c - 1])) c--;
    while (c > 0 && is_word(s[c - 1])) c--;
  } else {
    if (c >= n) { move_char(1); return; }
    while (c < n && !is_word(s[c])) c++;
    while (c < n && is_word(s[c])) c++;
  }
  move_cursor(cur_.row, c);
}

void EditorSession::move_line_start() { move_cursor(cur_.row, 0); }
void EditorSession::move_line_end() { move_cursor(cur_.row, buf_.line_length(cur_.row)); }
void EditorSession::move_doc_start() { move_cursor(0, 0); }
void EditorSession::move_doc_end() {
  int last = buf_.line_count() - 1;
  move_cursor(last, buf_.line_length(last));
}

void EditorSession::select_all() {
  bool saved = selecting_;
  selecting_ = false;
  move_cursor(0, 0);
  selecting_ = true;
  move_doc_end();
  selecting_ = saved;
}

bool EditorSession::selected_text(std::string& out) const {
  if (!selection_exists()) return false;
  SelectionRange r = selection_range();
  out.clear();
  for (int row = r.ar; row <= r.br; ++row) {
    const std::string& s = buf_.line(row);
    int c0 = (row == r.ar) ? r.ac : 0;
    int c1 = (row == r.br) ? r.bc : static_cast<int>(s.size());
    out.append(s, static_cast<size_t>(c0), static_cast<size_t>(c1 - c0));
    if (row != r.br) out.push_back('\n');
  }
  return true;
}

bool EditorSession::delete_selection() {
  if (!selection_exists()) return false;
  SelectionRange r = selection_range();
  if (r.ar == r.br) {
    buf_.erase_text(r.ar, r.ac, r.bc - r.ac);
  } else {
    std::string tail = buf_.line(r.br).substr(static_cast<size_t>(r.bc));
    buf_.truncate_line(r.ar, r.ac);
    buf_.append_to_line(r.ar, tail);
    buf_.erase_lines(r.ar + 1, r.br + 1);
  }
  place_cursor(Position{r.ar, r.ac});
  modified_ = true;
  dirty_.record(r.ar, r.ar, -(r.br - r.ar));
  return true;
}

void EditorSession::insert_text(std::string_view text) {
  delete_selection();
  if (text.empty()) return;
  buf_.insert_text(cur_.row, cur_.col, text);
  place_cursor(Position{cur_.row, cur_.col + static_cast<int>(text.size())});
  modified_ = true;
  dirty_.record(cur_.row, cur_.row);
}

void EditorSession::insert_newline() {
  delete_selection();
  buf_.split_line(cur_.row, cur_.col);
  place_cursor(Position{cur_.row + 1, 0});
  modified_ = true;
  dirty_.record(cur_.row - 1, cur_.row, 1);
}

void EditorSession::insert_multiline_text(std::string_view text) {
  delete_selection();
  size_t start = 0;
  for (;;) {
    size_t nl = text.find('\n', start);
    std::string_view seg = text.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);
    if (!seg.empty() && seg.back() == '\r') seg.remove_suffix(1);
    insert_text(seg);
    if (nl == std::string_view::npos) break;
    insert_newline();
    start = nl + 1;
  }
}

void EditorSession::backspace(bool by_word) {
  if (delete_selection()) return;
  // at column 0 a word delete joins lines like a plain one, whatever the wrap setting
  if (by_word && cur_.col > 0) {
    bool saved = selecting_;
    selecting_ = true;
    move_word(-1);
    selecting_ = saved;
    delete_selection();
    return;
  }
  if (cur_.col > 0) {
    buf_.erase_text(cur_.row, cur_.col - 1, 1);
    place_cursor(Position{cur_.row, cur_.col - 1});
    modified_ = true;
    dirty_.record(cur_.row, cur_.row);
  } else if (cur_.row > 0) {
    int prev_len = buf_.line_length(cur_.row - 1);
    buf_.join_with_next(cur_.row - 1);
    place_cursor(Position{cur_.row - 1, prev_len});
    modified_ = true;
    dirty_.record(cur_.row, cur_.row, -1);
  }
}

void EditorSession::delete_forward() {
  if (delete_selection()) return;
  if (cur_.col < buf_.line_length(cur_.row)) {
    buf_.erase_text(cur_.row, cur_.col, 1);
    place_cursor(cur_);
    modified_ = true;
    dirty_.record(cur_.row, cur_.row);
  } else if (cur_.row + 1 < buf_.line_count()) {
    buf_.join_with_next(cur_.row);
    place_cursor(cur_);
    modified_ = true;
    dirty_.record(cur_.row, cur_.row, -1);
  }
}
