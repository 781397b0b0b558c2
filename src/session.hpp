#pragma once
/*
 * EditorSession
 *
 * Purpose: one aggregate owning buffer, cursor, selection anchor, viewport
 *          and dirty tracker for the open document.
 * Invariant: 0 <= cursor.row < line_count, 0 <= cursor.col <= line length.
 * Note: the normalized selection is derived from (anchor, cursor) on demand.
 */
#include <optional>
#include <filesystem>
#include <string>
#include <string_view>
#include "types.hpp"
#include "text_buffer.hpp"
#include "viewport.hpp"
#include "config.hpp"

class EditorSession {
public:
  explicit EditorSession(const EditorConfig& cfg);

  const EditorConfig& config() const { return cfg_; }
  TextBuffer& buffer() { return buf_; }
  const TextBuffer& buffer() const { return buf_; }
  Viewport& viewport() { return vp_; }
  const Viewport& viewport() const { return vp_; }
  DirtyTracker& dirty() { return dirty_; }
  const DirtyTracker& dirty() const { return dirty_; }

  void replace_document(TextBuffer&& buf, const std::optional<std::filesystem::path>& path);
  const std::optional<std::filesystem::path>& file_path() const { return file_path_; }
  void set_file_path(const std::filesystem::path& p) { file_path_ = p; }
  bool modified() const { return modified_; }
  void set_modified(bool m) { modified_ = m; }
  std::string display_name() const;

  const std::string& message() const { return message_; }
  void set_message(std::string m) { message_ = std::move(m); }
  void clear_message() { message_.clear(); }

  Position cursor() const { return cur_; }
  Position anchor() const { return anchor_; }
  int cursor_vcol() const;
  bool selecting() const { return selecting_; }
  void set_selecting(bool on) { selecting_ = on; }

  void move_cursor(int row, int col, bool keep_vcol_memory = false);
  void move_vertical(int delta_rows);
  void move_horizontal(int direction, bool by_word);
  void move_line_start();
  void move_line_end();
  void move_doc_start();
  void move_doc_end();
  void select_all();
  void collapse_selection();

  bool selection_exists() const { return anchor_ != cur_; }
  SelectionRange selection_range() const;
  bool selected_text(std::string& out) const;

  bool delete_selection();
  void insert_text(std::string_view text);
  void insert_newline();
  void insert_multiline_text(std::string_view text);
  void backspace(bool by_word);
  void delete_forward();

private:
  void place_cursor(Position p);
  void mark_selection_rows(bool had_selection, const SelectionRange& before);
  void move_char(int direction);
  void move_word(int direction);

  const EditorConfig& cfg_;
  TextBuffer buf_;
  Viewport vp_;
  DirtyTracker dirty_;
  std::optional<std::filesystem::path> file_path_;
  bool modified_ = false;
  std::string message_;

  Position cur_;
  Position anchor_;
  bool selecting_ = false;
  std::optional<int> vcol_memory_; // kept only across consecutive vertical moves
};
