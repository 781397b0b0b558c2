#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer supporting line/char splices and file I/O.
 * Feature: safe writes (write .tmp -> fdatasync -> atomic rename).
 * Invariant: never empty; at least one (possibly empty) line always exists.
 */
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>

class TextBuffer {
public:
  TextBuffer();

  int line_count() const;
  const std::string& line(int r) const;
  int line_length(int r) const;

  void init_from_lines(const std::vector<std::string>& lines);
  void init_from_lines(std::vector<std::string>&& lines);

  void insert_line(int row, const std::string& s);
  void erase_line(int row);
  void erase_lines(int start_row, int end_row); // end_row exclusive
  void replace_line(int row, const std::string& s);

  void insert_text(int row, int col, std::string_view text);
  void erase_text(int row, int col, int len);
  void split_line(int row, int col);
  void join_with_next(int row);
  void truncate_line(int row, int col);
  void append_to_line(int row, std::string_view text);

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  void ensure_not_empty();
  int clamp_row(int row) const;
  int clamp_col(int row, int col) const;

  std::vector<std::string> lines_;
};
