#include "text_buffer.hpp"
#include <algorithm>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "posix_fd.hpp"
#include "file_reader.hpp"

static constexpr size_t kWriteChunkSize = 1 << 16;

TextBuffer::TextBuffer() { ensure_not_empty(); }

int TextBuffer::line_count() const { return static_cast<int>(lines_.size()); }

const std::string& TextBuffer::line(int r) const { return lines_[static_cast<size_t>(clamp_row(r))]; }

int TextBuffer::line_length(int r) const { return static_cast<int>(line(r).size()); }

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

int TextBuffer::clamp_row(int row) const {
  return std::clamp(row, 0, std::max(0, line_count() - 1));
}

int TextBuffer::clamp_col(int row, int col) const {
  return std::clamp(col, 0, static_cast<int>(lines_[static_cast<size_t>(row)].size()));
}

void TextBuffer::init_from_lines(const std::vector<std::string>& src) {
  lines_ = src;
  ensure_not_empty();
}

void TextBuffer::init_from_lines(std::vector<std::string>&& src) {
  lines_ = std::move(src);
  ensure_not_empty();
}

void TextBuffer::insert_line(int row, const std::string& s) {
  size_t pos = static_cast<size_t>(std::clamp(row, 0, line_count()));
  lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(pos), s);
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::erase_lines(int start_row, int end_row) {
  start_row = std::clamp(start_row, 0, line_count());
  end_row = std::clamp(end_row, start_row, line_count());
  lines_.erase(lines_.begin() + start_row, lines_.begin() + end_row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

void TextBuffer::insert_text(int row, int col, std::string_view text) {
  row = clamp_row(row);
  col = clamp_col(row, col);
  lines_[static_cast<size_t>(row)].insert(static_cast<size_t>(col), text);
}

void TextBuffer::erase_text(int row, int col, int len) {
  row = clamp_row(row);
  col = clamp_col(row, col);
  if (len <= 0) return;
  lines_[static_cast<size_t>(row)].erase(static_cast<size_t>(col), static_cast<size_t>(len));
}

void TextBuffer::split_line(int row, int col) {
  row = clamp_row(row);
  col = clamp_col(row, col);
  std::string& s = lines_[static_cast<size_t>(row)];
  std::string tail = s.substr(static_cast<size_t>(col));
  s.resize(static_cast<size_t>(col));
  lines_.insert(lines_.begin() + row + 1, std::move(tail));
}

void TextBuffer::join_with_next(int row) {
  if (row < 0 || row + 1 >= line_count()) return;
  lines_[static_cast<size_t>(row)] += lines_[static_cast<size_t>(row) + 1];
  lines_.erase(lines_.begin() + row + 1);
}

void TextBuffer::truncate_line(int row, int col) {
  row = clamp_row(row);
  lines_[static_cast<size_t>(row)].resize(static_cast<size_t>(clamp_col(row, col)));
}

void TextBuffer::append_to_line(int row, std::string_view text) {
  lines_[static_cast<size_t>(clamp_row(row))].append(text);
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  ok = true;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    msg = std::string("new file: ") + path.string();
    return b;
  }
  std::vector<std::string> ls;
  if (!read_lines(path, ls, msg)) {
    ok = false;
    return b;
  }
  b.init_from_lines(std::move(ls));
  return b;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::error_code ec;
  if (path.has_parent_path() && !std::filesystem::exists(path.parent_path(), ec)) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      msg = std::string("can not create directory: ") + path.parent_path().string();
      return false;
    }
  }
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  const std::string fail = std::string("write file failed: ") + tmp.string();
  std::vector<char> buf(kWriteChunkSize);
  size_t used = 0;
  auto flush_buf = [&]() -> bool {
    bool r = ufd.write_all(buf.data(), used);
    used = 0;
    return r;
  };
  for (const std::string& s : lines_) {
    // every line, including the last, is terminated by a separator
    if (s.size() + 1 > buf.size() - used) {
      if (used > 0 && !flush_buf()) { msg = fail; return false; }
      if (s.size() + 1 > buf.size()) {
        if (!ufd.write_all(s.data(), s.size()) || !ufd.write_all("\n", 1)) { msg = fail; return false; }
        continue;
      }
    }
    std::memcpy(buf.data() + used, s.data(), s.size());
    used += s.size();
    buf[used++] = '\n';
  }
  if (used > 0 && !flush_buf()) { msg = fail; return false; }
  if (!ufd.sync_data()) { msg = fail; return false; }
  ufd.reset();
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::filesystem::remove(tmp, ec);
    msg = std::string("write file failed: ") + path.string();
    return false;
  }
  msg = std::string("saved file: ") + path.string();
  return true;
}
