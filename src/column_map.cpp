#include "column_map.hpp"
#include <algorithm>

static int next_stop(int vcol, int tab_stop) {
  if (tab_stop < 1) tab_stop = 1;
  return (vcol / tab_stop + 1) * tab_stop;
}

int visual_column(std::string_view line, int char_col, int tab_stop) {
  int n = std::min(std::max(0, char_col), static_cast<int>(line.size()));
  int v = 0;
  for (int i = 0; i < n; ++i) {
    if (line[i] == '\t') v = next_stop(v, tab_stop);
    else v++;
  }
  return v;
}

int logical_column(std::string_view line, int visual_target, int tab_stop) {
  int v = 0;
  int n = static_cast<int>(line.size());
  for (int i = 0; i < n; ++i) {
    if (v >= visual_target) return i;
    int next = (line[i] == '\t') ? next_stop(v, tab_stop) : v + 1;
    // target strictly inside this character's expansion: stay before it
    if (next > visual_target) return i;
    v = next;
  }
  return n;
}

int visual_width(std::string_view line, int tab_stop) {
  return visual_column(line, static_cast<int>(line.size()), tab_stop);
}

std::string expand_tabs(std::string_view line, int tab_stop) {
  std::string out;
  out.reserve(line.size());
  for (char c : line) {
    if (c == '\t') {
      int stop = next_stop(static_cast<int>(out.size()), tab_stop);
      out.append(static_cast<size_t>(stop) - out.size(), ' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}
