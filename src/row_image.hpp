#pragma once
/*
 * RowImage
 *
 * Purpose: one composed screen row: tab-expanded, clipped text plus the
 *          selection span as offsets into that text.
 * Note: backends apply the highlight at these offsets only, so marker-like
 *       bytes inside the document never toggle it.
 */
#include <string>

struct RowImage {
  std::string text;  // tab-expanded, clipped, with the end-of-line cell
  int hl_begin = -1; // selection offsets into text, -1 when none
  int hl_end = -1;

  bool highlighted() const { return hl_begin >= 0 && hl_end > hl_begin; }
};

// text with the begin/end sequences inserted at the highlight offsets
inline std::string splice_markers(const RowImage& img, const std::string& begin, const std::string& end) {
  std::string out = img.text;
  if (!img.highlighted()) return out;
  // end first: inserting it cannot shift the begin offset
  out.insert(static_cast<size_t>(img.hl_end), end);
  out.insert(static_cast<size_t>(img.hl_begin), begin);
  return out;
}
