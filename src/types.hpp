#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs (Position/SelectionRange).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */

struct Position {
  int row = 0;
  int col = 0;
};

inline bool operator==(const Position& a, const Position& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }
inline bool operator<(const Position& a, const Position& b) {
  return a.row < b.row || (a.row == b.row && a.col < b.col);
}

// normalized: (ar,ac) <= (br,bc) in row-major order
struct SelectionRange {
  int ar = 0;
  int ac = 0;
  int br = 0;
  int bc = 0;
};
