#include "help.hpp"

const std::vector<std::string>& help_lines() {
  static const std::vector<std::string> lines = {
    "caret key bindings",
    "",
    "  arrows            move (Shift selects, Ctrl moves by word)",
    "  Home / End        line start / end (Ctrl: document)",
    "  PageUp / PageDown move by one screen",
    "  Backspace / Del   delete (Ctrl+Backspace deletes a word)",
    "  Esc               drop the selection",
    "",
    "  Ctrl+A  select all        Ctrl+S  save",
    "  Ctrl+C  copy              Ctrl+O  open",
    "  Ctrl+X  cut               Ctrl+Q  quit",
    "  Ctrl+V  paste             Ctrl+Z  suspend",
    "  Ctrl+L  redraw            Ctrl+G  this help",
  };
  return lines;
}
