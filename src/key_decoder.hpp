#pragma once
/*
 * KeyDecoder
 *
 * Purpose: turn a raw terminal byte stream into one KeyEvent per call.
 * State: Ground -> EscapeSeen -> CSI -> final; no partial event is ever delivered.
 * Dialect: chosen once at startup, decides final letters, modifier masks
 *          and the Backspace/Ctrl+Backspace split.
 */
#include <string>
#include "byte_source.hpp"

enum class Key {
  Char, Up, Down, Left, Right, Home, End, PageUp, PageDown,
  Insert, Delete, Backspace, Tab, Enter, Escape
};

// Char with ctrl set is a control letter: ch holds the upper-case letter (byte + 0x40).
struct KeyEvent {
  Key key = Key::Char;
  char ch = 0;
  bool ctrl = false;
  bool alt = false;
  bool shift = false;
};

inline bool is_ctrl_letter(const KeyEvent& ev, char letter) {
  return ev.key == Key::Char && ev.ctrl && ev.ch == letter;
}

enum class Dialect { Generic, ConsoleStyle };

enum class DecodeStatus { Ok, UnknownSequence, Timeout, Interrupted, Closed };

Dialect dialect_for_term(const char* term);
bool decode_modifier_mask(int value, KeyEvent& ev);
std::string describe_key(const KeyEvent& ev);

class KeyDecoder {
public:
  explicit KeyDecoder(Dialect dialect, int escape_timeout_ms = 25);

  DecodeStatus decode(IByteSource& src, KeyEvent& out);

private:
  DecodeStatus decode_escape(IByteSource& src, KeyEvent& out);
  DecodeStatus decode_csi(IByteSource& src, KeyEvent& out);
  DecodeStatus read_number(IByteSource& src, int first_digit, int& value, unsigned char& stop);
  DecodeStatus next(IByteSource& src, unsigned char& b);
  DecodeStatus fail(IByteSource& src, DecodeStatus st);
  KeyEvent from_ground(unsigned char b) const;

  Dialect dialect_;
  int escape_timeout_ms_;
};
