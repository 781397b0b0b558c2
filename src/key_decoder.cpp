#include "key_decoder.hpp"
#include <cstring>

static constexpr unsigned char ESC = 0x1b;
static constexpr unsigned char DEL = 0x7f;
static constexpr unsigned char BS = 0x08;
static constexpr int kMaxParam = 9999;

Dialect dialect_for_term(const char* term) {
  if (!term) return Dialect::Generic;
  if (std::strcmp(term, "linux") == 0 || std::strncmp(term, "linux-", 6) == 0) return Dialect::ConsoleStyle;
  if (std::strcmp(term, "cygwin") == 0) return Dialect::ConsoleStyle;
  return Dialect::Generic;
}

bool decode_modifier_mask(int value, KeyEvent& ev) {
  if (value < 1 || value > 8) return false;
  int m = value - 1;
  ev.ctrl = ev.alt = ev.shift = false;
  if (m >= 4) { ev.ctrl = true; m -= 4; }
  if (m >= 2) { ev.alt = true; m -= 2; }
  if (m >= 1) { ev.shift = true; }
  return true;
}

std::string describe_key(const KeyEvent& ev) {
  static const char* names[] = {
    "", "Up", "Down", "Left", "Right", "Home", "End", "PageUp", "PageDown",
    "Insert", "Delete", "Backspace", "Tab", "Enter", "Escape"
  };
  std::string s;
  if (ev.ctrl) s += "Ctrl+";
  if (ev.alt) s += "Alt+";
  if (ev.shift) s += "Shift+";
  if (ev.key == Key::Char) s += ev.ch;
  else s += names[static_cast<int>(ev.key)];
  return s;
}

static bool letter_key(unsigned char c, Key& k) {
  switch (c) {
    case 'A': k = Key::Up; return true;
    case 'B': k = Key::Down; return true;
    case 'C': k = Key::Right; return true;
    case 'D': k = Key::Left; return true;
    case 'F': k = Key::End; return true;
    case 'H': k = Key::Home; return true;
    default: return false;
  }
}

static bool numeric_key(int n, Key& k) {
  switch (n) {
    case 1: k = Key::Home; return true;
    case 2: k = Key::Insert; return true;
    case 3: k = Key::Delete; return true;
    case 4: k = Key::End; return true;
    case 5: k = Key::PageUp; return true;
    case 6: k = Key::PageDown; return true;
    default: return false;
  }
}

KeyDecoder::KeyDecoder(Dialect dialect, int escape_timeout_ms)
  : dialect_(dialect), escape_timeout_ms_(escape_timeout_ms) {}

// continuation bytes: a signal mid-sequence is retried, the flags stay
// pending for the loop to service once the key is complete
DecodeStatus KeyDecoder::next(IByteSource& src, unsigned char& b) {
  for (;;) {
    switch (src.read_byte(b, escape_timeout_ms_)) {
      case ReadStatus::Ok: return DecodeStatus::Ok;
      case ReadStatus::Interrupted: continue;
      case ReadStatus::Closed: return DecodeStatus::Closed;
      case ReadStatus::Timeout: return DecodeStatus::Timeout;
    }
  }
}

// drop the rest of a rejected sequence so its tail is not typed as text
DecodeStatus KeyDecoder::fail(IByteSource& src, DecodeStatus st) {
  unsigned char b = 0;
  for (;;) {
    ReadStatus r = src.read_byte(b, 0);
    if (r != ReadStatus::Ok && r != ReadStatus::Interrupted) break;
  }
  return st;
}

KeyEvent KeyDecoder::from_ground(unsigned char b) const {
  KeyEvent ev;
  if (b == DEL) {
    ev.key = Key::Backspace;
    ev.ctrl = (dialect_ == Dialect::ConsoleStyle);
  } else if (b == BS) {
    ev.key = Key::Backspace;
  } else if (b == '\t') {
    ev.key = Key::Tab;
  } else if (b == '\n' || b == '\r') {
    ev.key = Key::Enter;
  } else if (b < 0x20) {
    ev.key = Key::Char;
    ev.ch = static_cast<char>(b + 0x40);
    ev.ctrl = true;
  } else {
    ev.key = Key::Char;
    ev.ch = static_cast<char>(b);
  }
  return ev;
}

DecodeStatus KeyDecoder::decode(IByteSource& src, KeyEvent& out) {
  unsigned char b = 0;
  switch (src.read_byte(b, -1)) {
    case ReadStatus::Ok: break;
    case ReadStatus::Interrupted: return DecodeStatus::Interrupted;
    case ReadStatus::Timeout: return DecodeStatus::Timeout;
    case ReadStatus::Closed: return DecodeStatus::Closed;
  }
  if (b == ESC) return decode_escape(src, out);
  out = from_ground(b);
  return DecodeStatus::Ok;
}

DecodeStatus KeyDecoder::decode_escape(IByteSource& src, KeyEvent& out) {
  unsigned char b = 0;
  DecodeStatus st = next(src, b);
  if (st == DecodeStatus::Timeout) {
    out = KeyEvent{};
    out.key = Key::Escape;
    return DecodeStatus::Ok;
  }
  if (st != DecodeStatus::Ok) return st;
  if (b != '[') return fail(src, DecodeStatus::UnknownSequence);
  return decode_csi(src, out);
}

DecodeStatus KeyDecoder::read_number(IByteSource& src, int first_digit, int& value, unsigned char& stop) {
  value = first_digit;
  for (;;) {
    DecodeStatus st = next(src, stop);
    if (st != DecodeStatus::Ok) return st;
    if (stop < '0' || stop > '9') return DecodeStatus::Ok;
    value = value * 10 + (stop - '0');
    if (value > kMaxParam) return DecodeStatus::UnknownSequence;
  }
}

DecodeStatus KeyDecoder::decode_csi(IByteSource& src, KeyEvent& out) {
  const bool generic = (dialect_ == Dialect::Generic);
  unsigned char b = 0;
  DecodeStatus st = next(src, b);
  if (st != DecodeStatus::Ok) return st;

  KeyEvent ev;
  if (b < '0' || b > '9') {
    if (!letter_key(b, ev.key)) return fail(src, DecodeStatus::UnknownSequence);
    if (!generic && (ev.key == Key::Home || ev.key == Key::End)) return fail(src, DecodeStatus::UnknownSequence);
    out = ev;
    return DecodeStatus::Ok;
  }

  int n = 0;
  unsigned char stop = 0;
  st = read_number(src, b - '0', n, stop);
  if (st == DecodeStatus::UnknownSequence) return fail(src, st);
  if (st != DecodeStatus::Ok) return st;

  if (generic && n == 1) {
    // ESC [ 1 ; <mask> <letter>
    if (stop != ';') return fail(src, DecodeStatus::UnknownSequence);
    unsigned char d = 0;
    if ((st = next(src, d)) != DecodeStatus::Ok) return st;
    if (d < '0' || d > '9') return fail(src, DecodeStatus::UnknownSequence);
    int mask = 0;
    unsigned char fin = 0;
    st = read_number(src, d - '0', mask, fin);
    if (st == DecodeStatus::UnknownSequence) return fail(src, st);
    if (st != DecodeStatus::Ok) return st;
    if (!letter_key(fin, ev.key) || !decode_modifier_mask(mask, ev)) return fail(src, DecodeStatus::UnknownSequence);
    out = ev;
    return DecodeStatus::Ok;
  }

  if (!numeric_key(n, ev.key)) return fail(src, DecodeStatus::UnknownSequence);
  if (generic && (n == 1 || n == 4)) return fail(src, DecodeStatus::UnknownSequence);
  if (stop == '~') {
    out = ev;
    return DecodeStatus::Ok;
  }
  if (stop != ';' || !generic) return fail(src, DecodeStatus::UnknownSequence);

  // ESC [ <n> ; <mask> ~
  unsigned char d = 0;
  if ((st = next(src, d)) != DecodeStatus::Ok) return st;
  if (d < '0' || d > '9') return fail(src, DecodeStatus::UnknownSequence);
  int mask = 0;
  unsigned char fin = 0;
  st = read_number(src, d - '0', mask, fin);
  if (st == DecodeStatus::UnknownSequence) return fail(src, st);
  if (st != DecodeStatus::Ok) return st;
  if (fin != '~' || !decode_modifier_mask(mask, ev)) return fail(src, DecodeStatus::UnknownSequence);
  out = ev;
  return DecodeStatus::Ok;
}
