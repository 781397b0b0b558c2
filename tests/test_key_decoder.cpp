#include "key_decoder.hpp"
#include <cassert>
#include <string>
#include <string_view>

static DecodeStatus decode_one(Dialect d, std::string_view bytes, KeyEvent& ev) {
  ScriptedByteSource src(bytes);
  KeyDecoder dec(d, 1);
  return dec.decode(src, ev);
}

static KeyEvent expect_key(Dialect d, std::string_view bytes) {
  KeyEvent ev;
  DecodeStatus st = decode_one(d, bytes, ev);
  assert(st == DecodeStatus::Ok);
  return ev;
}

static void expect_status(Dialect d, std::string_view bytes, DecodeStatus want) {
  KeyEvent ev;
  assert(decode_one(d, bytes, ev) == want);
}

static bool mods(const KeyEvent& ev, bool ctrl, bool alt, bool shift) {
  return ev.ctrl == ctrl && ev.alt == alt && ev.shift == shift;
}

static void test_modifier_mask() {
  KeyEvent ev;
  assert(decode_modifier_mask(1, ev) && mods(ev, false, false, false));
  assert(decode_modifier_mask(2, ev) && mods(ev, false, false, true));
  assert(decode_modifier_mask(3, ev) && mods(ev, false, true, false));
  assert(decode_modifier_mask(4, ev) && mods(ev, false, true, true));
  assert(decode_modifier_mask(5, ev) && mods(ev, true, false, false));
  assert(decode_modifier_mask(6, ev) && mods(ev, true, false, true));
  assert(decode_modifier_mask(7, ev) && mods(ev, true, true, false));
  assert(decode_modifier_mask(8, ev) && mods(ev, true, true, true));
  assert(!decode_modifier_mask(0, ev));
  assert(!decode_modifier_mask(9, ev));
}

static void test_generic_dialect() {
  const Dialect g = Dialect::Generic;
  // mask 6: 6-1 = 5 = ctrl(4) + shift(1)
  KeyEvent ev = expect_key(g, "\x1b[1;6C");
  assert(ev.key == Key::Right && mods(ev, true, false, true));
  ev = expect_key(g, "\x1b[1;2A");
  assert(ev.key == Key::Up && mods(ev, false, false, true));
  ev = expect_key(g, "\x1b[1;3B");
  assert(ev.key == Key::Down && mods(ev, false, true, false));
  ev = expect_key(g, "\x1b[1;5D");
  assert(ev.key == Key::Left && mods(ev, true, false, false));
  ev = expect_key(g, "\x1b[1;8H");
  assert(ev.key == Key::Home && mods(ev, true, true, true));
  ev = expect_key(g, "\x1b[1;2F");
  assert(ev.key == Key::End && mods(ev, false, false, true));

  assert(expect_key(g, "\x1b[A").key == Key::Up);
  assert(expect_key(g, "\x1b[B").key == Key::Down);
  assert(expect_key(g, "\x1b[C").key == Key::Right);
  assert(expect_key(g, "\x1b[D").key == Key::Left);
  assert(expect_key(g, "\x1b[H").key == Key::Home);
  assert(expect_key(g, "\x1b[F").key == Key::End);
  assert(expect_key(g, "\x1b[2~").key == Key::Insert);
  assert(expect_key(g, "\x1b[3~").key == Key::Delete);
  assert(expect_key(g, "\x1b[5~").key == Key::PageUp);
  assert(expect_key(g, "\x1b[6~").key == Key::PageDown);
  ev = expect_key(g, "\x1b[5;5~");
  assert(ev.key == Key::PageUp && mods(ev, true, false, false));
  ev = expect_key(g, "\x1b[3;2~");
  assert(ev.key == Key::Delete && mods(ev, false, false, true));

  expect_status(g, "\x1b[1;9C", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1b[1;0C", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1b[1~", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1b[4~", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1b[7~", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1b[3;5X", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1b[Z", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1bx", DecodeStatus::UnknownSequence);
  expect_status(g, "\x1b[", DecodeStatus::Timeout);
  expect_status(g, "\x1b[1;", DecodeStatus::Timeout);

  ev = expect_key(g, "\x7f");
  assert(ev.key == Key::Backspace && !ev.ctrl);
  ev = expect_key(g, "\x08");
  assert(ev.key == Key::Backspace && !ev.ctrl);
}

static void test_console_dialect() {
  const Dialect c = Dialect::ConsoleStyle;
  assert(expect_key(c, "\x1b[1~").key == Key::Home);
  assert(expect_key(c, "\x1b[4~").key == Key::End);
  assert(expect_key(c, "\x1b[2~").key == Key::Insert);
  assert(expect_key(c, "\x1b[3~").key == Key::Delete);
  assert(expect_key(c, "\x1b[5~").key == Key::PageUp);
  assert(expect_key(c, "\x1b[6~").key == Key::PageDown);
  assert(expect_key(c, "\x1b[A").key == Key::Up);
  expect_status(c, "\x1b[H", DecodeStatus::UnknownSequence);
  expect_status(c, "\x1b[F", DecodeStatus::UnknownSequence);
  expect_status(c, "\x1b[3;5~", DecodeStatus::UnknownSequence);
  expect_status(c, "\x1b[1;5C", DecodeStatus::UnknownSequence);

  KeyEvent ev = expect_key(c, "\x7f");
  assert(ev.key == Key::Backspace && ev.ctrl);
  ev = expect_key(c, "\x08");
  assert(ev.key == Key::Backspace && !ev.ctrl);
}

static void test_ground() {
  const Dialect g = Dialect::Generic;
  KeyEvent ev = expect_key(g, "\x11");
  assert(ev.key == Key::Char && ev.ctrl && ev.ch == 'Q');
  assert(is_ctrl_letter(ev, 'Q'));
  ev = expect_key(g, "\x01");
  assert(is_ctrl_letter(ev, 'A'));
  assert(expect_key(g, "\t").key == Key::Tab);
  assert(expect_key(g, "\n").key == Key::Enter);
  assert(expect_key(g, "\r").key == Key::Enter);
  ev = expect_key(g, "a");
  assert(ev.key == Key::Char && ev.ch == 'a' && !ev.ctrl && !ev.alt && !ev.shift);

  // a lone ESC with nothing following is the Escape key
  ev = expect_key(g, "\x1b");
  assert(ev.key == Key::Escape);
}

static void test_stream() {
  ScriptedByteSource src;
  src.feed("\x1b[A\x1b[B");
  src.feed("\x1b[Z");
  src.feed_gap();
  src.feed("q\x1b");
  src.feed_gap();
  src.feed("z");
  KeyDecoder dec(Dialect::Generic, 1);
  KeyEvent ev;
  assert(dec.decode(src, ev) == DecodeStatus::Ok && ev.key == Key::Up);
  assert(dec.decode(src, ev) == DecodeStatus::Ok && ev.key == Key::Down);
  assert(dec.decode(src, ev) == DecodeStatus::UnknownSequence);
  assert(dec.decode(src, ev) == DecodeStatus::Ok && ev.key == Key::Char && ev.ch == 'q');
  assert(dec.decode(src, ev) == DecodeStatus::Ok && ev.key == Key::Escape);
  assert(dec.decode(src, ev) == DecodeStatus::Ok && ev.ch == 'z');
  assert(dec.decode(src, ev) == DecodeStatus::Closed);
}

static void test_signal_mid_sequence() {
  ScriptedByteSource src;
  src.feed_signal();
  src.feed("\x1b");
  src.feed_signal();
  src.feed("[");
  src.feed_signal();
  src.feed("1;5C");
  src.feed("\x1b[Z");
  src.feed_signal();
  src.feed("x");
  KeyDecoder dec(Dialect::Generic, 1);
  KeyEvent ev;
  // a signal before any byte wakes the caller
  assert(dec.decode(src, ev) == DecodeStatus::Interrupted);
  // inside a sequence it is retried and the whole key comes out
  assert(dec.decode(src, ev) == DecodeStatus::Ok);
  assert(ev.key == Key::Right && mods(ev, true, false, false));
  // the drain after a rejected sequence does not stop at a signal
  assert(dec.decode(src, ev) == DecodeStatus::UnknownSequence);
  assert(dec.decode(src, ev) == DecodeStatus::Closed);
  assert(src.empty());
}

static void test_dialect_selection() {
  assert(dialect_for_term(nullptr) == Dialect::Generic);
  assert(dialect_for_term("xterm-256color") == Dialect::Generic);
  assert(dialect_for_term("screen") == Dialect::Generic);
  assert(dialect_for_term("linux") == Dialect::ConsoleStyle);
  assert(dialect_for_term("linux-16color") == Dialect::ConsoleStyle);
  assert(dialect_for_term("cygwin") == Dialect::ConsoleStyle);
  KeyEvent ev;
  ev.key = Key::Right; ev.ctrl = true; ev.shift = true;
  assert(describe_key(ev) == "Ctrl+Shift+Right");
}

int main() {
  test_modifier_mask();
  test_generic_dialect();
  test_console_dialect();
  test_ground();
  test_stream();
  test_signal_mid_sequence();
  test_dialect_selection();
  return 0;
}
