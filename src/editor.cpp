#include "editor.hpp"
#include <algorithm>
#include <csignal>
#include <unistd.h>
#include "help.hpp"
#include "signals.hpp"
#include "terminal.hpp"

Editor::Editor(ITerminal& term, IByteSource& input, std::unique_ptr<IClipboard> clipboard, const EditorConfig& cfg)
  : term(term), input(input), clipboard(std::move(clipboard)),
    session(cfg), decoder(cfg.dialect, cfg.escape_timeout_ms) {}

void Editor::open_initial(const std::optional<std::filesystem::path>& file) {
  if (!file) return;
  std::string msg; bool ok = false;
  TextBuffer b = TextBuffer::from_file(*file, msg, ok);
  if (ok) session.replace_document(std::move(b), file);
  session.set_message(msg);
}

int Editor::run() {
  render();
  while (!should_quit) {
    KeyEvent ev;
    DecodeStatus st = decoder.decode(input, ev);
    service_signals();
    if (st == DecodeStatus::Closed) break;
    // UnknownSequence/Timeout are dropped; Interrupted only wakes the loop
    if (st == DecodeStatus::Ok) handle_key(ev);
    if (!should_quit) render();
  }
  return 0;
}

void Editor::render() {
  if (showing_help) {
    renderer.render_overlay(term, session, help_lines(), "press any key to return");
    return;
  }
  std::string p = prompt_active() ? prompt_label + prompt_input : std::string();
  renderer.render(term, session, p);
}

void Editor::service_signals() {
  PendingSignals p = take_pending_signals();
  if (!p.any()) return;
  if (p.terminate) { should_quit = true; return; }
  if (p.suspend) suspend();
  if (p.resumed) Terminal::resume();
  if (p.resize) Terminal::resize_to_tty();
  session.dirty().request_full_redraw();
}

void Editor::suspend() {
  Terminal::suspend();
  ::kill(::getpid(), SIGSTOP);
  Terminal::resume();
  session.dirty().request_full_redraw();
}

void Editor::handle_key(const KeyEvent& ev) {
  if (showing_help) {
    // the dismissing key is consumed
    showing_help = false;
    session.dirty().request_full_redraw();
    return;
  }
  if (prompt_active()) { handle_prompt_key(ev); return; }
  session.clear_message();
  handle_edit_key(ev);
}

template <typename Move>
void Editor::with_selection(bool extend, Move&& m) {
  session.set_selecting(extend);
  m();
  session.set_selecting(false);
}

void Editor::handle_edit_key(const KeyEvent& ev) {
  const int page = std::max(1, session.viewport().height());
  switch (ev.key) {
    case Key::Char:
      if (ev.ctrl) handle_control_key(ev);
      else session.insert_text(std::string(1, ev.ch));
      break;
    case Key::Enter: session.insert_newline(); break;
    case Key::Tab: session.insert_text("\t"); break;
    case Key::Backspace: session.backspace(ev.ctrl); break;
    case Key::Delete: session.delete_forward(); break;
    case Key::Up: with_selection(ev.shift, [&]{ session.move_vertical(-1); }); break;
    case Key::Down: with_selection(ev.shift, [&]{ session.move_vertical(1); }); break;
    case Key::Left: with_selection(ev.shift, [&]{ session.move_horizontal(-1, ev.ctrl); }); break;
    case Key::Right: with_selection(ev.shift, [&]{ session.move_horizontal(1, ev.ctrl); }); break;
    case Key::Home:
      with_selection(ev.shift, [&]{ if (ev.ctrl) session.move_doc_start(); else session.move_line_start(); });
      break;
    case Key::End:
      with_selection(ev.shift, [&]{ if (ev.ctrl) session.move_doc_end(); else session.move_line_end(); });
      break;
    case Key::PageUp: with_selection(ev.shift, [&]{ session.move_vertical(-page); }); break;
    case Key::PageDown: with_selection(ev.shift, [&]{ session.move_vertical(page); }); break;
    case Key::Escape: session.collapse_selection(); break;
    case Key::Insert:
      session.set_message(describe_key(ev) + " is not bound");
      break;
  }
}

void Editor::handle_control_key(const KeyEvent& ev) {
  switch (ev.ch) {
    case 'A': session.select_all(); break;
    case 'C': copy_selection(); break;
    case 'X': cut_selection(); break;
    case 'V': paste(); break;
    case 'S': save(); break;
    case 'O': request_open(); break;
    case 'Q': request_quit(); break;
    case 'Z': suspend(); break;
    case 'L': session.dirty().request_full_redraw(); break;
    case 'G': showing_help = true; break;
    default: session.set_message(describe_key(ev) + " is not bound"); break;
  }
}
