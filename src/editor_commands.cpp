#include "editor.hpp"

void Editor::begin_prompt(Prompt kind, const std::string& label) {
  prompt = kind;
  prompt_label = label;
  prompt_input.clear();
}

void Editor::end_prompt() {
  prompt = Prompt::None;
  prompt_label.clear();
  prompt_input.clear();
}

void Editor::handle_prompt_key(const KeyEvent& ev) {
  if (prompt == Prompt::ConfirmQuit) {
    end_prompt();
    if (ev.key != Key::Char || ev.ctrl) { session.set_message("quit cancelled"); return; }
    if (ev.ch == 'n' || ev.ch == 'N') { should_quit = true; return; }
    if (ev.ch == 'y' || ev.ch == 'Y') {
      if (!session.file_path()) {
        quit_after_save = true;
        begin_prompt(Prompt::SaveAs, "save as: ");
        return;
      }
      if (save_to(*session.file_path())) should_quit = true;
      return;
    }
    session.set_message("quit cancelled");
    return;
  }
  switch (ev.key) {
    case Key::Char:
      if (ev.ctrl) { end_prompt(); quit_after_save = false; session.set_message("cancelled"); }
      else prompt_input.push_back(ev.ch);
      break;
    case Key::Tab: prompt_input.push_back('\t'); break;
    case Key::Backspace: if (!prompt_input.empty()) prompt_input.pop_back(); break;
    case Key::Enter: accept_prompt(); break;
    case Key::Escape:
      end_prompt();
      quit_after_save = false;
      session.set_message("cancelled");
      break;
    default: break;
  }
}

void Editor::accept_prompt() {
  Prompt kind = prompt;
  std::string text = prompt_input;
  end_prompt();
  if (text.empty()) { quit_after_save = false; session.set_message("cancelled"); return; }
  std::filesystem::path p(text);
  if (kind == Prompt::SaveAs) {
    bool ok = save_to(p);
    if (ok && quit_after_save) should_quit = true;
    quit_after_save = false;
  } else if (kind == Prompt::Open) {
    open_path(p);
  }
}

bool Editor::save_to(const std::filesystem::path& path) {
  std::string msg;
  bool ok = session.buffer().write_file(path, msg);
  session.set_message(msg);
  if (ok) {
    session.set_file_path(path);
    session.set_modified(false);
  }
  return ok;
}

void Editor::save() {
  if (session.file_path()) save_to(*session.file_path());
  else begin_prompt(Prompt::SaveAs, "save as: ");
}

void Editor::open_path(const std::filesystem::path& path) {
  std::string msg; bool ok = false;
  TextBuffer b = TextBuffer::from_file(path, msg, ok);
  if (ok) session.replace_document(std::move(b), path);
  session.set_message(msg);
}

void Editor::request_open() {
  if (session.modified()) {
    session.set_message("unsaved changes: save first (Ctrl+S)");
    return;
  }
  begin_prompt(Prompt::Open, "open: ");
}

void Editor::request_quit() {
  if (!session.modified()) { should_quit = true; return; }
  begin_prompt(Prompt::ConfirmQuit, "save changes? (y/n/esc) ");
}

void Editor::copy_selection() {
  std::string text;
  if (!session.selected_text(text)) { session.set_message("nothing selected"); return; }
  if (!clipboard->provide(text)) session.set_message("clipboard: " + clipboard->name() + " failed, kept local copy");
  else session.set_message("copied " + std::to_string(text.size()) + " bytes");
}

void Editor::cut_selection() {
  std::string text;
  if (!session.selected_text(text)) { session.set_message("nothing selected"); return; }
  if (!clipboard->provide(text)) session.set_message("clipboard: " + clipboard->name() + " failed, kept local copy");
  session.delete_selection();
}

void Editor::paste() {
  std::string text;
  if (!clipboard->retrieve(text) || text.empty()) { session.set_message("clipboard is empty"); return; }
  session.insert_multiline_text(text);
}
