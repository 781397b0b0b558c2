#pragma once
/*
 * Editor
 *
 * Purpose: the event loop. One iteration = one decoded key, synchronous
 *          dispatch into the session, signal servicing, one render pass.
 * Note: terminal, byte source and clipboard are injected so the loop can be
 *       driven headless.
 */
#include <optional>
#include <filesystem>
#include <memory>
#include <string>
#include "session.hpp"
#include "key_decoder.hpp"
#include "renderer.hpp"
#include "clipboard.hpp"

class Editor {
public:
  Editor(ITerminal& term, IByteSource& input, std::unique_ptr<IClipboard> clipboard, const EditorConfig& cfg);

  void open_initial(const std::optional<std::filesystem::path>& file);
  void set_message(std::string m) { session.set_message(std::move(m)); }
  int run();
  void handle_key(const KeyEvent& ev);

  EditorSession& doc() { return session; }
  bool quitting() const { return should_quit; }
  bool prompt_active() const { return prompt != Prompt::None; }
  bool help_visible() const { return showing_help; }

private:
  enum class Prompt { None, SaveAs, Open, ConfirmQuit };

  void render();
  void service_signals();
  void suspend();
  void handle_edit_key(const KeyEvent& ev);
  void handle_control_key(const KeyEvent& ev);
  void handle_prompt_key(const KeyEvent& ev);
  void begin_prompt(Prompt kind, const std::string& label);
  void end_prompt();
  void accept_prompt();
  template <typename Move> void with_selection(bool extend, Move&& m);

  void save();
  bool save_to(const std::filesystem::path& path);
  void open_path(const std::filesystem::path& path);
  void request_open();
  void request_quit();
  void copy_selection();
  void cut_selection();
  void paste();

  ITerminal& term;
  IByteSource& input;
  std::unique_ptr<IClipboard> clipboard;
  EditorSession session;
  KeyDecoder decoder;
  Renderer renderer;
  bool should_quit = false;
  Prompt prompt = Prompt::None;
  std::string prompt_label;
  std::string prompt_input;
  bool quit_after_save = false;
  bool showing_help = false;
};
