#pragma once
/*
 * EditorConfig
 *
 * Purpose: startup options (tab stop, edge behaviour, word chars, highlight
 *          sequences, escape timeout, key dialect) and the rc-file loader.
 * Usage: defaults below; ~/.caretrc lines like "set tabstop 4" override them.
 */
#include <string>
#include <filesystem>
#include "cmd_registry.hpp"
#include "key_decoder.hpp"

#define CARET_RC_NAME ".caretrc"
#define CARET_DEFAULT_TAB_STOP 8
#define CARET_MAX_TAB_STOP 64
#define CARET_DEFAULT_ESC_TIMEOUT_MS 25

struct EditorConfig {
  int tab_stop = CARET_DEFAULT_TAB_STOP;
  bool wrap_at_edges = true;
  bool edge_jump = true;
  std::string word_chars = "_"; // in addition to alphanumerics
  std::string select_begin = "\x1b[7m";
  std::string select_end = "\x1b[27m";
  int escape_timeout_ms = CARET_DEFAULT_ESC_TIMEOUT_MS;
  Dialect dialect = Dialect::Generic;

  bool is_word_char(unsigned char c) const;
};

void register_config_commands(CommandRegistry& registry, EditorConfig& cfg);
bool execute_config_line(const CommandRegistry& registry, const std::string& line, std::string& message);
bool load_config_file(const std::filesystem::path& path, const CommandRegistry& registry, std::string& message);
std::filesystem::path default_config_path();
