#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "editor.hpp"
#include "signals.hpp"
#include "config.hpp"
#include <cstdlib>
#include <optional>
#include <filesystem>
#include <unistd.h>

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);

  EditorConfig cfg;
  cfg.dialect = dialect_for_term(std::getenv("TERM"));
  CommandRegistry registry;
  register_config_commands(registry, cfg);
  std::string rc_error;
  bool rc_ok = load_config_file(default_config_path(), registry, rc_error);

  Terminal terminal;
  NcursesTerminal term;
  FdByteSource input(STDIN_FILENO);
  install_signal_handlers();
  Editor ed(term, input, make_system_clipboard(), cfg);
  ed.open_initial(path);
  if (!rc_ok) ed.set_message(rc_error);
  return ed.run();
}
