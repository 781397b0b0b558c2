#include "config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>
#include "file_reader.hpp"

bool EditorConfig::is_word_char(unsigned char c) const {
  if (std::isalnum(c) != 0) return true;
  return word_chars.find(static_cast<char>(c)) != std::string::npos;
}

static bool parse_switch(const std::vector<std::string>& args, bool current, bool& out) {
  if (args.empty()) { out = !current; return true; }
  const std::string& v = args[0];
  if (v == "on" || v == "1" || v == "true") { out = true; return true; }
  if (v == "off" || v == "0" || v == "false") { out = false; return true; }
  return false;
}

static bool parse_positive(const std::vector<std::string>& args, int& out) {
  if (args.empty() || args[0].empty()) return false;
  const std::string& s = args[0];
  if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  if (s.size() > 6) return false;
  out = std::stoi(s);
  return true;
}

// accepts \e, \xHH, \\ and \n in rc values
static std::string unescape(const std::string& s) {
  std::string out;
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '\\' || i + 1 >= s.size()) { out.push_back(s[i]); continue; }
    char c = s[++i];
    if (c == 'e') out.push_back('\x1b');
    else if (c == 'n') out.push_back('\n');
    else if (c == 'x' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
             std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else out.push_back(c);
  }
  return out;
}

void register_config_commands(CommandRegistry& registry, EditorConfig& cfg) {
  registry.register_command("set tabstop", "set tabstop: width must be a number from 1 to " + std::to_string(CARET_MAX_TAB_STOP),
    [&cfg](const std::vector<std::string>& args){
      int w = 0;
      if (!parse_positive(args, w) || w < 1 || w > CARET_MAX_TAB_STOP) return false;
      cfg.tab_stop = w;
      return true;
    });
  registry.register_command("set wrap", "set wrap: use set wrap on|off",
    [&cfg](const std::vector<std::string>& args){
      return parse_switch(args, cfg.wrap_at_edges, cfg.wrap_at_edges);
    });
  registry.register_command("set edgejump", "set edgejump: use set edgejump on|off",
    [&cfg](const std::vector<std::string>& args){
      return parse_switch(args, cfg.edge_jump, cfg.edge_jump);
    });
  registry.register_command("set wordchars", "set wordchars <chars>",
    [&cfg](const std::vector<std::string>& args){
      cfg.word_chars = args.empty() ? std::string() : unescape(args[0]);
      return true;
    });
  registry.register_command("set selectbegin", "set selectbegin: missing sequence",
    [&cfg](const std::vector<std::string>& args){
      if (args.empty()) return false;
      cfg.select_begin = unescape(args[0]);
      return true;
    });
  registry.register_command("set selectend", "set selectend: missing sequence",
    [&cfg](const std::vector<std::string>& args){
      if (args.empty()) return false;
      cfg.select_end = unescape(args[0]);
      return true;
    });
  registry.register_command("set escdelay", "set escdelay: use set escdelay <ms>",
    [&cfg](const std::vector<std::string>& args){
      int ms = 0;
      if (!parse_positive(args, ms)) return false;
      cfg.escape_timeout_ms = ms;
      return true;
    });
  registry.register_command("set dialect", "set dialect: use set dialect generic|console",
    [&cfg](const std::vector<std::string>& args){
      if (args.empty()) return false;
      if (args[0] == "generic") cfg.dialect = Dialect::Generic;
      else if (args[0] == "console") cfg.dialect = Dialect::ConsoleStyle;
      else return false;
      return true;
    });
}

static bool run_command(const CommandRegistry& registry, const std::string& name,
                        const std::vector<std::string>& args, std::string& message) {
  if (registry.execute(name, args)) return true;
  message = registry.usage(name);
  return false;
}

bool execute_config_line(const CommandRegistry& registry, const std::string& line, std::string& message) {
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd == "set" && !args.empty()) {
    std::string name = args[0];
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) {
      value = name.substr(eq + 1);
      name = name.substr(0, eq);
    }
    std::vector<std::string> subargs;
    if (!value.empty()) subargs.push_back(value);
    for (size_t i = 1; i < args.size(); ++i) subargs.push_back(args[i]);
    if (!registry.contains("set " + name)) { message = "unknown option: " + name; return false; }
    return run_command(registry, "set " + name, subargs, message);
  }
  if (!registry.contains(cmd)) { message = "unknown command: " + cmd; return false; }
  return run_command(registry, cmd, args, message);
}

bool load_config_file(const std::filesystem::path& path, const CommandRegistry& registry, std::string& message) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines; std::string msg;
  if (!read_lines(path, lines, msg)) { message = msg; return false; }
  bool ok = true;
  int lineno = 0;
  for (std::string s : lines) {
    ++lineno;
    auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
    size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
    s = (j > i) ? s.substr(i, j - i) : std::string();
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s.erase(s.begin());
    std::string err;
    if (!execute_config_line(registry, s, err)) {
      if (err.empty()) err = "bad value in \"" + s + "\"";
      message = path.filename().string() + ":" + std::to_string(lineno) + ": " + err;
      ok = false;
    }
  }
  return ok;
}

std::filesystem::path default_config_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / CARET_RC_NAME;
}
