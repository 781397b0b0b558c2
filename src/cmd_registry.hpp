#pragma once
/*
 * CommandRegistry
 *
 * Purpose: named rc-file commands ("set tabstop 4") with a usage line each.
 * Design: a handler returns false when it rejects its arguments; the caller
 *         reports usage(name) in that case.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&)>;

  void register_command(const std::string& name, std::string usage, Handler h) {
    map_[name] = Entry{std::move(h), std::move(usage)};
  }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  const std::string& usage(const std::string& name) const {
    static const std::string none;
    auto it = map_.find(name);
    return it == map_.end() ? none : it->second.usage;
  }
  bool execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    return it->second.fn(args);
  }

private:
  struct Entry {
    Handler fn;
    std::string usage;
  };
  std::unordered_map<std::string, Entry> map_;
};
