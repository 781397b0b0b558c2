#pragma once
/*
 * Clipboard
 *
 * Purpose: provide/retrieve text for copy, cut and paste.
 * Backends: LocalClipboard (in-process), CommandClipboard (pipes through an
 *           external program, falls back to its in-process copy on failure).
 */
#include <memory>
#include <string>

class IClipboard {
public:
  virtual ~IClipboard() = default;
  virtual bool provide(const std::string& text) = 0;
  virtual bool retrieve(std::string& out) = 0;
  virtual std::string name() const = 0;
};

class LocalClipboard : public IClipboard {
public:
  bool provide(const std::string& text) override { text_ = text; return true; }
  bool retrieve(std::string& out) override { out = text_; return !text_.empty(); }
  std::string name() const override { return "local"; }
private:
  std::string text_;
};

class CommandClipboard : public IClipboard {
public:
  CommandClipboard(std::string copy_cmd, std::string paste_cmd);
  // false: the external program failed and only the local copy was updated
  bool provide(const std::string& text) override;
  bool retrieve(std::string& out) override;
  std::string name() const override { return copy_cmd_; }
private:
  std::string copy_cmd_;
  std::string paste_cmd_;
  LocalClipboard fallback_;
};

std::unique_ptr<IClipboard> make_system_clipboard();
