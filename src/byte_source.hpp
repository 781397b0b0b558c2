#pragma once
/*
 * ByteSource
 *
 * Purpose: read-with-deadline primitive the key decoder pulls bytes from.
 * Contract: timeout_ms < 0 blocks until a byte, a signal or end-of-input.
 */
#include <deque>
#include <string_view>

enum class ReadStatus { Ok, Timeout, Interrupted, Closed };

class IByteSource {
public:
  virtual ~IByteSource() = default;
  virtual ReadStatus read_byte(unsigned char& out, int timeout_ms) = 0;
};

// reads a non-owned descriptor (stdin) using poll for the deadline
class FdByteSource : public IByteSource {
public:
  explicit FdByteSource(int fd) : fd_(fd) {}
  ReadStatus read_byte(unsigned char& out, int timeout_ms) override;
private:
  int fd_;
};

// in-memory bytes; an exhausted script reports Closed to blocking reads
// and Timeout to deadline reads
class ScriptedByteSource : public IByteSource {
public:
  ScriptedByteSource() = default;
  explicit ScriptedByteSource(std::string_view bytes) { feed(bytes); }
  void feed(std::string_view bytes);
  void feed_gap() { bytes_.push_back(-1); }
  void feed_signal() { bytes_.push_back(-2); } // one read reports Interrupted
  bool empty() const { return bytes_.empty(); }
  ReadStatus read_byte(unsigned char& out, int timeout_ms) override;
private:
  std::deque<int> bytes_; // -1 marks a pause longer than any deadline, -2 a signal
};
