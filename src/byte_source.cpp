#include "byte_source.hpp"
#include <cerrno>
#include <poll.h>
#include <unistd.h>

ReadStatus FdByteSource::read_byte(unsigned char& out, int timeout_ms) {
  pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  int r = ::poll(&pfd, 1, timeout_ms < 0 ? -1 : timeout_ms);
  if (r < 0) return errno == EINTR ? ReadStatus::Interrupted : ReadStatus::Closed;
  if (r == 0) return ReadStatus::Timeout;
  ssize_t n = ::read(fd_, &out, 1);
  if (n == 1) return ReadStatus::Ok;
  if (n < 0 && errno == EINTR) return ReadStatus::Interrupted;
  if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return ReadStatus::Timeout;
  return ReadStatus::Closed;
}

void ScriptedByteSource::feed(std::string_view bytes) {
  for (char c : bytes) bytes_.push_back(static_cast<unsigned char>(c));
}

ReadStatus ScriptedByteSource::read_byte(unsigned char& out, int timeout_ms) {
  if (bytes_.empty()) return timeout_ms < 0 ? ReadStatus::Closed : ReadStatus::Timeout;
  int b = bytes_.front();
  bytes_.pop_front();
  if (b == -2) return ReadStatus::Interrupted;
  if (b < 0) {
    if (timeout_ms >= 0) return ReadStatus::Timeout;
    return read_byte(out, timeout_ms);
  }
  out = static_cast<unsigned char>(b);
  return ReadStatus::Ok;
}
