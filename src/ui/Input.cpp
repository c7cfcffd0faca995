#include "ui/Input.hpp"
#include <unistd.h>
#include <poll.h>

namespace devmon::ui {

bool has_input_available(int fd, int timeout_ms) {
  struct pollfd pfd{.fd=fd,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 0) to = 0;
  if (to > 1000) to = 1000;
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

std::optional<unsigned char> TerminalKeySource::poll_key() {
  if (!has_input_available(fd_, 0)) return std::nullopt;
  unsigned char c = 0;
  ssize_t n = ::read(fd_, &c, 1);
  // EAGAIN, EOF and hangup all read as "no key this tick"
  if (n != 1) return std::nullopt;
  return c;
}

} // namespace devmon::ui
