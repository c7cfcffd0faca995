#pragma once

#include "ui/IKeySource.hpp"

namespace devmon::ui {

// Helper to check for available input
[[nodiscard]] bool has_input_available(int fd, int timeout_ms);

// Reads at most one byte per poll from a non-blocking descriptor (stdin by default).
class TerminalKeySource : public IKeySource {
public:
  explicit TerminalKeySource(int fd = 0) : fd_(fd) {}
  std::optional<unsigned char> poll_key() override;
private:
  int fd_;
};

} // namespace devmon::ui
