#pragma once
#include <optional>

namespace devmon::ui {

// Non-blocking keyboard source.
class IKeySource {
public:
  virtual ~IKeySource() = default;
  // One pending key, or nullopt immediately when none is buffered.
  [[nodiscard]] virtual std::optional<unsigned char> poll_key() = 0;
};

} // namespace devmon::ui
