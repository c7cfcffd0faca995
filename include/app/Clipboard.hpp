#pragma once
#include <optional>
#include <string>

namespace devmon::app {

class IClipboard {
public:
  virtual ~IClipboard() = default;
  // True when the text reached the clipboard.
  [[nodiscard]] virtual bool copy(const std::string& text) = 0;
};

// Pipes text into a shell command such as "xclip -selection clipboard".
// Success means the command exited with status 0.
class CommandClipboard : public IClipboard {
public:
  explicit CommandClipboard(std::string command) : command_(std::move(command)) {}
  bool copy(const std::string& text) override;
private:
  std::string command_;
};

// Writes text to path, replacing any previous contents.
// Returns the path written, or nullopt on failure.
[[nodiscard]] std::optional<std::string> save_text_file(const std::string& path, const std::string& text);

} // namespace devmon::app
