#include "app/Clipboard.hpp"

#include <sys/wait.h>
#include <cstdio>
#include <fstream>

namespace devmon::app {

bool CommandClipboard::copy(const std::string& text) {
  if (command_.empty()) return false;
  std::string cmd = command_ + " >/dev/null 2>&1";
  FILE* fp = ::popen(cmd.c_str(), "w");
  if (!fp) return false;
  size_t written = text.empty() ? 0 : std::fwrite(text.data(), 1, text.size(), fp);
  int status = ::pclose(fp);
  if (written != text.size()) return false;
  return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::optional<std::string> save_text_file(const std::string& path, const std::string& text) {
  if (path.empty()) return std::nullopt;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) return std::nullopt;
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.flush();
  if (!out) return std::nullopt;
  return path;
}

} // namespace devmon::app
