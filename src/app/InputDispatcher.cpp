#include "app/InputDispatcher.hpp"
#include "app/ErrorExtractor.hpp"
#include "app/LogTail.hpp"

#include <cstdio>

namespace devmon::app {

InputDispatcher::InputDispatcher(Options opts,
                                 std::unordered_map<char, devmon::ui::Config::Action> keybinds,
                                 IClipboard& clipboard)
  : opts_(std::move(opts)), keybinds_(std::move(keybinds)), clipboard_(clipboard) {}

bool InputDispatcher::handle_key(unsigned char key, devmon::model::Clock::time_point now,
                                 devmon::model::DashboardState& state) {
  auto it = keybinds_.find(static_cast<char>(key));
  if (it == keybinds_.end()) return false;
  switch (it->second) {
    case devmon::ui::Config::Action::EXTRACT_ERROR:
      extract_error(now, state);
      break;
  }
  return true;
}

void InputDispatcher::extract_error(devmon::model::Clock::time_point now,
                                    devmon::model::DashboardState& state) {
  auto block = extract_last_error(read_full(opts_.log_path));
  std::string text;
  if (!block) {
    text = kStatusNoError;
  } else {
    auto body = block->joined();
    if (clipboard_.copy(body)) {
      text = kStatusCopied;
    } else if (auto saved = save_text_file(opts_.error_dump_path, body)) {
      text = std::string(kStatusSavedTo) + *saved;
    } else {
      text = kStatusNotSaved;
    }
    if (opts_.debug) {
      std::fprintf(stderr, "devmon: extracted %zu-line error block\n", block->lines.size());
    }
  }
  state.status = devmon::model::StatusMessage{std::move(text), now};
}

} // namespace devmon::app
