#pragma once
#include <chrono>
#include <string>
#include <unordered_map>
#include "app/Clipboard.hpp"
#include "model/Dashboard.hpp"
#include "ui/Config.hpp"

namespace devmon::app {

inline constexpr const char* kStatusCopied   = "Error copied!";
inline constexpr const char* kStatusSavedTo  = "Error saved to ";
inline constexpr const char* kStatusNotSaved = "Error could not be copied or saved";
inline constexpr const char* kStatusNoError  = "No error found";

// Maps single keypresses to state mutations. Each press re-reads the log and
// re-extracts; nothing is cached between presses.
class InputDispatcher {
public:
  struct Options {
    std::string log_path;
    std::string error_dump_path;
    bool debug{false};
  };

  InputDispatcher(Options opts, std::unordered_map<char, devmon::ui::Config::Action> keybinds,
                  IClipboard& clipboard);

  // Returns true if the key was bound. Unbound keys leave state untouched.
  bool handle_key(unsigned char key, devmon::model::Clock::time_point now,
                  devmon::model::DashboardState& state);

private:
  void extract_error(devmon::model::Clock::time_point now, devmon::model::DashboardState& state);

  Options opts_;
  std::unordered_map<char, devmon::ui::Config::Action> keybinds_;
  IClipboard& clipboard_;
};

} // namespace devmon::app
