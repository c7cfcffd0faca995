#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include "model/Sample.hpp"

namespace devmon::ui {

struct Config {
  enum class Action { EXTRACT_ERROR };

  struct Log {
    std::string path;
    int tail_lines{18};
    std::string error_dump;
  } log;

  struct Storage {
    std::string db_path;
  } storage;

  struct Clipboard {
    std::string command;
  } clipboard;

  struct UI {
    int refresh_ms{2000};
    int status_ttl_ms{5000};
    bool alt_screen{true};
    bool debug{false};
    std::string title;
    std::string url;
  } ui;

  std::vector<devmon::model::ServiceSpec> services;
  std::unordered_map<char, Action> keybinds;

  // File the values were read from; empty when only env/defaults applied.
  std::string source;
};

// $XDG_CONFIG_HOME/devmon/config.toml or ~/.config/devmon/config.toml
std::string config_file_path();

// Resolve every setting as TOML -> environment -> compiled default.
// A missing or unreadable file is not an error.
Config load_config(const std::string& path);

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

} // namespace devmon::ui
