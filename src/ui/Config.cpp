#include "ui/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <string>

namespace devmon::ui {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  // Accept both DEVMON_ and devmon_ prefixes
  std::string alt;
  std::string n(name);
  if (n.rfind("DEVMON_", 0) == 0) {
    alt = std::string("devmon_") + n.substr(7);
  } else if (n.rfind("devmon_", 0) == 0) {
    alt = std::string("DEVMON_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

bool env_flag(const char* name, bool defv) {
  const char* v = getenv_compat(name);
  if (!v) return defv;
  if (v[0]=='0'||v[0]=='f'||v[0]=='F'||v[0]=='n'||v[0]=='N') return false;
  return true;
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/devmon/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/devmon/config.toml";
  return {};
}

static std::string default_db_path() {
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/miau/data/miau.db";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const devmon::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

// Resolve a bool from TOML -> env -> compiled default
static bool resolve_bool(const devmon::util::TomlReader& toml, bool have_toml,
                         const char* section, const char* key,
                         const char* env_name, bool def) {
  if (have_toml && toml.has(section, key))
    return toml.get_bool(section, key, def);
  if (env_name)
    return env_flag(env_name, def);
  return def;
}

// Resolve a string from TOML -> env -> compiled default
static std::string resolve_string(const devmon::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

static std::optional<int32_t> parse_pid(const std::string& s) {
  if (s.empty()) return std::nullopt;
  try {
    size_t used = 0;
    long v = std::stol(s, &used);
    if (used != s.size() || v <= 0) return std::nullopt;
    return static_cast<int32_t>(v);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<int32_t> pid_from_env(const std::string& var) {
  if (var.empty()) return std::nullopt;
  const char* v = std::getenv(var.c_str());
  return v ? parse_pid(v) : std::nullopt;
}

static std::vector<devmon::model::ServiceSpec> default_services() {
  return {
    {"wails3 dev",    pid_from_env("WAILS_PID"), "",             "green"},
    {"Go Backend",    std::nullopt,              "miau-desktop", "cyan"},
    {"Vite (Svelte)", std::nullopt,              "vite",         "yellow"},
  };
}

// [service.<id>] sections, in file order
static std::vector<devmon::model::ServiceSpec> load_services(const devmon::util::TomlReader& toml) {
  std::vector<devmon::model::ServiceSpec> out;
  for (const auto& sec : toml.sections_with_prefix("service.")) {
    devmon::model::ServiceSpec s;
    s.name = toml.get_string(sec, "name", sec.substr(8));
    if (toml.has(sec, "pid")) s.pid = parse_pid(toml.get_string(sec, "pid"));
    else if (toml.has(sec, "pid_env")) s.pid = pid_from_env(toml.get_string(sec, "pid_env"));
    s.pattern = toml.get_string(sec, "pattern");
    s.color = toml.get_string(sec, "color");
    out.push_back(std::move(s));
  }
  return out;
}

// Default keybind table
struct KeybindDef { const char* name; char key; Config::Action action; };
static constexpr KeybindDef default_keybinds[] = {
  {"extract_error", 'e', Config::Action::EXTRACT_ERROR},
};

static void populate_keybinds(Config& c, const devmon::util::TomlReader& toml, bool have_toml) {
  for (const auto& kb : default_keybinds) {
    char key = kb.key;
    if (have_toml && toml.has("keybinds", kb.name)) {
      std::string val = toml.get_string("keybinds", kb.name);
      if (!val.empty()) key = val[0];
    }
    c.keybinds[key] = kb.action;
    // Letter keys match in either case
    if (std::isalpha(static_cast<unsigned char>(key))) {
      char alt = std::isupper(static_cast<unsigned char>(key))
                   ? static_cast<char>(std::tolower(static_cast<unsigned char>(key)))
                   : static_cast<char>(std::toupper(static_cast<unsigned char>(key)));
      c.keybinds.try_emplace(alt, kb.action);
    }
  }
}

Config load_config(const std::string& path) {
  Config c{};
  devmon::util::TomlReader toml;
  bool have_toml = !path.empty() && toml.load(path);
  if (have_toml) c.source = path;

  // --- [log] ---
  c.log.path       = resolve_string(toml, have_toml, "log", "path",       "MIAU_LOG", "/tmp/miau-dev.log");
  c.log.tail_lines = resolve_int(toml, have_toml, "log", "tail_lines",    "DEVMON_TAIL_LINES", 18);
  c.log.error_dump = resolve_string(toml, have_toml, "log", "error_dump", "DEVMON_ERROR_DUMP", "/tmp/miau-last-error.txt");
  c.log.tail_lines = std::clamp(c.log.tail_lines, 1, 500);

  // --- [storage] ---
  c.storage.db_path = resolve_string(toml, have_toml, "storage", "db_path", "DEVMON_DB_PATH", default_db_path());

  // --- [clipboard] ---
  c.clipboard.command = resolve_string(toml, have_toml, "clipboard", "command", "DEVMON_CLIPBOARD_CMD", "xclip -selection clipboard");

  // --- [ui] ---
  c.ui.refresh_ms    = resolve_int(toml, have_toml, "ui", "refresh_ms",    "DEVMON_REFRESH_MS", 2000);
  c.ui.status_ttl_ms = resolve_int(toml, have_toml, "ui", "status_ttl_ms", "DEVMON_STATUS_TTL_MS", 5000);
  c.ui.alt_screen    = resolve_bool(toml, have_toml, "ui", "alt_screen",   "DEVMON_ALT_SCREEN", true);
  c.ui.debug         = resolve_bool(toml, have_toml, "ui", "debug",        "DEVMON_DEBUG", false);
  c.ui.title         = resolve_string(toml, have_toml, "ui", "title",      nullptr, "miau DEV MONITOR");
  c.ui.url           = resolve_string(toml, have_toml, "ui", "url",        "DEVMON_URL", "http://localhost:9245");
  c.ui.refresh_ms    = std::clamp(c.ui.refresh_ms, 100, 60000);
  if (c.ui.status_ttl_ms < 0) c.ui.status_ttl_ms = 5000;

  // --- [service.*] ---
  if (have_toml) c.services = load_services(toml);
  if (c.services.empty()) c.services = default_services();

  // --- [keybinds] ---
  populate_keybinds(c, toml, have_toml);

  return c;
}

} // namespace devmon::ui
